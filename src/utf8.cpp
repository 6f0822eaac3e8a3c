#include "anyexpr/utf8.hpp"

namespace anyexpr::utf8 {

std::size_t sequenceLength(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    }
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    // Продолжающий или некорректный байт считается отдельным символом
    return 1;
}

std::size_t nextBoundary(std::string_view text, std::size_t position) {
    if (position >= text.size()) {
        return position + 1;
    }
    std::size_t next = position + sequenceLength(static_cast<unsigned char>(text[position]));
    return next > text.size() ? text.size() : next;
}

std::size_t codePointCount(std::string_view text) {
    std::size_t count = 0;
    for (std::size_t position = 0; position < text.size(); position = nextBoundary(text, position)) {
        ++count;
    }
    return count;
}

} // namespace anyexpr::utf8
