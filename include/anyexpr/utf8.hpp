#pragma once

#include <cstddef>
#include <string_view>

namespace anyexpr::utf8 {

// Длина последовательности UTF-8, начинающейся с байта lead
std::size_t sequenceLength(unsigned char lead);

// Позиция следующего символа после position; за концом строки каждый байт считается символом
std::size_t nextBoundary(std::string_view text, std::size_t position);

// Количество кодовых точек в строке
std::size_t codePointCount(std::string_view text);

} // namespace anyexpr::utf8
