#include "anyexpr/subscript.hpp"

#include <cmath>

#include "anyexpr/coercion.hpp"
#include "anyexpr/error.hpp"
#include "anyexpr/utf8.hpp"

namespace anyexpr {

namespace {

// Закрытый интервал позиций [lower, upper]; пустой, если upper < lower
struct Bounds {
    std::int64_t lower;
    std::int64_t upper;
};

// Проверяет целочисленный диапазон для последовательности длины count.
// outOfBounds вызывается с первой нарушенной границей.
template <typename OutOfBounds>
Bounds resolveBounds(const IntRange& range, std::int64_t count, OutOfBounds outOfBounds) {
    switch (range.kind) {
    case RangeKind::Closed:
    case RangeKind::HalfOpen: {
        const std::int64_t lower = range.lower;
        const std::int64_t upper = range.kind == RangeKind::Closed ? range.upper : range.upper - 1;
        if (upper < lower - 1 || (upper == lower - 1 && range.kind == RangeKind::Closed)) {
            throw Error::invalidRange(range.lower, range.upper);
        }
        if (upper == lower - 1) {
            // Пустой полуоткрытый диапазон допустим в любой позиции от 0 до count
            if (lower < 0 || lower > count) {
                outOfBounds(lower);
            }
            return {lower, upper};
        }
        if (lower < 0 || lower >= count) {
            outOfBounds(lower);
        }
        if (upper >= count) {
            outOfBounds(upper);
        }
        return {lower, upper};
    }
    case RangeKind::From:
        if (range.lower >= count || range.lower < 0) {
            outOfBounds(range.lower);
        }
        return {range.lower, count - 1};
    case RangeKind::UpTo:
        if (range.upper <= 0) {
            outOfBounds(range.upper);
        }
        if (range.upper > count) {
            outOfBounds(range.upper - 1);
        }
        return {0, range.upper - 1};
    case RangeKind::Through:
        if (range.upper < 0 || range.upper >= count) {
            outOfBounds(range.upper);
        }
        return {0, range.upper};
    }
    return {0, -1};
}

Value subscriptElements(const Symbol& symbol, const Value& container, const std::vector<Value>& elements,
                        const Value& index) {
    const auto count = static_cast<std::int64_t>(elements.size());
    if (auto range = index.getIf<IntRange>()) {
        Bounds bounds = resolveBounds(*range, count, [&symbol](std::int64_t bound) {
            throw Error::arrayBounds(symbol, static_cast<double>(bound));
        });
        return Value(ArraySlice{std::vector<Value>(elements.begin() + bounds.lower,
                                                   elements.begin() + bounds.upper + 1)});
    }
    if (index.is<double>() || index.is<std::int64_t>() || index.is<std::uint64_t>()) {
        auto offset = integerValue(index);
        if (!offset) {
            throw Error::arrayBounds(symbol, *numericValue(index));
        }
        if (*offset < 0 || *offset >= count) {
            throw Error::arrayBounds(symbol, static_cast<double>(*offset));
        }
        return elements[static_cast<std::size_t>(*offset)];
    }
    throw Error::typeMismatch(symbol, {container, index});
}

// Строка или подстрока, над которой выполняется индексация
class TextWindow {
public:
    explicit TextWindow(Substring text) : text(std::move(text)) {}

    const Substring& substring() const { return text; }
    std::size_t start() const { return text.startIndex().offset; }
    std::size_t end() const { return text.endIndex().offset; }

    std::int64_t count() const { return static_cast<std::int64_t>(utf8::codePointCount(text.view())); }

    // Позиция символа с номером offset от начала окна
    std::size_t position(std::int64_t offset) const {
        std::size_t result = start();
        for (std::int64_t i = 0; i < offset; ++i) {
            result = utf8::nextBoundary(text.base(), result);
        }
        return result;
    }

    Character characterAt(std::size_t position) const {
        const std::size_t next = utf8::nextBoundary(text.base(), position);
        return Character{text.base().substr(position, next - position)};
    }

    Substring slice(std::size_t from, std::size_t to) const {
        return Substring(text.sharedBase(), StringIndex{from}, StringIndex{to});
    }

    [[noreturn]] void outOfBounds(std::int64_t offset) const { throw Error::stringBounds(text.str(), offset); }
    [[noreturn]] void outOfBounds(std::size_t index) const { throw Error::stringBounds(text, StringIndex{index}); }

private:
    Substring text;
};

Value subscriptIndexRange(const TextWindow& window, IndexRange range) {
    const std::size_t start = window.start();
    const std::size_t end = window.end();
    switch (range.kind) {
    case RangeKind::Through:
        if (range.upper.offset < start) {
            window.outOfBounds(range.upper.offset);
        }
        range = IndexRange::closed(StringIndex{start}, range.upper);
        break;
    case RangeKind::UpTo:
        if (range.upper.offset <= start) {
            window.outOfBounds(range.upper.offset);
        }
        range = IndexRange::halfOpen(StringIndex{start}, range.upper);
        break;
    case RangeKind::From:
        if (range.lower.offset >= end) {
            window.outOfBounds(range.lower.offset);
        }
        range = IndexRange::halfOpen(range.lower, StringIndex{end});
        break;
    default:
        break;
    }

    const std::size_t lower = range.lower.offset;
    const std::size_t upper = range.upper.offset;
    if (upper < lower) {
        throw Error::invalidRange(range.lower, range.upper);
    }
    if (range.kind == RangeKind::HalfOpen && upper == lower) {
        if (lower < start || lower > end) {
            window.outOfBounds(lower);
        }
        return Value(window.slice(lower, lower));
    }
    if (lower < start || lower >= end) {
        window.outOfBounds(lower);
    }
    if (range.kind == RangeKind::Closed) {
        if (upper >= end) {
            window.outOfBounds(upper);
        }
        return Value(window.slice(lower, utf8::nextBoundary(window.substring().base(), upper)));
    }
    if (upper <= start || upper > end) {
        window.outOfBounds(upper);
    }
    return Value(window.slice(lower, upper));
}

Value subscriptText(const Symbol& symbol, const Value& container, const TextWindow& window, const Value& index) {
    if (auto position = index.getIf<StringIndex>()) {
        if (position->offset < window.start() || position->offset >= window.end()) {
            window.outOfBounds(position->offset);
        }
        return Value(window.characterAt(position->offset));
    }
    if (auto range = index.getIf<IndexRange>()) {
        return subscriptIndexRange(window, *range);
    }
    if (auto range = index.getIf<IntRange>()) {
        Bounds bounds = resolveBounds(*range, window.count(), [&window](std::int64_t bound) {
            window.outOfBounds(bound);
        });
        const std::size_t from = window.position(bounds.lower);
        if (bounds.upper < bounds.lower) {
            return Value(window.slice(from, from));
        }
        const std::size_t to = utf8::nextBoundary(window.substring().base(), window.position(bounds.upper));
        return Value(window.slice(from, to));
    }
    if (index.is<double>() || index.is<std::int64_t>() || index.is<std::uint64_t>()) {
        auto offset = integerValue(index);
        if (!offset) {
            throw Error::typeMismatch(symbol, {container, index});
        }
        if (*offset < 0 || *offset >= window.count()) {
            window.outOfBounds(*offset);
        }
        return Value(window.characterAt(window.position(*offset)));
    }
    throw Error::typeMismatch(symbol, {container, index});
}

bool isSubscriptable(const Value& value) {
    return value.elements() || value.dictionary() || value.is<std::string>() || value.is<Substring>();
}

} // namespace

Value subscript(const Symbol& symbol, const Value& container, const Value& index) {
    if (auto elements = container.elements()) {
        return subscriptElements(symbol, container, *elements, index);
    }
    if (auto text = container.getIf<std::string>()) {
        return subscriptText(symbol, container, TextWindow(Substring(*text)), index);
    }
    if (auto text = container.getIf<Substring>()) {
        return subscriptText(symbol, container, TextWindow(*text), index);
    }
    if (auto dictionary = container.dictionary()) {
        auto key = dictionary->normalizeKey(index);
        if (!key) {
            throw Error::typeMismatch(symbol, {container, index});
        }
        return dictionary->lookup(*key);
    }
    throw Error::illegalSubscript(symbol, container);
}

SymbolEvaluator subscriptEvaluator(const Symbol& symbol, const Value& container) {
    if (!isSubscriptable(container)) {
        throw Error::illegalSubscript(symbol, container);
    }
    return [symbol, container](const std::vector<Value>& args) {
        if (args.size() != 1) {
            throw Error::arityMismatch(symbol);
        }
        return subscript(symbol, container, args[0]);
    };
}

} // namespace anyexpr
