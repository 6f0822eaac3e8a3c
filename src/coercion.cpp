#include "anyexpr/coercion.hpp"

#include <cmath>

#include "anyexpr/error.hpp"

namespace anyexpr {

namespace {

// Категории значений, которые можно сравнивать между собой
enum class Category { Nil, Number, Boolean, Text, Character, Index, IntRange, IndexRange, Sequence, Dictionary, Tuple,
                      Object };

Category categoryOf(const Value& value) {
    if (value.isNil()) {
        return Category::Nil;
    }
    if (value.is<double>() || value.is<std::int64_t>() || value.is<std::uint64_t>()) {
        return Category::Number;
    }
    if (value.is<bool>()) {
        return Category::Boolean;
    }
    if (value.is<std::string>() || value.is<Substring>()) {
        return Category::Text;
    }
    if (value.is<anyexpr::Character>()) {
        return Category::Character;
    }
    if (value.is<StringIndex>()) {
        return Category::Index;
    }
    if (value.is<anyexpr::IntRange>()) {
        return Category::IntRange;
    }
    if (value.is<anyexpr::IndexRange>()) {
        return Category::IndexRange;
    }
    if (value.elements()) {
        return Category::Sequence;
    }
    if (value.dictionary()) {
        return Category::Dictionary;
    }
    if (value.tuple()) {
        return Category::Tuple;
    }
    return Category::Object;
}

bool isNumber(const Value& value) {
    return categoryOf(value) == Category::Number;
}

// Одиночное значение (не контейнер)
bool isScalar(Category category) {
    return category != Category::Sequence && category != Category::Dictionary && category != Category::Tuple;
}

} // namespace

std::optional<double> numericValue(const Value& value) {
    if (auto number = value.getIf<double>()) {
        return *number;
    }
    if (auto number = value.getIf<std::int64_t>()) {
        return static_cast<double>(*number);
    }
    if (auto number = value.getIf<std::uint64_t>()) {
        return static_cast<double>(*number);
    }
    if (auto flag = value.getIf<bool>()) {
        return *flag ? 1.0 : 0.0;
    }
    return std::nullopt;
}

std::optional<std::int64_t> integerValue(const Value& value) {
    if (auto number = value.getIf<std::int64_t>()) {
        return *number;
    }
    if (auto number = value.getIf<std::uint64_t>()) {
        if (*number > static_cast<std::uint64_t>(INT64_MAX)) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(*number);
    }
    if (auto number = value.getIf<double>()) {
        const double truncated = std::trunc(*number);
        if (!std::isfinite(truncated) || truncated < -9.2e18 || truncated > 9.2e18) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(truncated);
    }
    return std::nullopt;
}

std::optional<std::string> stringValue(const Value& value) {
    if (auto text = value.getIf<std::string>()) {
        return *text;
    }
    if (auto text = value.getIf<Substring>()) {
        return text->str();
    }
    return std::nullopt;
}

// Порядок правил: числа, строки (в любом порядке), массивы, числоподобные значения
Value add(const Symbol& symbol, const Value& lhs, const Value& rhs) {
    if (auto a = lhs.getIf<double>()) {
        if (auto b = rhs.getIf<double>()) {
            return Value(*a + *b);
        }
    }
    if (auto text = stringValue(lhs)) {
        if (rhs.isNil()) {
            throw Error::typeMismatch(symbol, {lhs, rhs});
        }
        return Value(*text + rhs.description());
    }
    if (auto text = stringValue(rhs)) {
        if (lhs.isNil()) {
            throw Error::typeMismatch(symbol, {lhs, rhs});
        }
        return Value(lhs.description() + *text);
    }
    auto lhsElements = lhs.elements();
    auto rhsElements = rhs.elements();
    if (lhsElements && rhsElements) {
        std::vector<Value> joined = *lhsElements;
        joined.insert(joined.end(), rhsElements->begin(), rhsElements->end());
        if (lhs.is<std::shared_ptr<const ArraySlice>>() || rhs.is<std::shared_ptr<const ArraySlice>>()) {
            return Value(ArraySlice{std::move(joined)});
        }
        return Value(std::move(joined));
    }
    auto a = numericValue(lhs);
    auto b = numericValue(rhs);
    if (a && b) {
        return Value(*a + *b);
    }
    throw Error::typeMismatch(symbol, {lhs, rhs});
}

bool equalValues(const Symbol& symbol, const Value& lhs, const Value& rhs) {
    if (lhs.isNil() || rhs.isNil()) {
        return lhs.isNil() && rhs.isNil();
    }
    const Category category = categoryOf(lhs);
    if (!isHashable(lhs) || !isHashable(rhs)) {
        throw Error::typeMismatch(symbol, {lhs, rhs});
    }
    if (category != categoryOf(rhs)) {
        // Сравнимые значения разных типов не равны; контейнеры сравниваются только с контейнерами того же вида
        if (isScalar(category) && isScalar(categoryOf(rhs))) {
            return false;
        }
        throw Error::typeMismatch(symbol, {lhs, rhs});
    }
    if (category == Category::Tuple) {
        // Сравниваются только кортежи из 2-6 элементов
        const std::size_t lhsSize = lhs.tuple()->elements.size();
        const std::size_t rhsSize = rhs.tuple()->elements.size();
        if (lhsSize < 2 || lhsSize > 6 || rhsSize < 2 || rhsSize > 6) {
            throw Error::typeMismatch(symbol, {lhs, rhs});
        }
    }
    return lhs == rhs;
}

Value makeRange(const Symbol& symbol, const Value& lower, const Value& upper) {
    const bool closed = symbol.name() == "...";
    if (isNumber(lower) && isNumber(upper)) {
        auto lo = integerValue(lower);
        auto hi = integerValue(upper);
        if (!lo || !hi) {
            throw Error::typeMismatch(symbol, {lower, upper});
        }
        if (closed ? *lo > *hi : *lo >= *hi) {
            throw Error::invalidRange(*lo, *hi);
        }
        return closed ? Value(IntRange::closed(*lo, *hi)) : Value(IntRange::halfOpen(*lo, *hi));
    }
    auto lo = lower.getIf<StringIndex>();
    auto hi = upper.getIf<StringIndex>();
    if (lo && hi) {
        if (closed ? *lo > *hi : *lo >= *hi) {
            throw Error::invalidRange(*lo, *hi);
        }
        return closed ? Value(IndexRange::closed(*lo, *hi)) : Value(IndexRange::halfOpen(*lo, *hi));
    }
    throw Error::typeMismatch(symbol, {lower, upper});
}

Value makePartialRange(const Symbol& symbol, const Value& bound) {
    RangeKind kind = RangeKind::From;
    if (symbol.kind() == Symbol::Kind::Prefix) {
        kind = symbol.name() == "..<" ? RangeKind::UpTo : RangeKind::Through;
    }
    if (isNumber(bound)) {
        auto value = integerValue(bound);
        if (!value) {
            throw Error::typeMismatch(symbol, {bound});
        }
        return Value(IntRange{kind, kind == RangeKind::From ? *value : 0, kind == RangeKind::From ? 0 : *value});
    }
    if (auto index = bound.getIf<StringIndex>()) {
        return Value(IndexRange{kind, kind == RangeKind::From ? *index : StringIndex{},
                                kind == RangeKind::From ? StringIndex{} : *index});
    }
    throw Error::typeMismatch(symbol, {bound});
}

} // namespace anyexpr
