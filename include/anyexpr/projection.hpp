#pragma once

#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "anyexpr/error.hpp"
#include "anyexpr/value.hpp"

namespace anyexpr {

// Приведение результата выражения к типу вызывающей стороны.
// Projection<T>::cast выполняет строгое приведение (точный тип или числовое
// преобразование без потерь диапазона), typeName() даёт имя для сообщений.
template <typename T>
struct Projection;

template <>
struct Projection<bool> {
    static std::string typeName() { return "Bool"; }
    static std::optional<bool> cast(const Value& value) {
        if (auto flag = value.getIf<bool>()) {
            return *flag;
        }
        return std::nullopt;
    }
};

template <typename T>
    requires(std::is_arithmetic_v<T> && !std::same_as<T, bool>)
struct Projection<T> {
    static std::string typeName() {
        if constexpr (std::is_floating_point_v<T>) {
            return sizeof(T) == sizeof(float) ? "Float" : "Double";
        } else {
            return (std::is_signed_v<T> ? "Int" : "UInt") + std::to_string(sizeof(T) * 8);
        }
    }

    static std::optional<T> cast(const Value& value) {
        if (auto number = value.getIf<double>()) {
            return fromDouble(*number);
        }
        if (auto number = value.getIf<std::int64_t>()) {
            if constexpr (std::is_floating_point_v<T>) {
                return static_cast<T>(*number);
            } else if (std::in_range<T>(*number)) {
                return static_cast<T>(*number);
            }
            return std::nullopt;
        }
        if (auto number = value.getIf<std::uint64_t>()) {
            if constexpr (std::is_floating_point_v<T>) {
                return static_cast<T>(*number);
            } else if (std::in_range<T>(*number)) {
                return static_cast<T>(*number);
            }
            return std::nullopt;
        }
        return std::nullopt;
    }

private:
    // Дробная часть отбрасывается; значения вне диапазона T не приводятся
    static std::optional<T> fromDouble(double number) {
        if constexpr (std::is_floating_point_v<T>) {
            return static_cast<T>(number);
        } else {
            const double truncated = std::trunc(number);
            if (!std::isfinite(truncated) || truncated < static_cast<double>(std::numeric_limits<T>::min()) ||
                truncated >= std::ldexp(1.0, std::numeric_limits<T>::digits)) {
                return std::nullopt;
            }
            return static_cast<T>(truncated);
        }
    }
};

template <>
struct Projection<std::string> {
    static std::string typeName() { return "String"; }
    static std::optional<std::string> cast(const Value& value) {
        if (auto text = value.getIf<std::string>()) {
            return *text;
        }
        if (auto text = value.getIf<Substring>()) {
            return text->str();
        }
        return std::nullopt;
    }
};

template <>
struct Projection<Substring> {
    static std::string typeName() { return "Substring"; }
    static std::optional<Substring> cast(const Value& value) {
        if (auto text = value.getIf<Substring>()) {
            return *text;
        }
        if (auto text = value.getIf<std::string>()) {
            return Substring(*text);
        }
        return std::nullopt;
    }
};

// Значения, которые приводятся только при точном совпадении типа
template <typename T>
struct ExactProjection {
    static std::optional<T> cast(const Value& value) {
        if (auto exact = value.getIf<T>()) {
            return *exact;
        }
        return std::nullopt;
    }
};

template <>
struct Projection<Character> : ExactProjection<Character> {
    static std::string typeName() { return "Character"; }
};

template <>
struct Projection<StringIndex> : ExactProjection<StringIndex> {
    static std::string typeName() { return "String.Index"; }
};

template <>
struct Projection<IntRange> : ExactProjection<IntRange> {
    static std::string typeName() { return "Range<Int>"; }
};

template <>
struct Projection<IndexRange> : ExactProjection<IndexRange> {
    static std::string typeName() { return "Range<String.Index>"; }
};

template <>
struct Projection<ArraySlice> {
    static std::string typeName() { return "ArraySlice"; }
    static std::optional<ArraySlice> cast(const Value& value) {
        if (auto elements = value.elements()) {
            return ArraySlice{*elements};
        }
        return std::nullopt;
    }
};

template <>
struct Projection<Dictionary> {
    static std::string typeName() { return "Dictionary"; }
    static std::optional<Dictionary> cast(const Value& value) {
        if (auto dictionary = value.dictionary()) {
            return *dictionary;
        }
        return std::nullopt;
    }
};

template <>
struct Projection<Tuple> {
    static std::string typeName() { return "Tuple"; }
    static std::optional<Tuple> cast(const Value& value) {
        if (auto tuple = value.tuple()) {
            return *tuple;
        }
        return std::nullopt;
    }
};

// Массивы и срезы взаимозаменяемы; элементы приводятся строго, все или ни одного
template <typename U>
struct Projection<std::vector<U>> {
    static std::string typeName() {
        if constexpr (std::is_same_v<U, Value>) {
            return "Array";
        } else {
            return "Array<" + Projection<U>::typeName() + ">";
        }
    }

    static std::optional<std::vector<U>> cast(const Value& value) {
        auto elements = value.elements();
        if (!elements) {
            return std::nullopt;
        }
        if constexpr (std::is_same_v<U, Value>) {
            return *elements;
        } else {
            std::vector<U> result;
            result.reserve(elements->size());
            for (const auto& element : *elements) {
                auto converted = Projection<U>::cast(element);
                if (!converted) {
                    return std::nullopt;
                }
                result.push_back(std::move(*converted));
            }
            return result;
        }
    }
};

template <typename U>
    requires std::derived_from<U, Object>
struct Projection<std::shared_ptr<const U>> {
    static std::string typeName() { return "Object"; }
    static std::optional<std::shared_ptr<const U>> cast(const Value& value) {
        if (auto object = value.getIf<std::shared_ptr<const Object>>()) {
            if (auto converted = std::dynamic_pointer_cast<const U>(*object)) {
                return converted;
            }
        }
        return std::nullopt;
    }
};

template <typename T>
struct IsOptional : std::false_type {};

template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

// Приводит значение к типу T:
// точный тип -> числовое приведение -> nil только в std::optional ->
// строка из любого значения -> Bool из числа -> число из Bool
template <typename T>
T project(const Value& value) {
    if constexpr (std::is_same_v<T, Value>) {
        return value;
    } else if constexpr (IsOptional<T>::value) {
        if (value.isNil()) {
            return std::nullopt;
        }
        return T(project<typename T::value_type>(value));
    } else {
        if (auto exact = Projection<T>::cast(value)) {
            return std::move(*exact);
        }
        if (!value.isNil()) {
            if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, Substring>) {
                return T(value.description());
            } else if constexpr (std::is_same_v<T, bool>) {
                if (auto number = value.getIf<double>()) {
                    return *number != 0;
                }
                if (auto number = value.getIf<std::int64_t>()) {
                    return *number != 0;
                }
                if (auto number = value.getIf<std::uint64_t>()) {
                    return *number != 0;
                }
            } else if constexpr (std::is_arithmetic_v<T>) {
                if (auto flag = value.getIf<bool>()) {
                    return static_cast<T>(*flag ? 1 : 0);
                }
            }
        }
        throw Error::resultTypeMismatch(Projection<T>::typeName(), value);
    }
}

} // namespace anyexpr
