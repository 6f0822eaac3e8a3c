#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "anyexpr/symbol.hpp"
#include "anyexpr/value.hpp"

namespace anyexpr {

// Числовое значение для арифметики: числа и логические значения (1 или 0)
std::optional<double> numericValue(const Value& value);

// Целое число для диапазонов и индексов (дробная часть отбрасывается);
// логические значения, NaN и бесконечности не подходят
std::optional<std::int64_t> integerValue(const Value& value);

// Текст строки или подстроки
std::optional<std::string> stringValue(const Value& value);

// Сложение, конкатенация строк и массивов
Value add(const Symbol& symbol, const Value& lhs, const Value& rhs);

// Структурное равенство для == и !=
bool equalValues(const Symbol& symbol, const Value& lhs, const Value& rhs);

// Инфиксные "..." и "..<"
Value makeRange(const Symbol& symbol, const Value& lower, const Value& upper);

// Префиксные "..." и "..<", постфиксный "..."
Value makePartialRange(const Symbol& symbol, const Value& bound);

} // namespace anyexpr
