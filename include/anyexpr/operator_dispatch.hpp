#pragma once

#include "anyexpr/evaluator.hpp"
#include "anyexpr/symbol.hpp"
#include "anyexpr/value_box.hpp"

namespace anyexpr {

// Встроенные вычислители символов над числовым каналом.
// Аргументы декодируются через таблицу значений, результат кодируется обратно.
class OperatorDispatch {
public:
    OperatorDispatch(ValueBox& box, bool boolSymbols);

    // Вычислитель по умолчанию для символа; пустая функция, если символ не встроенный
    NumericEvaluator lookup(const Symbol& symbol) const;

private:
    ValueBox& box;
    bool boolSymbols;

    // Обёртка числовой функции: аргументы приводятся к числам
    NumericEvaluator numeric(const Symbol& symbol, NumericEvaluator function) const;

    // Обёртка логической функции: результат - true или false
    NumericEvaluator boolean(const Symbol& symbol, NumericEvaluator function) const;

    NumericEvaluator builtin(const Symbol& symbol) const;
};

} // namespace anyexpr
