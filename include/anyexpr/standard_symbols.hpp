#pragma once

#include <unordered_map>

#include "anyexpr/evaluator.hpp"
#include "anyexpr/symbol.hpp"

namespace anyexpr {

using NumericSymbolTable = std::unordered_map<Symbol, NumericEvaluator, SymbolHash>;

// Арифметика и математические функции (семантика IEEE 754)
const NumericSymbolTable& mathSymbols();

// Сравнения и логические операторы; результат 1 или 0
const NumericSymbolTable& boolSymbols();

// Ищет символ в таблице; для функций с неподходящей арностью
// используется вариант с любым числом аргументов
NumericEvaluator findSymbol(const NumericSymbolTable& table, const Symbol& symbol);

} // namespace anyexpr
