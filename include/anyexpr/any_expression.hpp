#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>

#include "anyexpr/ast.hpp"
#include "anyexpr/evaluator.hpp"
#include "anyexpr/projection.hpp"
#include "anyexpr/symbol.hpp"
#include "anyexpr/value.hpp"
#include "anyexpr/value_box.hpp"

namespace anyexpr {

// Независимые флаги построения выражения
enum class Options : unsigned {
    None = 0,
    BoolSymbols = 1u << 0, // Сравнения, логические операторы и тернарный оператор
    PureSymbols = 1u << 1, // Пользовательские операторы и функции считаются чистыми
    NoOptimize = 1u << 2   // Не сворачивать константы: каждый символ вызывается при вычислении
};

constexpr Options operator|(Options lhs, Options rhs) {
    return static_cast<Options>(static_cast<unsigned>(lhs) | static_cast<unsigned>(rhs));
}

constexpr bool contains(Options options, Options flag) {
    return (static_cast<unsigned>(options) & static_cast<unsigned>(flag)) != 0;
}

// Выражение над динамическими значениями.
// Строится один раз, затем может вычисляться многократно. Копии разделяют
// исполняемое дерево и таблицу значений; вычисления сериализуются мьютексом.
class AnyExpression {
public:
    using SymbolTable = std::unordered_map<Symbol, SymbolEvaluator, SymbolHash>;
    using Constants = std::unordered_map<std::string, Value>;
    using SymbolLookup = std::function<SymbolEvaluator(const Symbol&)>;

    // Разбирает строку; выбрасывает anyexpr::Error при синтаксической ошибке.
    // Константы подставляются при построении, символы из таблицы вызываются при каждом вычислении
    // (операторы и функции - только при построении, если задан Options::PureSymbols).
    explicit AnyExpression(const std::string& expression, Options options = Options::BoolSymbols,
                           Constants constants = {}, SymbolTable symbols = {});

    explicit AnyExpression(const ParsedExpression& expression, Options options = Options::BoolSymbols,
                           Constants constants = {}, SymbolTable symbols = {});

    // Символы разрешаются функциями поиска; pureSymbols может вызываться при построении
    AnyExpression(const ParsedExpression& expression, SymbolLookup impureSymbols, SymbolLookup pureSymbols = {},
                  Options options = Options::BoolSymbols);

    // Вычисляет выражение и приводит результат к типу T
    template <typename T = Value>
    T evaluate() const {
        return project<T>(run());
    }

    // Символы, которые вызываются при вычислении (после оптимизации)
    const std::set<Symbol>& symbols() const { return evaluator->symbols(); }

    // Нормализованная запись исходного выражения
    const std::string& description() const { return text; }

    // Число значений в таблице между вычислениями
    std::size_t valueTableSize() const;

private:
    std::shared_ptr<ValueBox> box;
    std::shared_ptr<const Evaluator> evaluator;
    std::size_t baseline = 0;
    std::string text;

    void compile(const ParsedExpression& expression, Options options, const SymbolLookup& impureSymbols,
                 const SymbolLookup& pureSymbols);

    Value run() const;
};

} // namespace anyexpr
