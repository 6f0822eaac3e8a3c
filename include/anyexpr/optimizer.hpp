#pragma once

#include <functional>

#include "anyexpr/ast.hpp"
#include "anyexpr/evaluator.hpp"

namespace anyexpr {

// Строит исполняемое дерево и сворачивает чистые вызовы с константными аргументами
class Optimizer {
public:
    // Поиск вычислителя символа; пустая функция означает "не найден"
    using Lookup = std::function<NumericEvaluator(const Symbol&)>;

    // Подстановка узла вместо вызова; nullptr означает "обычный вызов"
    using Inliner = std::function<EvalNodePtr(const Symbol&, const std::vector<EvalNodePtr>&)>;

    // impureSymbols - символы, которые вызываются при каждом вычислении;
    // pureSymbols - символы, которые можно вызвать один раз при построении.
    // pureSymbols обязан вернуть вычислитель для любого символа.
    Optimizer(Lookup impureSymbols, Lookup pureSymbols, Inliner inliner = {});

    Evaluator optimize(const ParsedExpression& expression) const;

private:
    Lookup impureSymbols;
    Lookup pureSymbols;
    Inliner inliner;

    EvalNodePtr optimizeNode(const AstNode& node) const;
};

} // namespace anyexpr
