#include "anyexpr/evaluator.hpp"

namespace anyexpr {

CallNode::CallNode(Symbol symbol, NumericEvaluator evaluator, std::vector<EvalNodePtr> children)
    : symbol(std::move(symbol)), evaluator(std::move(evaluator)), children(std::move(children)) {}

// Сначала вычисляются аргументы, затем вызывается вычислитель символа
double CallNode::evaluate() const {
    std::vector<double> args;
    args.reserve(children.size());
    for (const auto& child : children) {
        args.push_back(child->evaluate());
    }
    return evaluator(args);
}

void CallNode::collectSymbols(std::set<Symbol>& symbols) const {
    symbols.insert(symbol);
    for (const auto& child : children) {
        child->collectSymbols(symbols);
    }
}

Evaluator::Evaluator(EvalNodePtr root) : root(std::move(root)) {
    this->root->collectSymbols(symbolSet);
}

} // namespace anyexpr
