#include "anyexpr/optimizer.hpp"

#include <exception>

namespace anyexpr {

Optimizer::Optimizer(Lookup impureSymbols, Lookup pureSymbols, Inliner inliner)
    : impureSymbols(std::move(impureSymbols)), pureSymbols(std::move(pureSymbols)), inliner(std::move(inliner)) {}

Evaluator Optimizer::optimize(const ParsedExpression& expression) const {
    return Evaluator(optimizeNode(expression.root()));
}

// Дочерние узлы оптимизируются первыми, поэтому свёртка идёт снизу вверх
EvalNodePtr Optimizer::optimizeNode(const AstNode& node) const {
    if (auto number = dynamic_cast<const NumberNode*>(&node)) {
        return std::make_shared<LiteralNode>(number->number());
    }

    const auto& symbolNode = dynamic_cast<const SymbolNode&>(node);
    const Symbol& symbol = symbolNode.nodeSymbol();

    std::vector<EvalNodePtr> children;
    children.reserve(symbolNode.nodeChildren().size());
    bool constantArgs = true;
    for (const auto& child : symbolNode.nodeChildren()) {
        children.push_back(optimizeNode(*child));
        constantArgs = constantArgs && children.back()->constantValue().has_value();
    }

    if (auto evaluator = impureSymbols(symbol)) {
        return std::make_shared<CallNode>(symbol, std::move(evaluator), std::move(children));
    }

    if (inliner) {
        if (auto inlined = inliner(symbol, children)) {
            return inlined;
        }
    }

    auto evaluator = pureSymbols(symbol);
    if (constantArgs) {
        std::vector<double> args;
        args.reserve(children.size());
        for (const auto& child : children) {
            args.push_back(*child->constantValue());
        }
        try {
            return std::make_shared<LiteralNode>(evaluator(args));
        } catch (...) {
            // Ошибка запоминается и выбрасывается при каждом вычислении узла
            evaluator = [error = std::current_exception()](const std::vector<double>&) -> double {
                std::rethrow_exception(error);
            };
        }
    }
    return std::make_shared<CallNode>(symbol, std::move(evaluator), std::move(children));
}

} // namespace anyexpr
