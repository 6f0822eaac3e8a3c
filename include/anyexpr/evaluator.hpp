#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "anyexpr/symbol.hpp"

namespace anyexpr {

// Вычислитель символа над числовым каналом
using NumericEvaluator = std::function<double(const std::vector<double>& args)>;

// Узел исполняемого дерева. Между узлами передаются только числа double.
class EvalNode {
public:
    virtual ~EvalNode() = default;

    // Рекурсивно вычисляет значение поддерева
    virtual double evaluate() const = 0;

    // Значение узла, если он свёрнут в константу
    virtual std::optional<double> constantValue() const { return std::nullopt; }

    // Добавляет символы оставшихся вызовов
    virtual void collectSymbols(std::set<Symbol>& symbols) const = 0;
};

using EvalNodePtr = std::shared_ptr<const EvalNode>;

// Узел-константа
class LiteralNode final : public EvalNode {
public:
    explicit LiteralNode(double value) : value(value) {}

    double evaluate() const override { return value; }
    std::optional<double> constantValue() const override { return value; }
    void collectSymbols(std::set<Symbol>&) const override {}

private:
    double value;
};

// Узел вызова вычислителя символа
class CallNode final : public EvalNode {
public:
    CallNode(Symbol symbol, NumericEvaluator evaluator, std::vector<EvalNodePtr> children);

    double evaluate() const override;
    void collectSymbols(std::set<Symbol>& symbols) const override;

private:
    Symbol symbol;
    NumericEvaluator evaluator;
    std::vector<EvalNodePtr> children;
};

// Оптимизированное исполняемое дерево выражения
class Evaluator {
public:
    explicit Evaluator(EvalNodePtr root);

    double evaluate() const { return root->evaluate(); }

    // Символы, которые будут вызваны при вычислении
    const std::set<Symbol>& symbols() const { return symbolSet; }

private:
    EvalNodePtr root;
    std::set<Symbol> symbolSet;
};

} // namespace anyexpr
