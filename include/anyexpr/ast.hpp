#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "anyexpr/symbol.hpp"

namespace anyexpr {

// Базовый класс для узла абстрактного синтаксического дерева (AST).
// Дерево неизменяемо и может разделяться между несколькими выражениями.
class AstNode {
public:
    virtual ~AstNode() = default;

    // Нормализованная запись поддерева
    virtual std::string description() const = 0;

    // Добавляет в множество все символы поддерева
    virtual void collectSymbols(std::set<Symbol>& symbols) const = 0;
};

using AstNodePtr = std::shared_ptr<const AstNode>;

// Узел, представляющий числовую константу (лист дерева)
class NumberNode final : public AstNode {
public:
    explicit NumberNode(double value) : value(value) {}

    double number() const { return value; }

    std::string description() const override;
    void collectSymbols(std::set<Symbol>&) const override {}

private:
    double value;
};

// Узел применения символа (оператора, функции, переменной) к дочерним узлам
class SymbolNode final : public AstNode {
public:
    SymbolNode(Symbol symbol, std::vector<AstNodePtr> children)
        : symbol(std::move(symbol)), children(std::move(children)) {}

    const Symbol& nodeSymbol() const { return symbol; }
    const std::vector<AstNodePtr>& nodeChildren() const { return children; }

    std::string description() const override;
    void collectSymbols(std::set<Symbol>& symbols) const override;

private:
    Symbol symbol;                   // Применяемый символ
    std::vector<AstNodePtr> children; // Аргументы
};

// Приоритет инфиксного оператора (больше - связывает сильнее)
int infixPrecedence(const std::string& op);

// Правоассоциативен ли инфиксный оператор
bool isRightAssociative(const std::string& op);

// Результат разбора: корень дерева, его запись и множество символов
class ParsedExpression {
public:
    explicit ParsedExpression(AstNodePtr root);

    const AstNode& root() const { return *rootNode; }

    // Нормализованная запись выражения
    std::string description() const { return rootNode->description(); }

    // Все символы, встречающиеся в выражении
    const std::set<Symbol>& symbols() const { return symbolSet; }

private:
    AstNodePtr rootNode;
    std::set<Symbol> symbolSet;
};

} // namespace anyexpr
