#include "anyexpr/ast.hpp"

#include <optional>
#include <unordered_map>

#include "anyexpr/value.hpp"

namespace anyexpr {

namespace {
// Таблица приоритетов инфиксных операторов
const std::unordered_map<std::string, int> kPrecedence = {
    {":", -1}, {",", 0},    {"?:", 1},  {"?", 1},   {"||", 3},  {"&&", 4},  {"==", 5},  {"!=", 5},
    {"<", 5},  {"<=", 5},   {">", 5},   {">=", 5},  {"===", 5}, {"!==", 5}, {"??", 6},  {"...", 7},
    {"..<", 7}, {"+", 8},   {"-", 8},   {"|", 8},   {"^", 8},   {"*", 9},   {"/", 9},   {"%", 9},
    {"&", 9},  {"<<", 10}, {">>", 10},
};

// Приоритет узла, если он является инфиксным оператором
std::optional<int> nodePrecedence(const AstNode& node) {
    auto symbolNode = dynamic_cast<const SymbolNode*>(&node);
    if (!symbolNode || symbolNode->nodeSymbol().kind() != Symbol::Kind::Infix ||
        symbolNode->nodeSymbol().name() == "[]") {
        return std::nullopt;
    }
    return infixPrecedence(symbolNode->nodeSymbol().name());
}

// Операнд префиксного или постфиксного оператора берётся в скобки, если он инфиксный
std::string operandDescription(const AstNode& node) {
    if (nodePrecedence(node)) {
        return "(" + node.description() + ")";
    }
    return node.description();
}

// Операнд инфиксного оператора берётся в скобки, если связывает слабее родителя
std::string infixOperandDescription(const AstNode& node, const std::string& parent, bool rightSide) {
    auto precedence = nodePrecedence(node);
    if (!precedence) {
        return node.description();
    }
    const int parentPrecedence = infixPrecedence(parent);
    bool wrap = *precedence < parentPrecedence;
    if (*precedence == parentPrecedence) {
        wrap = rightSide != isRightAssociative(parent);
    }
    return wrap ? "(" + node.description() + ")" : node.description();
}

std::string joinDescriptions(const std::vector<AstNodePtr>& nodes) {
    std::string result;
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += nodes[i]->description();
    }
    return result;
}
}

int infixPrecedence(const std::string& op) {
    auto found = kPrecedence.find(op);
    // Неизвестные операторы связывают сильнее тернарного, но слабее остальных
    return found != kPrecedence.end() ? found->second : 2;
}

bool isRightAssociative(const std::string& op) {
    return op == "?:" || op == "?" || op == "??";
}

std::string NumberNode::description() const {
    return formatNumber(value);
}

std::string SymbolNode::description() const {
    const std::string& name = symbol.name();
    switch (symbol.kind()) {
    case Symbol::Kind::Variable:
        return symbol.escapedName();
    case Symbol::Kind::Array:
        return symbol.escapedName() + "[" + joinDescriptions(children) + "]";
    case Symbol::Kind::Function:
        if (name == "[]") {
            return "[" + joinDescriptions(children) + "]";
        }
        return name + "(" + joinDescriptions(children) + ")";
    case Symbol::Kind::Prefix:
        return name + operandDescription(*children.at(0));
    case Symbol::Kind::Postfix:
        return operandDescription(*children.at(0)) + name;
    case Symbol::Kind::Infix:
        break;
    }

    if (name == "[]") {
        return operandDescription(*children.at(0)) + "[" + children.at(1)->description() + "]";
    }
    if (name == ",") {
        return children.at(0)->description() + ", " + children.at(1)->description();
    }
    if (name == "?:" && children.size() == 3) {
        return infixOperandDescription(*children[0], name, false) + " ? " + children[1]->description() + " : " +
               infixOperandDescription(*children[2], name, true);
    }
    return infixOperandDescription(*children.at(0), name, false) + " " + name + " " +
           infixOperandDescription(*children.at(1), name, true);
}

void SymbolNode::collectSymbols(std::set<Symbol>& symbols) const {
    symbols.insert(symbol);
    for (const auto& child : children) {
        child->collectSymbols(symbols);
    }
}

ParsedExpression::ParsedExpression(AstNodePtr root) : rootNode(std::move(root)) {
    rootNode->collectSymbols(symbolSet);
}

} // namespace anyexpr
