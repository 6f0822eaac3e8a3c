#include "anyexpr/parser.hpp"

#include "anyexpr/error.hpp"
#include "anyexpr/tokenizer.hpp"

namespace anyexpr {

Parser::Parser(std::vector<Token> tokens) : tokens(std::move(tokens)) {}

// Запуск процесса парсинга
// Ожидает, что всё выражение будет полностью разобрано
AstNodePtr Parser::parse() {
    if (isAtEnd()) {
        throw Error::unexpectedToken("");
    }
    auto root = parseInfix(0);
    if (!isAtEnd()) {
        unexpected();
    }
    return root;
}

const Token& Parser::peek(std::size_t ahead) const {
    std::size_t position = current + ahead;
    return position < tokens.size() ? tokens[position] : tokens.back();
}

bool Parser::match(TokenType type) {
    if (!isAtEnd() && tokens[current].type == type) {
        ++current;
        return true;
    }
    return false;
}

const Token& Parser::consume(TokenType type) {
    if (match(type)) {
        return tokens[current - 1];
    }
    unexpected();
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::End;
}

void Parser::unexpected() const {
    if (isAtEnd()) {
        throw Error::unexpectedToken("конец выражения");
    }
    throw Error::unexpectedToken(peek().text);
}

bool Parser::isPostfixPosition() const {
    const Token& token = peek();
    if (token.type != TokenType::Operator || token.spaceBefore) {
        return false;
    }
    const Token& next = peek(1);
    switch (next.type) {
    case TokenType::End:
    case TokenType::RParen:
    case TokenType::RBracket:
    case TokenType::Comma:
        return true;
    case TokenType::Operator:
        return next.spaceBefore;
    default:
        return false;
    }
}

// Подъём по приоритетам: Infix -> Unary { op Infix }
AstNodePtr Parser::parseInfix(int minPrecedence) {
    auto node = parseUnary();
    while (true) {
        const Token& token = peek();
        std::string op;
        if (token.type == TokenType::Comma) {
            op = ",";
        } else if (token.type == TokenType::Operator) {
            op = token.text;
        } else {
            break;
        }

        const int precedence = infixPrecedence(op);
        if (precedence < minPrecedence) {
            break;
        }
        ++current;

        if (op == "?") {
            // Тернарный оператор: a ? b : c
            auto middle = parseInfix(1);
            const Token& colon = peek();
            if (colon.type != TokenType::Operator || colon.text != ":") {
                unexpected();
            }
            ++current;
            auto right = parseInfix(precedence);
            node = std::make_shared<SymbolNode>(Symbol::infix("?:"), std::vector<AstNodePtr>{node, middle, right});
            continue;
        }

        auto right = parseInfix(isRightAssociative(op) ? precedence : precedence + 1);
        node = std::make_shared<SymbolNode>(Symbol::infix(op), std::vector<AstNodePtr>{node, right});
    }
    return node;
}

// Грамматика: Unary -> op Unary | Postfix
AstNodePtr Parser::parseUnary() {
    if (peek().type == TokenType::Operator) {
        std::string op = peek().text;
        ++current;
        auto operand = parseUnary();
        return std::make_shared<SymbolNode>(Symbol::prefix(op), std::vector<AstNodePtr>{operand});
    }
    return parsePostfix();
}

// Грамматика: Postfix -> Primary { "[" Infix "]" | op }
AstNodePtr Parser::parsePostfix() {
    auto node = parsePrimary();
    while (true) {
        if (match(TokenType::LBracket)) {
            auto index = parseInfix(0);
            consume(TokenType::RBracket);
            auto variable = dynamic_cast<const SymbolNode*>(node.get());
            if (variable && variable->nodeSymbol().kind() == Symbol::Kind::Variable) {
                node = std::make_shared<SymbolNode>(Symbol::array(variable->nodeSymbol().name()),
                                                    std::vector<AstNodePtr>{index});
            } else {
                node = std::make_shared<SymbolNode>(Symbol::infix("[]"), std::vector<AstNodePtr>{node, index});
            }
        } else if (isPostfixPosition()) {
            std::string op = peek().text;
            ++current;
            node = std::make_shared<SymbolNode>(Symbol::postfix(op), std::vector<AstNodePtr>{node});
        } else {
            break;
        }
    }
    return node;
}

// Грамматика: Primary -> Number | Name [ "(" Args ")" ] | "(" Infix ")" | "[" Args "]"
AstNodePtr Parser::parsePrimary() {
    const Token& token = peek();
    switch (token.type) {
    case TokenType::Number:
        ++current;
        return std::make_shared<NumberNode>(token.numericValue);
    case TokenType::Identifier: {
        std::string name = token.text;
        ++current;
        if (match(TokenType::LParen)) {
            auto arguments = parseArguments(TokenType::RParen);
            const std::size_t count = arguments.size();
            return std::make_shared<SymbolNode>(Symbol::function(name, Arity::exactly(count)), std::move(arguments));
        }
        return std::make_shared<SymbolNode>(Symbol::variable(name), std::vector<AstNodePtr>{});
    }
    case TokenType::LParen: {
        ++current;
        auto inner = parseInfix(0);
        consume(TokenType::RParen);
        return inner;
    }
    case TokenType::LBracket: {
        ++current;
        auto elements = parseArguments(TokenType::RBracket);
        const std::size_t count = elements.size();
        return std::make_shared<SymbolNode>(Symbol::function("[]", Arity::exactly(count)), std::move(elements));
    }
    default:
        unexpected();
    }
}

std::vector<AstNodePtr> Parser::parseArguments(TokenType closing) {
    std::vector<AstNodePtr> arguments;
    if (match(closing)) {
        return arguments;
    }
    while (true) {
        arguments.push_back(parseInfix(1));
        if (match(TokenType::Comma)) {
            continue;
        }
        consume(closing);
        return arguments;
    }
}

ParsedExpression parse(const std::string& expression) {
    Tokenizer tokenizer(expression);
    Parser parser(tokenizer.tokenize());
    return ParsedExpression(parser.parse());
}

} // namespace anyexpr
