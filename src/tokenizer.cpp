#include "anyexpr/tokenizer.hpp"

#include <cctype>
#include <cstdlib>
#include <string_view>

#include "anyexpr/error.hpp"

namespace anyexpr {

namespace {
// Символы, из которых состоят операторы
constexpr std::string_view kOperatorChars = "+-*/=%<>!&|^~?:.";

bool isOperatorChar(char ch) {
    return kOperatorChars.find(ch) != std::string_view::npos;
}

bool isDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Основной цикл разбора: проходит по строке и выделяет токены
std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        bool spaced = skipWhitespace();
        if (isAtEnd()) {
            tokens.push_back({TokenType::End, 0.0, "", index, spaced});
            break;
        }

        char ch = peek();
        Token token{};
        switch (ch) {
        // Односимвольные токены
        case '(':
            token = {TokenType::LParen, 0.0, "(", index};
            advance();
            break;
        case ')':
            token = {TokenType::RParen, 0.0, ")", index};
            advance();
            break;
        case '[':
            token = {TokenType::LBracket, 0.0, "[", index};
            advance();
            break;
        case ']':
            token = {TokenType::RBracket, 0.0, "]", index};
            advance();
            break;
        case ',':
            token = {TokenType::Comma, 0.0, ",", index};
            advance();
            break;
        case '\'':
        case '"':
            token = makeString(ch);
            break;
        default:
            // Многосимвольные токены
            if (isDigit(ch) || (ch == '.' && isDigit(peek(1)))) {
                token = makeNumber();
            } else if (isIdentifierHead(ch)) {
                token = makeIdentifier();
            } else if (isOperatorChar(ch)) {
                token = makeOperator();
            } else {
                throw Error::unexpectedToken(std::string(1, ch));
            }
            break;
        }
        token.spaceBefore = spaced;
        tokens.push_back(std::move(token));
    }
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek(std::size_t ahead) const {
    return index + ahead < source.size() ? source[index + ahead] : '\0';
}

char Tokenizer::advance() {
    return source[index++];
}

bool Tokenizer::skipWhitespace() {
    bool skipped = false;
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek())) != 0) {
        advance();
        skipped = true;
    }
    return skipped;
}

bool Tokenizer::isIdentifierHead(char ch) const {
    const auto byte = static_cast<unsigned char>(ch);
    return std::isalpha(byte) != 0 || ch == '_' || ch == '$' || ch == '#' || ch == '@' || byte >= 0x80;
}

bool Tokenizer::isOperandHead(std::size_t position) const {
    if (position >= source.size()) {
        return false;
    }
    const char ch = source[position];
    return isDigit(ch) || isIdentifierHead(ch) || ch == '(' || ch == '[' || ch == '\'' || ch == '"' ||
           (ch == '.' && position + 1 < source.size() && isDigit(source[position + 1]));
}

// Считывание числа: целая часть, дробная часть (только если за точкой цифра) и экспонента
Token Tokenizer::makeNumber() {
    std::size_t start = index;

    if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X') &&
        std::isxdigit(static_cast<unsigned char>(peek(2))) != 0) {
        advance();
        advance();
        while (std::isxdigit(static_cast<unsigned char>(peek())) != 0) {
            advance();
        }
        std::string text = source.substr(start, index - start);
        double value = static_cast<double>(std::strtoull(text.c_str() + 2, nullptr, 16));
        return {TokenType::Number, value, text, start};
    }

    while (isDigit(peek())) {
        advance();
    }
    if (peek() == '.' && isDigit(peek(1))) {
        advance();
        while (isDigit(peek())) {
            advance();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        std::size_t digits = (peek(1) == '+' || peek(1) == '-') ? 2 : 1;
        if (isDigit(peek(digits))) {
            for (std::size_t i = 0; i < digits; ++i) {
                advance();
            }
            while (isDigit(peek())) {
                advance();
            }
        }
    }

    std::string text = source.substr(start, index - start);
    return {TokenType::Number, std::strtod(text.c_str(), nullptr), text, start};
}

// Считывание идентификатора; точка входит в имя, если за ней следует начало имени
Token Tokenizer::makeIdentifier() {
    std::size_t start = index;
    while (!isAtEnd()) {
        char ch = peek();
        if (isIdentifierHead(ch) || isDigit(ch)) {
            advance();
        } else if (ch == '.' && isIdentifierHead(peek(1))) {
            advance();
        } else {
            break;
        }
    }
    return {TokenType::Identifier, 0.0, source.substr(start, index - start), start};
}

// Считывание строкового литерала с раскрытием escape-последовательностей
Token Tokenizer::makeString(char quote) {
    std::size_t start = index;
    std::string text(1, advance());
    while (!isAtEnd()) {
        char ch = advance();
        if (ch == quote) {
            text += quote;
            return {TokenType::Identifier, 0.0, text, start};
        }
        if (ch == '\\' && !isAtEnd()) {
            char escaped = advance();
            switch (escaped) {
            case 'n':
                text += '\n';
                break;
            case 't':
                text += '\t';
                break;
            case 'r':
                text += '\r';
                break;
            case '0':
                text += '\0';
                break;
            default:
                text += escaped;
                break;
            }
            continue;
        }
        text += ch;
    }
    // Незакрытая кавычка
    throw Error::unexpectedToken(source.substr(start));
}

// Считывание оператора максимальной длины.
// Завершающие "-", "+" и "!" отделяются, если за ними сразу начинается операнд: "...-1" -> "...", "-"
Token Tokenizer::makeOperator() {
    std::size_t start = index;
    while (!isAtEnd() && isOperatorChar(peek())) {
        // ".5" после другого оператора начинает число
        if (peek() == '.' && isDigit(peek(1)) && index > start && source[index - 1] != '.') {
            break;
        }
        advance();
    }

    std::size_t length = index - start;
    char last = source[index - 1];
    if (length > 1 && (last == '-' || last == '+' || last == '!') && isOperandHead(index)) {
        --index;
        --length;
    }
    return {TokenType::Operator, 0.0, source.substr(start, length), start};
}

} // namespace anyexpr
