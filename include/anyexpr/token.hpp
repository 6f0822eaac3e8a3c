#pragma once

#include <cstddef>
#include <string>

namespace anyexpr {

// Типы лексем выражения
enum class TokenType {
    Number,     // Числовой литерал
    Identifier, // Имя или строковый литерал в кавычках
    Operator,   // Последовательность символов оператора
    LParen,     // (
    RParen,     // )
    LBracket,   // [
    RBracket,   // ]
    Comma,      // ,
    End         // Конец входной строки
};

// Лексема с позицией в исходной строке
struct Token {
    TokenType type;
    double numericValue; // Значение для числовых литералов
    std::string text;    // Исходный текст (для строк - с кавычками и раскрытыми escape-последовательностями)
    std::size_t position;
    bool spaceBefore = false; // Был ли перед лексемой пробел
};

} // namespace anyexpr
