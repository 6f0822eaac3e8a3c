#pragma once

#include <string>
#include <vector>

#include "anyexpr/token.hpp"

namespace anyexpr {

// Класс лексического анализатора (лексера)
// Преобразует входную строку выражения в последовательность токенов.
// Запоминает, был ли пробел перед каждым токеном: от этого зависит,
// будет ли оператор префиксным, постфиксным или инфиксным.
class Tokenizer {
public:
    // Конструктор принимает исходную строку выражения
    explicit Tokenizer(std::string sourceText);

    // Основной метод запуска токенизации
    // Возвращает вектор токенов, заканчивающийся токеном End
    // Выбрасывает anyexpr::Error (unexpectedToken) при недопустимых символах
    std::vector<Token> tokenize();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения

    // Проверка достижения конца строки
    bool isAtEnd() const;

    // Возвращает символ со смещением ahead без продвижения вперед
    char peek(std::size_t ahead = 0) const;

    // Возвращает текущий символ и сдвигает указатель вперед
    char advance();

    // Пропускает пробелы; возвращает true, если что-то было пропущено
    bool skipWhitespace();

    // Может ли символ начинать идентификатор
    bool isIdentifierHead(char ch) const;

    // Может ли символ начинать операнд (число, имя, строку или скобку)
    bool isOperandHead(std::size_t position) const;

    // Считывает число (десятичное, с экспонентой или шестнадцатеричное)
    Token makeNumber();

    // Считывает идентификатор (имя переменной, массива или функции)
    Token makeIdentifier();

    // Считывает строковый литерал в кавычках quote
    Token makeString(char quote);

    // Считывает оператор максимальной длины
    Token makeOperator();
};

} // namespace anyexpr
