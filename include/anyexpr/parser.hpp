#pragma once

#include <string>
#include <vector>

#include "anyexpr/ast.hpp"
#include "anyexpr/token.hpp"

namespace anyexpr {

// Класс синтаксического анализатора (парсера)
// Строит Абстрактное Синтаксическое Дерево (AST) из списка токенов.
// Инфиксные операторы разбираются методом подъёма по приоритетам,
// операнды - рекурсивным спуском. Набор операторов не фиксирован:
// смысл символов определяется только при вычислении.
class Parser {
public:
    // Конструктор принимает список токенов от лексера
    explicit Parser(std::vector<Token> tokens);

    // Основной метод запуска парсинга
    // Возвращает указатель на корневой узел AST
    // Выбрасывает anyexpr::Error (unexpectedToken) при синтаксических ошибках
    AstNodePtr parse();

private:
    const std::vector<Token> tokens; // Список токенов
    std::size_t current = 0;         // Индекс текущего токена

    // Возвращает токен со смещением ahead без продвижения
    const Token& peek(std::size_t ahead = 0) const;

    // Проверяет, соответствует ли текущий токен ожидаемому типу.
    // Если да - сдвигает указатель и возвращает true.
    bool match(TokenType type);

    // Ожидает токен определенного типа, иначе выбрасывает unexpectedToken
    const Token& consume(TokenType type);

    // Проверка на конец списка токенов
    bool isAtEnd() const;

    // Стоит ли текущий оператор в постфиксной позиции:
    // перед ним нет пробела, а за ним конец, закрывающая скобка, запятая или отделённый оператор
    bool isPostfixPosition() const;

    // Ошибка для неожиданного текущего токена
    [[noreturn]] void unexpected() const;

    // Разбор инфиксных операторов с приоритетом не ниже minPrecedence
    AstNodePtr parseInfix(int minPrecedence);

    // Разбор префиксного оператора
    AstNodePtr parseUnary();

    // Разбор постфиксных операторов и индексации
    AstNodePtr parsePostfix();

    // Разбор первичного выражения (числа, имена, скобки, литералы массивов)
    AstNodePtr parsePrimary();

    // Разбор списка аргументов до закрывающей лексемы closing
    std::vector<AstNodePtr> parseArguments(TokenType closing);
};

// Разбирает строку выражения
ParsedExpression parse(const std::string& expression);

} // namespace anyexpr
