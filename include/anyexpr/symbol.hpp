#pragma once

#include <compare>
#include <cstddef>
#include <optional>
#include <string>

namespace anyexpr {

// Арность функции: точное число аргументов или любое
class Arity {
public:
    static Arity exactly(std::size_t count) { return Arity(false, count); }
    static Arity any() { return Arity(true, 0); }

    bool isAny() const { return variadic; }
    std::size_t count() const { return argumentCount; }

    // Текстовое описание для сообщений об ошибках
    std::string description() const;

    bool operator==(const Arity& other) const = default;
    auto operator<=>(const Arity& other) const = default;

private:
    Arity(bool isVariadic, std::size_t count) : variadic(isVariadic), argumentCount(count) {}

    bool variadic;
    std::size_t argumentCount;
};

// Именованная сущность выражения: переменная, массив, оператор или функция.
// Два символа равны, если совпадают вид, имя и (для функций) арность.
class Symbol {
public:
    enum class Kind { Variable, Array, Infix, Prefix, Postfix, Function };

    static Symbol variable(std::string name);
    static Symbol array(std::string name);
    static Symbol infix(std::string name);
    static Symbol prefix(std::string name);
    static Symbol postfix(std::string name);
    static Symbol function(std::string name, Arity arity);

    Kind kind() const { return symbolKind; }
    const std::string& name() const { return symbolName; }
    Arity arity() const { return symbolArity; }

    // Содержимое строкового литерала, если имя заключено в кавычки
    std::optional<std::string> unquotedName() const;

    // Имя в виде, пригодном для печати выражения (с экранированием кавычек)
    std::string escapedName() const;

    // Человекочитаемое описание: "переменная x", "функция foo()" и т.д.
    std::string description() const;

    bool operator==(const Symbol& other) const = default;
    auto operator<=>(const Symbol& other) const = default;

private:
    Symbol(Kind kind, std::string name, Arity arity);

    Kind symbolKind;
    std::string symbolName;
    Arity symbolArity;
};

// Хеш символа для неупорядоченных таблиц
struct SymbolHash {
    std::size_t operator()(const Symbol& symbol) const;
};

// Экранирует строку и заключает её в одинарные кавычки
std::string quoteString(const std::string& text);

} // namespace anyexpr
