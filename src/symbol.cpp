#include "anyexpr/symbol.hpp"

#include <functional>

namespace anyexpr {

std::string Arity::description() const {
    if (variadic) {
        return "любое число аргументов";
    }
    return "аргументов: " + std::to_string(argumentCount);
}

Symbol::Symbol(Kind kind, std::string name, Arity arity)
    : symbolKind(kind), symbolName(std::move(name)), symbolArity(arity) {}

Symbol Symbol::variable(std::string name) {
    return Symbol(Kind::Variable, std::move(name), Arity::exactly(0));
}

Symbol Symbol::array(std::string name) {
    return Symbol(Kind::Array, std::move(name), Arity::exactly(1));
}

Symbol Symbol::infix(std::string name) {
    return Symbol(Kind::Infix, std::move(name), Arity::exactly(2));
}

Symbol Symbol::prefix(std::string name) {
    return Symbol(Kind::Prefix, std::move(name), Arity::exactly(1));
}

Symbol Symbol::postfix(std::string name) {
    return Symbol(Kind::Postfix, std::move(name), Arity::exactly(1));
}

Symbol Symbol::function(std::string name, Arity arity) {
    return Symbol(Kind::Function, std::move(name), arity);
}

std::optional<std::string> Symbol::unquotedName() const {
    if (symbolName.size() < 2) {
        return std::nullopt;
    }
    const char quote = symbolName.front();
    if ((quote != '\'' && quote != '"') || symbolName.back() != quote) {
        return std::nullopt;
    }
    return symbolName.substr(1, symbolName.size() - 2);
}

std::string quoteString(const std::string& text) {
    std::string result = "'";
    for (char ch : text) {
        switch (ch) {
        case '\\':
            result += "\\\\";
            break;
        case '\'':
            result += "\\'";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\t':
            result += "\\t";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\0':
            result += "\\0";
            break;
        default:
            result += ch;
            break;
        }
    }
    return result + "'";
}

std::string Symbol::escapedName() const {
    if (auto text = unquotedName()) {
        return quoteString(*text);
    }
    return symbolName;
}

std::string Symbol::description() const {
    switch (symbolKind) {
    case Kind::Variable:
        if (unquotedName()) {
            return "строковый литерал " + escapedName();
        }
        return "переменная " + escapedName();
    case Kind::Array:
        return "массив " + escapedName() + "[]";
    case Kind::Infix:
        if (symbolName == "[]") {
            return "оператор индексации []";
        }
        return "инфиксный оператор " + symbolName;
    case Kind::Prefix:
        return "префиксный оператор " + symbolName;
    case Kind::Postfix:
        return "постфиксный оператор " + symbolName;
    case Kind::Function:
        if (symbolName == "[]") {
            return "литерал массива";
        }
        return "функция " + symbolName + "()";
    }
    return symbolName;
}

std::size_t SymbolHash::operator()(const Symbol& symbol) const {
    std::size_t seed = std::hash<std::string>{}(symbol.name());
    seed ^= static_cast<std::size_t>(symbol.kind()) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    if (symbol.kind() == Symbol::Kind::Function) {
        const std::size_t arity = symbol.arity().isAny() ? ~std::size_t{0} : symbol.arity().count();
        seed ^= arity + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
}

} // namespace anyexpr
