#include "anyexpr/error.hpp"

#include <algorithm>
#include <string_view>

#include "anyexpr/utf8.hpp"

namespace anyexpr {

namespace {

std::string typeOf(const Value& value) {
    return value.isNil() ? "nil" : value.typeName();
}

std::string joinTypes(const std::vector<std::string>& types) {
    std::string result;
    for (std::size_t i = 0; i < types.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += types[i];
    }
    return result;
}

} // namespace

Error::Error(Kind kind, const std::string& description, std::optional<Symbol> symbol, std::vector<Value> values)
    : std::runtime_error(description), errorKind(kind), errorSymbol(std::move(symbol)),
      errorValues(std::move(values)) {}

Error Error::unexpectedToken(const std::string& token) {
    if (token.empty()) {
        return Error(Kind::UnexpectedToken, "Пустое выражение");
    }
    return Error(Kind::UnexpectedToken, "Неожиданный токен «" + token + "»");
}

Error Error::undefinedSymbol(const Symbol& symbol) {
    return Error(Kind::UndefinedSymbol, "Неопределённый символ: " + symbol.description(), symbol);
}

Error Error::arityMismatch(const Symbol& symbol) {
    return Error(Kind::ArityMismatch,
                 "Неверное число аргументов: " + symbol.description() + " ожидает " + symbol.arity().description(),
                 symbol);
}

Error Error::typeMismatch(const Symbol& symbol, std::vector<Value> args) {
    std::vector<std::string> types;
    types.reserve(args.size());
    for (const auto& arg : args) {
        types.push_back(typeOf(arg));
    }

    std::string description;
    if (symbol == Symbol::infix("[]") && types.size() == 2) {
        description = "Попытка индексации значения типа " + types[0] + " индексом несовместимого типа " + types[1];
    } else if (symbol.kind() == Symbol::Kind::Array && !types.empty()) {
        description = "Попытка индексации " + symbol.escapedName() + " индексом несовместимого типа " + types.back();
    } else if ((symbol == Symbol::infix("==") || symbol == Symbol::infix("!=")) && types.size() == 2 &&
               types[0] == types[1]) {
        description = "Аргументы символа «" + symbol.description() +
                      "» должны поддерживать структурное сравнение (Hashable)";
    } else if (types.size() == 1) {
        description = "Аргумент типа " + types[0] + " несовместим с символом «" + symbol.description() + "»";
    } else {
        description = "Аргументы типов (" + joinTypes(types) + ") несовместимы с символом «" +
                      symbol.description() + "»";
    }
    return Error(Kind::TypeMismatch, description, symbol, std::move(args));
}

Error Error::arrayBounds(const Symbol& symbol, double index) {
    return Error(Kind::ArrayBounds,
                 "Индекс " + formatNumber(index) + " вне границ для символа «" + symbol.description() + "»", symbol,
                 {Value(index)});
}

Error Error::stringBounds(const std::string& text, std::int64_t offset) {
    return Error(Kind::StringBounds,
                 "Индекс символа " + std::to_string(offset) + " вне границ строки " + quoteString(text), std::nullopt,
                 {Value(text), Value(offset)});
}

Error Error::stringBounds(const Substring& text, StringIndex index) {
    const std::string_view base = text.base();
    const std::size_t start = text.startIndex().offset;
    std::int64_t offset = 0;
    if (index.offset >= start) {
        const std::size_t inside = std::min(index.offset, base.size());
        offset = static_cast<std::int64_t>(utf8::codePointCount(base.substr(start, inside - start)));
        // За концом исходной строки каждый байт считается отдельным символом
        if (index.offset > base.size()) {
            offset += static_cast<std::int64_t>(index.offset - base.size());
        }
    } else {
        offset = -static_cast<std::int64_t>(utf8::codePointCount(base.substr(index.offset, start - index.offset)));
    }
    return stringBounds(text.str(), offset);
}

Error Error::invalidRange(std::int64_t lower, std::int64_t upper) {
    const std::string relation = lower > upper ? "<" : "<=";
    return Error(Kind::InvalidRange, "Невозможно построить диапазон: верхняя граница " + std::to_string(upper) +
                                         " " + relation + " нижней границы " + std::to_string(lower),
                 std::nullopt, {Value(lower), Value(upper)});
}

Error Error::invalidRange(StringIndex lower, StringIndex upper) {
    const std::string relation = lower > upper ? "<" : "<=";
    return Error(Kind::InvalidRange, "Невозможно построить диапазон: верхняя граница " +
                                         Value(upper).description() + " " + relation + " нижней границы " +
                                         Value(lower).description(),
                 std::nullopt, {Value(lower), Value(upper)});
}

Error Error::illegalSubscript(const Symbol& symbol, const Value& value) {
    const std::string text = symbol == Symbol::infix("[]") ? value.description() : symbol.escapedName();
    return Error(Kind::IllegalSubscript, "Попытка индексации значения " + text + " типа " + typeOf(value), symbol,
                 {value});
}

Error Error::resultTypeMismatch(const std::string& typeName, const Value& value) {
    return Error(Kind::ResultTypeMismatch,
                 "Тип результата " + typeOf(value) + " несовместим с ожидаемым типом " + typeName, std::nullopt,
                 {value});
}

Error Error::message(const std::string& text) {
    return Error(Kind::Message, text);
}

bool Error::operator==(const Error& other) const {
    return errorKind == other.errorKind && std::string_view(what()) == std::string_view(other.what());
}

} // namespace anyexpr
