#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "anyexpr/symbol.hpp"
#include "anyexpr/value.hpp"

namespace anyexpr {

// Ошибка разбора или вычисления выражения.
// what() возвращает человекочитаемое описание; две ошибки равны,
// если совпадают вид и описание.
class Error : public std::runtime_error {
public:
    enum class Kind {
        UnexpectedToken,
        UndefinedSymbol,
        ArityMismatch,
        TypeMismatch,
        ArrayBounds,
        StringBounds,
        InvalidRange,
        IllegalSubscript,
        ResultTypeMismatch,
        Message
    };

    static Error unexpectedToken(const std::string& token);
    static Error undefinedSymbol(const Symbol& symbol);
    static Error arityMismatch(const Symbol& symbol);
    static Error typeMismatch(const Symbol& symbol, std::vector<Value> args);
    static Error arrayBounds(const Symbol& symbol, double index);

    // Смещение символа считается от начала строки
    static Error stringBounds(const std::string& text, std::int64_t offset);

    // Смещение считается от начала подстроки до позиции index и может быть отрицательным
    static Error stringBounds(const Substring& text, StringIndex index);

    static Error invalidRange(std::int64_t lower, std::int64_t upper);
    static Error invalidRange(StringIndex lower, StringIndex upper);
    static Error illegalSubscript(const Symbol& symbol, const Value& value);
    static Error resultTypeMismatch(const std::string& typeName, const Value& value);
    static Error message(const std::string& text);

    Kind kind() const { return errorKind; }
    const std::optional<Symbol>& symbol() const { return errorSymbol; }
    const std::vector<Value>& values() const { return errorValues; }

    bool operator==(const Error& other) const;

private:
    Error(Kind kind, const std::string& description, std::optional<Symbol> symbol = std::nullopt,
          std::vector<Value> values = {});

    Kind errorKind;
    std::optional<Symbol> errorSymbol;
    std::vector<Value> errorValues;
};

} // namespace anyexpr
