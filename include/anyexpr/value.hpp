#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace anyexpr {

class Value;

// Отсутствующее значение
struct Nil {
    bool operator==(const Nil&) const = default;
};

// Явный null, который может передать вызывающая сторона.
// В выражениях ведёт себя так же, как nil.
struct Null {
    bool operator==(const Null&) const = default;
};

// Позиция в строке: смещение в байтах UTF-8 от начала исходной строки
struct StringIndex {
    std::size_t offset = 0;

    auto operator<=>(const StringIndex&) const = default;
};

// Один символ (кодовая точка) в кодировке UTF-8
struct Character {
    std::string text;

    bool operator==(const Character&) const = default;
};

// Подстрока: окно над общей исходной строкой.
// Позиции подстроки совпадают с позициями исходной строки.
class Substring {
public:
    Substring();
    explicit Substring(std::string text);
    Substring(std::shared_ptr<const std::string> base, StringIndex start, StringIndex end);

    StringIndex startIndex() const { return start; }
    StringIndex endIndex() const { return end; }
    const std::string& base() const { return *source; }
    const std::shared_ptr<const std::string>& sharedBase() const { return source; }

    std::string str() const;
    std::string_view view() const;

    bool operator==(const Substring& other) const { return view() == other.view(); }

private:
    std::shared_ptr<const std::string> source;
    StringIndex start;
    StringIndex end;
};

// Позиция начала строки
StringIndex startIndex(std::string_view text);

// Позиция конца строки
StringIndex endIndex(std::string_view text);

// Позиция символа с номером characters; за концом строки каждый байт считается символом
StringIndex characterIndex(std::string_view text, std::size_t characters);

enum class RangeKind { Closed, HalfOpen, From, UpTo, Through };

// Диапазон над целыми числами или позициями строки.
// Для частичных диапазонов неиспользуемая граница остаётся значением по умолчанию.
template <typename Bound>
struct Range {
    RangeKind kind = RangeKind::Closed;
    Bound lower{};
    Bound upper{};

    static Range closed(Bound lower, Bound upper) { return {RangeKind::Closed, lower, upper}; }
    static Range halfOpen(Bound lower, Bound upper) { return {RangeKind::HalfOpen, lower, upper}; }
    static Range from(Bound lower) { return {RangeKind::From, lower, Bound{}}; }
    static Range upTo(Bound upper) { return {RangeKind::UpTo, Bound{}, upper}; }
    static Range through(Bound upper) { return {RangeKind::Through, Bound{}, upper}; }

    bool operator==(const Range&) const = default;
};

using IntRange = Range<std::int64_t>;
using IndexRange = Range<StringIndex>;

// Упорядоченная последовательность значений
using Array = std::vector<Value>;

struct ArraySlice;
class Dictionary;
struct Tuple;

// Объект вызывающей стороны, непрозрачный для выражений
class Object {
public:
    virtual ~Object() = default;

    // Имя типа для сообщений об ошибках
    virtual std::string typeName() const = 0;

    // Текстовое представление объекта
    virtual std::string description() const = 0;
};

// Объект, поддерживающий структурное сравнение и хеширование
class HashableObject : public Object {
public:
    virtual bool isEqual(const HashableObject& other) const = 0;
    virtual std::size_t hash() const = 0;
};

// Динамическое значение, которое может вернуть или принять выражение
class Value {
public:
    using Storage = std::variant<Nil, Null, bool, double, std::int64_t, std::uint64_t, std::string, Substring,
                                 Character, StringIndex, IntRange, IndexRange, std::shared_ptr<const Array>,
                                 std::shared_ptr<const ArraySlice>, std::shared_ptr<const Dictionary>,
                                 std::shared_ptr<const Tuple>, std::shared_ptr<const Object>>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(Nil) {}
    Value(Null null) : data(null) {}
    Value(bool flag) : data(flag) {}
    Value(double number) : data(number) {}
    Value(float number) : data(static_cast<double>(number)) {}

    template <typename T>
        requires std::integral<T> && (!std::same_as<T, bool>)
    Value(T number) {
        if constexpr (std::is_signed_v<T>) {
            data = static_cast<std::int64_t>(number);
        } else {
            data = static_cast<std::uint64_t>(number);
        }
    }

    Value(const char* text) : data(std::string(text)) {}
    Value(std::string text) : data(std::move(text)) {}
    Value(Substring text) : data(std::move(text)) {}
    Value(Character character) : data(std::move(character)) {}
    Value(StringIndex index) : data(index) {}
    Value(IntRange range) : data(range) {}
    Value(IndexRange range) : data(range) {}
    Value(Array values);
    Value(ArraySlice slice);
    Value(Dictionary dictionary);
    Value(Tuple tuple);

    template <typename T>
        requires std::derived_from<T, Object>
    Value(std::shared_ptr<T> object) : data(std::shared_ptr<const Object>(std::move(object))) {}

    const Storage& variant() const { return data; }

    template <typename T>
    bool is() const {
        return std::holds_alternative<T>(data);
    }

    template <typename T>
    const T* getIf() const {
        return std::get_if<T>(&data);
    }

    // nil или null
    bool isNil() const;

    // Элементы массива или среза (nullptr для остальных значений)
    const std::vector<Value>* elements() const;

    const Dictionary* dictionary() const;
    const Tuple* tuple() const;
    const Object* object() const;

    // Имя типа для сообщений об ошибках
    std::string typeName() const;

    // Текстовое представление значения
    std::string description() const;

    // Точное структурное равенство (числа сравниваются по значению)
    bool operator==(const Value& other) const;

private:
    Storage data;
};

// Срез массива; индексы среза начинаются с нуля
struct ArraySlice {
    std::vector<Value> values;
};

// Кортеж фиксированной длины
struct Tuple {
    std::vector<Value> elements;
};

// Тип ключей словаря
enum class KeyKind { Number, String, Boolean, Any };

// Хеш значения, согласованный с Value::operator==
struct ValueHash {
    std::size_t operator()(const Value& value) const;
};

// Поддерживает ли значение структурное сравнение
bool isHashable(const Value& value);

// Словарь с ключами одного объявленного типа
class Dictionary {
public:
    Dictionary(KeyKind keyKind, std::vector<std::pair<Value, Value>> entries);

    KeyKind keyKind() const { return keys; }
    const std::vector<std::pair<Value, Value>>& entries() const { return items; }
    std::size_t size() const { return items.size(); }

    // Приводит ключ к типу ключей словаря; пустой результат, если ключ несовместим
    std::optional<Value> normalizeKey(const Value& key) const;

    // Значение по приведённому ключу или nil
    Value lookup(const Value& key) const;

    bool operator==(const Dictionary& other) const;

private:
    KeyKind keys;
    std::vector<std::pair<Value, Value>> items;
    std::unordered_map<Value, std::size_t, ValueHash> positions;
};

// Вычислитель символа над динамическими значениями
using SymbolEvaluator = std::function<Value(const std::vector<Value>& args)>;

// Кратчайшая запись числа; целые значения печатаются без дробной части
std::string formatNumber(double number);

} // namespace anyexpr
