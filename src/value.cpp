#include "anyexpr/value.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "anyexpr/utf8.hpp"

namespace anyexpr {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Числовое значение для сравнения и хеширования (логические значения не считаются числами)
std::optional<double> numberOf(const Value& value) {
    if (auto number = value.getIf<double>()) {
        return *number;
    }
    if (auto number = value.getIf<std::int64_t>()) {
        return static_cast<double>(*number);
    }
    if (auto number = value.getIf<std::uint64_t>()) {
        return static_cast<double>(*number);
    }
    return std::nullopt;
}

bool isNumber(const Value& value) {
    return value.is<double>() || value.is<std::int64_t>() || value.is<std::uint64_t>();
}

// Точное сравнение чисел разных представлений
bool numbersEqual(const Value& lhs, const Value& rhs) {
    auto lhsSigned = lhs.getIf<std::int64_t>();
    auto rhsSigned = rhs.getIf<std::int64_t>();
    auto lhsUnsigned = lhs.getIf<std::uint64_t>();
    auto rhsUnsigned = rhs.getIf<std::uint64_t>();
    if ((lhsSigned || lhsUnsigned) && (rhsSigned || rhsUnsigned)) {
        if (lhsSigned && rhsSigned) {
            return *lhsSigned == *rhsSigned;
        }
        if (lhsUnsigned && rhsUnsigned) {
            return *lhsUnsigned == *rhsUnsigned;
        }
        if (lhsSigned) {
            return *lhsSigned >= 0 && static_cast<std::uint64_t>(*lhsSigned) == *rhsUnsigned;
        }
        return *rhsSigned >= 0 && static_cast<std::uint64_t>(*rhsSigned) == *lhsUnsigned;
    }
    return *numberOf(lhs) == *numberOf(rhs);
}

std::optional<std::string_view> textOf(const Value& value) {
    if (auto text = value.getIf<std::string>()) {
        return std::string_view(*text);
    }
    if (auto text = value.getIf<Substring>()) {
        return text->view();
    }
    return std::nullopt;
}

bool sequencesEqual(const std::vector<Value>& lhs, const std::vector<Value>& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (!(lhs[i] == rhs[i])) {
            return false;
        }
    }
    return true;
}

void combine(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

std::string rangeTypeName(RangeKind kind, const std::string& bound) {
    switch (kind) {
    case RangeKind::Closed:
        return "ClosedRange<" + bound + ">";
    case RangeKind::HalfOpen:
        return "Range<" + bound + ">";
    case RangeKind::From:
        return "PartialRangeFrom<" + bound + ">";
    case RangeKind::UpTo:
        return "PartialRangeUpTo<" + bound + ">";
    case RangeKind::Through:
        return "PartialRangeThrough<" + bound + ">";
    }
    return "Range<" + bound + ">";
}

template <typename Bound, typename Format>
std::string rangeDescription(const Range<Bound>& range, Format format) {
    switch (range.kind) {
    case RangeKind::Closed:
        return format(range.lower) + "..." + format(range.upper);
    case RangeKind::HalfOpen:
        return format(range.lower) + "..<" + format(range.upper);
    case RangeKind::From:
        return format(range.lower) + "...";
    case RangeKind::UpTo:
        return "..<" + format(range.upper);
    case RangeKind::Through:
        return "..." + format(range.upper);
    }
    return {};
}

std::string indexDescription(StringIndex index) {
    return "String.Index(" + std::to_string(index.offset) + ")";
}

// Описание элемента коллекции: строки печатаются в кавычках
std::string elementDescription(const Value& value) {
    if (auto text = textOf(value)) {
        return "\"" + std::string(*text) + "\"";
    }
    if (auto character = value.getIf<Character>()) {
        return "\"" + character->text + "\"";
    }
    return value.description();
}

std::string joinElements(const std::vector<Value>& values) {
    std::string result;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += elementDescription(values[i]);
    }
    return result;
}

} // namespace

Substring::Substring() : Substring(std::string()) {}

Substring::Substring(std::string text)
    : source(std::make_shared<const std::string>(std::move(text))), start{0}, end{source->size()} {}

Substring::Substring(std::shared_ptr<const std::string> base, StringIndex startIndex, StringIndex endIndex)
    : source(std::move(base)), start(startIndex), end(endIndex) {
    if (start.offset > end.offset || end.offset > source->size()) {
        throw std::out_of_range("Границы подстроки вне исходной строки");
    }
}

std::string Substring::str() const {
    return std::string(view());
}

std::string_view Substring::view() const {
    return std::string_view(*source).substr(start.offset, end.offset - start.offset);
}

StringIndex startIndex(std::string_view) {
    return StringIndex{0};
}

StringIndex endIndex(std::string_view text) {
    return StringIndex{text.size()};
}

StringIndex characterIndex(std::string_view text, std::size_t characters) {
    std::size_t position = 0;
    for (std::size_t i = 0; i < characters; ++i) {
        position = utf8::nextBoundary(text, position);
    }
    return StringIndex{position};
}

Value::Value(Array values) : data(std::make_shared<const Array>(std::move(values))) {}

Value::Value(ArraySlice slice) : data(std::make_shared<const ArraySlice>(std::move(slice))) {}

Value::Value(Dictionary dictionary) : data(std::make_shared<const Dictionary>(std::move(dictionary))) {}

Value::Value(Tuple tuple) : data(std::make_shared<const Tuple>(std::move(tuple))) {}

bool Value::isNil() const {
    return is<Nil>() || is<Null>();
}

const std::vector<Value>* Value::elements() const {
    if (auto array = getIf<std::shared_ptr<const Array>>()) {
        return array->get();
    }
    if (auto slice = getIf<std::shared_ptr<const ArraySlice>>()) {
        return &(*slice)->values;
    }
    return nullptr;
}

const Dictionary* Value::dictionary() const {
    auto dictionary = getIf<std::shared_ptr<const Dictionary>>();
    return dictionary ? dictionary->get() : nullptr;
}

const Tuple* Value::tuple() const {
    auto tuple = getIf<std::shared_ptr<const Tuple>>();
    return tuple ? tuple->get() : nullptr;
}

const Object* Value::object() const {
    auto object = getIf<std::shared_ptr<const Object>>();
    return object ? object->get() : nullptr;
}

std::string Value::typeName() const {
    return std::visit(
        Overloaded{
            [](const Nil&) -> std::string { return "nil"; },
            [](const Null&) -> std::string { return "Null"; },
            [](bool) -> std::string { return "Bool"; },
            [](double) -> std::string { return "Double"; },
            [](std::int64_t) -> std::string { return "Int64"; },
            [](std::uint64_t) -> std::string { return "UInt64"; },
            [](const std::string&) -> std::string { return "String"; },
            [](const Substring&) -> std::string { return "Substring"; },
            [](const Character&) -> std::string { return "Character"; },
            [](StringIndex) -> std::string { return "String.Index"; },
            [](const IntRange& range) { return rangeTypeName(range.kind, "Int"); },
            [](const IndexRange& range) { return rangeTypeName(range.kind, "String.Index"); },
            [](const std::shared_ptr<const Array>&) -> std::string { return "Array"; },
            [](const std::shared_ptr<const ArraySlice>&) -> std::string { return "ArraySlice"; },
            [](const std::shared_ptr<const Dictionary>&) -> std::string { return "Dictionary"; },
            [](const std::shared_ptr<const Tuple>&) -> std::string { return "Tuple"; },
            [](const std::shared_ptr<const Object>& object) { return object->typeName(); },
        },
        data);
}

std::string Value::description() const {
    return std::visit(
        Overloaded{
            [](const Nil&) -> std::string { return "nil"; },
            [](const Null&) -> std::string { return "nil"; },
            [](bool flag) -> std::string { return flag ? "true" : "false"; },
            [](double number) { return formatNumber(number); },
            [](std::int64_t number) { return std::to_string(number); },
            [](std::uint64_t number) { return std::to_string(number); },
            [](const std::string& text) { return text; },
            [](const Substring& text) { return text.str(); },
            [](const Character& character) { return character.text; },
            [](StringIndex index) { return indexDescription(index); },
            [](const IntRange& range) {
                return rangeDescription(range, [](std::int64_t bound) { return std::to_string(bound); });
            },
            [](const IndexRange& range) { return rangeDescription(range, indexDescription); },
            [](const std::shared_ptr<const Array>& array) { return "[" + joinElements(*array) + "]"; },
            [](const std::shared_ptr<const ArraySlice>& slice) { return "[" + joinElements(slice->values) + "]"; },
            [](const std::shared_ptr<const Dictionary>& dictionary) -> std::string {
                if (dictionary->size() == 0) {
                    return "[:]";
                }
                std::string result = "[";
                bool first = true;
                for (const auto& [key, value] : dictionary->entries()) {
                    if (!first) {
                        result += ", ";
                    }
                    first = false;
                    result += elementDescription(key) + ": " + elementDescription(value);
                }
                return result + "]";
            },
            [](const std::shared_ptr<const Tuple>& tuple) { return "(" + joinElements(tuple->elements) + ")"; },
            [](const std::shared_ptr<const Object>& object) { return object->description(); },
        },
        data);
}

bool Value::operator==(const Value& other) const {
    if (isNil() || other.isNil()) {
        return isNil() && other.isNil();
    }
    if (isNumber(*this) || isNumber(other)) {
        return isNumber(*this) && isNumber(other) && numbersEqual(*this, other);
    }
    if (auto lhs = textOf(*this)) {
        auto rhs = textOf(other);
        return rhs && *lhs == *rhs;
    }
    if (auto lhs = elements()) {
        auto rhs = other.elements();
        return rhs && sequencesEqual(*lhs, *rhs);
    }
    if (auto lhs = dictionary()) {
        auto rhs = other.dictionary();
        return rhs && *lhs == *rhs;
    }
    if (auto lhs = tuple()) {
        auto rhs = other.tuple();
        return rhs && sequencesEqual(lhs->elements, rhs->elements);
    }
    if (auto lhs = object()) {
        auto rhs = other.object();
        if (!rhs) {
            return false;
        }
        auto lhsHashable = dynamic_cast<const HashableObject*>(lhs);
        auto rhsHashable = dynamic_cast<const HashableObject*>(rhs);
        if (lhsHashable && rhsHashable) {
            return lhsHashable->isEqual(*rhsHashable);
        }
        return lhs == rhs;
    }
    return data == other.data;
}

std::size_t ValueHash::operator()(const Value& value) const {
    if (value.isNil()) {
        return 0;
    }
    if (auto number = numberOf(value)) {
        // -0.0 и 0.0 равны, поэтому хешируются одинаково
        return std::hash<double>{}(*number == 0 ? 0.0 : *number);
    }
    if (auto text = textOf(value)) {
        return std::hash<std::string_view>{}(*text);
    }
    if (auto elements = value.elements()) {
        std::size_t seed = elements->size();
        for (const auto& element : *elements) {
            combine(seed, (*this)(element));
        }
        return seed;
    }
    if (auto tuple = value.tuple()) {
        std::size_t seed = tuple->elements.size() + 1;
        for (const auto& element : tuple->elements) {
            combine(seed, (*this)(element));
        }
        return seed;
    }
    if (auto dictionary = value.dictionary()) {
        // Порядок записей не влияет на хеш
        std::size_t seed = dictionary->size();
        for (const auto& [key, item] : dictionary->entries()) {
            std::size_t entry = (*this)(key);
            combine(entry, (*this)(item));
            seed += entry;
        }
        return seed;
    }
    if (auto object = value.object()) {
        if (auto hashable = dynamic_cast<const HashableObject*>(object)) {
            return hashable->hash();
        }
        return std::hash<const Object*>{}(object);
    }
    return std::visit(
        Overloaded{
            [](bool flag) { return std::hash<bool>{}(flag); },
            [](const Character& character) { return std::hash<std::string>{}(character.text); },
            [](StringIndex index) { return std::hash<std::size_t>{}(index.offset); },
            [](const IntRange& range) {
                std::size_t seed = static_cast<std::size_t>(range.kind);
                combine(seed, std::hash<std::int64_t>{}(range.lower));
                combine(seed, std::hash<std::int64_t>{}(range.upper));
                return seed;
            },
            [](const IndexRange& range) {
                std::size_t seed = static_cast<std::size_t>(range.kind) + 7;
                combine(seed, std::hash<std::size_t>{}(range.lower.offset));
                combine(seed, std::hash<std::size_t>{}(range.upper.offset));
                return seed;
            },
            [](const auto&) { return std::size_t{0}; },
        },
        value.variant());
}

bool isHashable(const Value& value) {
    if (auto elements = value.elements()) {
        for (const auto& element : *elements) {
            if (!isHashable(element)) {
                return false;
            }
        }
        return true;
    }
    if (auto tuple = value.tuple()) {
        for (const auto& element : tuple->elements) {
            if (!isHashable(element)) {
                return false;
            }
        }
        return true;
    }
    if (auto dictionary = value.dictionary()) {
        for (const auto& entry : dictionary->entries()) {
            if (!isHashable(entry.second)) {
                return false;
            }
        }
        return true;
    }
    if (auto object = value.object()) {
        return dynamic_cast<const HashableObject*>(object) != nullptr;
    }
    return true;
}

Dictionary::Dictionary(KeyKind keyKind, std::vector<std::pair<Value, Value>> entries) : keys(keyKind) {
    items.reserve(entries.size());
    for (auto& [key, value] : entries) {
        auto normalized = normalizeKey(key);
        if (!normalized) {
            throw std::invalid_argument("Ключ типа " + key.typeName() + " несовместим с типом ключей словаря");
        }
        auto found = positions.find(*normalized);
        if (found != positions.end()) {
            items[found->second].second = std::move(value);
            continue;
        }
        positions.emplace(*normalized, items.size());
        items.emplace_back(std::move(*normalized), std::move(value));
    }
}

std::optional<Value> Dictionary::normalizeKey(const Value& key) const {
    switch (keys) {
    case KeyKind::Number:
        if (auto number = numberOf(key)) {
            return Value(*number);
        }
        return std::nullopt;
    case KeyKind::String:
        if (auto text = textOf(key)) {
            return Value(std::string(*text));
        }
        if (auto character = key.getIf<Character>()) {
            return Value(character->text);
        }
        return std::nullopt;
    case KeyKind::Boolean:
        if (auto flag = key.getIf<bool>()) {
            return Value(*flag);
        }
        return std::nullopt;
    case KeyKind::Any:
        if (key.isNil() || !isHashable(key)) {
            return std::nullopt;
        }
        return key;
    }
    return std::nullopt;
}

Value Dictionary::lookup(const Value& key) const {
    auto found = positions.find(key);
    if (found == positions.end()) {
        return Value();
    }
    return items[found->second].second;
}

bool Dictionary::operator==(const Dictionary& other) const {
    if (size() != other.size()) {
        return false;
    }
    for (const auto& [key, value] : items) {
        auto found = other.positions.find(key);
        if (found == other.positions.end() || !(other.items[found->second].second == value)) {
            return false;
        }
    }
    return true;
}

std::string formatNumber(double number) {
    if (std::isnan(number)) {
        return "nan";
    }
    if (std::isinf(number)) {
        return number < 0 ? "-inf" : "inf";
    }
    if (number == std::trunc(number) && std::fabs(number) < 9.2e18) {
        return std::to_string(static_cast<std::int64_t>(number));
    }
    char buffer[64];
    auto [end, error] = std::to_chars(buffer, buffer + sizeof(buffer), number);
    if (error != std::errc()) {
        return std::to_string(number);
    }
    return std::string(buffer, end);
}

} // namespace anyexpr
