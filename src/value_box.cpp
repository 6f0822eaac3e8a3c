#include "anyexpr/value_box.hpp"

namespace anyexpr {

namespace {
// Целые числа в этих пределах представимы в double без потерь
constexpr std::int64_t kMaxExactInteger = std::int64_t{1} << 53;
}

double ValueBox::store(const Value& value) {
    if (auto number = value.getIf<double>()) {
        return *number;
    }
    if (auto flag = value.getIf<bool>()) {
        return boolValue(*flag);
    }
    if (value.isNil()) {
        return nilValue();
    }
    if (auto number = value.getIf<std::int64_t>()) {
        if (*number >= -kMaxExactInteger && *number <= kMaxExactInteger) {
            return static_cast<double>(*number);
        }
    }
    if (auto number = value.getIf<std::uint64_t>()) {
        if (*number <= static_cast<std::uint64_t>(kMaxExactInteger)) {
            return static_cast<double>(*number);
        }
    }
    values.push_back(value);
    return std::bit_cast<double>(mask | (values.size() - 1 + indexOffset));
}

std::optional<Value> ValueBox::loadIfStored(double bits) const {
    const auto raw = std::bit_cast<std::uint64_t>(bits);
    switch (raw) {
    case nilBits:
        return Value();
    case trueBits:
        return Value(true);
    case falseBits:
        return Value(false);
    default:
        break;
    }
    // Прочие NaN, не указывающие в таблицу, остаются обычными числами
    const std::uint64_t index = (raw ^ mask) - indexOffset;
    if ((raw & mask) == mask && index < values.size()) {
        return values[index];
    }
    return std::nullopt;
}

Value ValueBox::load(double bits) const {
    if (auto value = loadIfStored(bits)) {
        return *value;
    }
    return Value(bits);
}

std::vector<Value> ValueBox::load(const std::vector<double>& args) const {
    std::vector<Value> result;
    result.reserve(args.size());
    for (double arg : args) {
        result.push_back(load(arg));
    }
    return result;
}

void ValueBox::truncate(std::size_t length) {
    if (length < values.size()) {
        values.resize(length);
    }
}

} // namespace anyexpr
