#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "anyexpr/value.hpp"

namespace anyexpr {

// Таблица значений, передаваемых через числовой канал вычислителя.
// Все тихие NaN с битами -NaN зарезервированы: младшие биты кодируют
// nil, true, false или индекс значения в таблице. Числа передаются как есть.
class ValueBox {
public:
    static constexpr std::uint64_t mask = 0xFFF8000000000000ULL; // Биты -NaN
    static constexpr std::uint64_t trueBits = mask | 1;
    static constexpr std::uint64_t falseBits = mask | 2;
    static constexpr std::uint64_t nilBits = mask | 3;
    static constexpr std::uint64_t indexOffset = 4;

    static double nilValue() { return std::bit_cast<double>(nilBits); }
    static double trueValue() { return std::bit_cast<double>(trueBits); }
    static double falseValue() { return std::bit_cast<double>(falseBits); }
    static double boolValue(bool flag) { return flag ? trueValue() : falseValue(); }

    static bool isNil(double bits) { return std::bit_cast<std::uint64_t>(bits) == nilBits; }

    // Кодирует значение: числа и логические значения без таблицы,
    // остальные значения добавляются в таблицу
    double store(const Value& value);

    // Декодирует канал, если он несёт nil, логическое значение или индекс таблицы
    std::optional<Value> loadIfStored(double bits) const;

    // Декодирует канал; обычные числа (включая NaN) возвращаются как Double
    Value load(double bits) const;

    // Декодирует список аргументов
    std::vector<Value> load(const std::vector<double>& args) const;

    std::size_t size() const { return values.size(); }

    // Отбрасывает значения, добавленные после позиции length
    void truncate(std::size_t length);

    // Мьютекс, сериализующий вычисления над таблицей
    std::mutex& mutex() const { return evaluationMutex; }

private:
    std::vector<Value> values;
    mutable std::mutex evaluationMutex;
};

} // namespace anyexpr
