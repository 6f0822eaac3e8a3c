#pragma once

#include <stdexcept>
#include <string>

#include "anyexpr/error.hpp"
#include "anyexpr/value.hpp"

namespace anyexpr::test {

// Вид ошибки, выброшенной действием; logic_error, если ошибки не было
template <typename Action>
Error caughtError(Action&& action) {
    try {
        action();
    } catch (const Error& error) {
        return error;
    }
    throw std::logic_error("ожидалась ошибка anyexpr::Error");
}

// Непрозрачный объект без структурного сравнения
class Opaque : public Object {
public:
    std::string typeName() const override { return "Opaque"; }
    std::string description() const override { return "opaque"; }
};

// Объект со структурным сравнением по полю id
class Tag : public HashableObject {
public:
    explicit Tag(int id) : id(id) {}

    std::string typeName() const override { return "Tag"; }
    std::string description() const override { return "Tag(" + std::to_string(id) + ")"; }
    bool isEqual(const HashableObject& other) const override {
        auto tag = dynamic_cast<const Tag*>(&other);
        return tag && tag->id == id;
    }
    std::size_t hash() const override { return static_cast<std::size_t>(id); }

private:
    int id;
};

} // namespace anyexpr::test
