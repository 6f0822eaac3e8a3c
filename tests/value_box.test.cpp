#include <catch2/catch.hpp>

#include <bit>
#include <cmath>
#include <limits>

#include "anyexpr/value_box.hpp"

using namespace anyexpr;

TEST_CASE("testing value box encoding", "[value_box]")
{
    ValueBox box;

    SECTION("numbers pass through unchanged")
    {
        CHECK(box.store(Value(5.0)) == 5.0);
        CHECK(box.store(Value(-0.25)) == -0.25);
        CHECK(box.store(Value(42)) == 42.0);
        CHECK(box.size() == 0);
    }

    SECTION("booleans and nil use reserved sentinels")
    {
        CHECK(std::bit_cast<std::uint64_t>(box.store(Value(true))) == ValueBox::trueBits);
        CHECK(std::bit_cast<std::uint64_t>(box.store(Value(false))) == ValueBox::falseBits);
        CHECK(ValueBox::isNil(box.store(Value())));
        CHECK(ValueBox::isNil(box.store(Value(Null{}))));
        CHECK(box.load(ValueBox::trueValue()) == Value(true));
        CHECK(box.load(ValueBox::falseValue()) == Value(false));
        CHECK(box.load(ValueBox::nilValue()).isNil());
        CHECK(box.size() == 0);
    }

    SECTION("other values are stored in the table")
    {
        double stored = box.store(Value("foo"));
        CHECK(std::isnan(stored));
        CHECK(std::bit_cast<std::uint64_t>(stored) == (ValueBox::mask | ValueBox::indexOffset));
        CHECK(box.size() == 1);
        CHECK(box.load(stored) == Value("foo"));
    }

    SECTION("integers beyond 2^53 keep their precision")
    {
        const std::int64_t large = (std::int64_t{1} << 60) + 1;
        double stored = box.store(Value(large));
        CHECK(box.size() == 1);
        auto loaded = box.load(stored);
        REQUIRE(loaded.getIf<std::int64_t>() != nullptr);
        CHECK(*loaded.getIf<std::int64_t>() == large);
    }

    SECTION("truncate drops values above the given length")
    {
        box.store(Value("a"));
        double second = box.store(Value("b"));
        box.truncate(1);
        CHECK(box.size() == 1);
        CHECK_FALSE(box.loadIfStored(second).has_value());
    }
}

TEST_CASE("testing value box with foreign NaN payloads", "[value_box]")
{
    ValueBox box;
    box.store(Value("only"));

    SECTION("index outside the table is an ordinary number")
    {
        const double evil = std::bit_cast<double>(ValueBox::mask | 1000);
        CHECK_FALSE(box.loadIfStored(evil).has_value());
        auto loaded = box.load(evil);
        REQUIRE(loaded.getIf<double>() != nullptr);
        CHECK(std::bit_cast<std::uint64_t>(*loaded.getIf<double>()) == (ValueBox::mask | 1000));
    }

    SECTION("positive quiet NaN and plain mask are not stored values")
    {
        const double quiet = std::numeric_limits<double>::quiet_NaN();
        CHECK_FALSE(box.loadIfStored(quiet).has_value());
        CHECK_FALSE(box.loadIfStored(std::bit_cast<double>(ValueBox::mask)).has_value());
        CHECK(std::isnan(*box.load(quiet).getIf<double>()));
    }

    SECTION("storing a NaN double returns it bit-exactly")
    {
        const double payload = std::bit_cast<double>(std::uint64_t{0x7FF8000000000123});
        CHECK(std::bit_cast<std::uint64_t>(box.store(Value(payload))) == 0x7FF8000000000123);
    }
}
