#include <catch2/catch.hpp>

#include <memory>

#include "anyexpr/value.hpp"
#include "test_helpers.hpp"

using namespace anyexpr;

TEST_CASE("testing value descriptions", "[value]")
{
    CHECK(Value().description() == "nil");
    CHECK(Value(true).description() == "true");
    CHECK(Value(5.0).description() == "5");
    CHECK(Value(-3.0).description() == "-3");
    CHECK(Value(0.5).description() == "0.5");
    CHECK(Value(7).description() == "7");
    CHECK(Value("text").description() == "text");
    CHECK(Value(Array{1.0, "a"}).description() == "[1, \"a\"]");
    CHECK(Value(Tuple{{1.0, 2.0}}).description() == "(1, 2)");
    CHECK(Value(Dictionary(KeyKind::String, {})).description() == "[:]");
    CHECK(Value(IntRange::halfOpen(1, 3)).description() == "1..<3");
    CHECK(Value(IntRange::through(4)).description() == "...4");
    CHECK(Value(IntRange::from(2)).description() == "2...");
    CHECK(Value(std::make_shared<test::Opaque>()).description() == "opaque");
}

TEST_CASE("testing value type names", "[value]")
{
    CHECK(Value().typeName() == "nil");
    CHECK(Value(Null{}).typeName() == "Null");
    CHECK(Value(false).typeName() == "Bool");
    CHECK(Value(1.5).typeName() == "Double");
    CHECK(Value(std::int64_t{1}).typeName() == "Int64");
    CHECK(Value(std::uint64_t{1}).typeName() == "UInt64");
    CHECK(Value(std::string("a")).typeName() == "String");
    CHECK(Value(Substring("a")).typeName() == "Substring");
    CHECK(Value(Character{"a"}).typeName() == "Character");
    CHECK(Value(StringIndex{0}).typeName() == "String.Index");
    CHECK(Value(IntRange::closed(0, 1)).typeName() == "ClosedRange<Int>");
    CHECK(Value(IndexRange::upTo(StringIndex{1})).typeName() == "PartialRangeUpTo<String.Index>");
    CHECK(Value(Array{}).typeName() == "Array");
    CHECK(Value(ArraySlice{}).typeName() == "ArraySlice");
    CHECK(Value(std::make_shared<test::Opaque>()).typeName() == "Opaque");
}

TEST_CASE("testing value equality and hashing", "[value]")
{
    SECTION("numbers compare by value across representations")
    {
        CHECK(Value(1) == Value(1.0));
        CHECK(Value(std::uint64_t{3}) == Value(std::int64_t{3}));
        CHECK_FALSE(Value(-1) == Value(std::uint64_t{18446744073709551615ULL}));
        CHECK(ValueHash{}(Value(2)) == ValueHash{}(Value(2.0)));
    }

    SECTION("strings and substrings compare by content")
    {
        CHECK(Value("abc") == Value(Substring("abc")));
        CHECK_FALSE(Value("abc") == Value(Character{"a"}));
    }

    SECTION("arrays and slices compare structurally")
    {
        CHECK(Value(Array{1.0, 2.0}) == Value(ArraySlice{{1.0, 2.0}}));
        CHECK_FALSE(Value(Array{1.0, 2.0}) == Value(Array{2.0, 1.0}));
    }

    SECTION("hashable objects use isEqual, plain objects use identity")
    {
        CHECK(Value(std::make_shared<test::Tag>(1)) == Value(std::make_shared<test::Tag>(1)));
        CHECK_FALSE(Value(std::make_shared<test::Tag>(1)) == Value(std::make_shared<test::Tag>(2)));
        auto opaque = std::make_shared<test::Opaque>();
        CHECK(Value(opaque) == Value(opaque));
        CHECK_FALSE(Value(opaque) == Value(std::make_shared<test::Opaque>()));
        CHECK_FALSE(isHashable(Value(opaque)));
        CHECK(isHashable(Value(std::make_shared<test::Tag>(3))));
    }

    SECTION("nil equals null")
    {
        CHECK(Value() == Value(Null{}));
        CHECK_FALSE(Value() == Value(0.0));
    }
}

TEST_CASE("testing dictionary keys", "[value]")
{
    Dictionary numbers(KeyKind::Number, {{Value(1), Value("one")}, {Value(2.0), Value("two")}});
    CHECK(numbers.size() == 2);
    CHECK(numbers.lookup(*numbers.normalizeKey(Value(1.0))) == Value("one"));
    CHECK(numbers.lookup(*numbers.normalizeKey(Value(std::uint64_t{2}))) == Value("two"));
    CHECK(numbers.lookup(*numbers.normalizeKey(Value(3))).isNil());
    CHECK_FALSE(numbers.normalizeKey(Value("1")).has_value());
    CHECK_FALSE(numbers.normalizeKey(Value(true)).has_value());

    Dictionary strings(KeyKind::String, {{Value("a"), Value(1)}});
    CHECK(strings.normalizeKey(Value(Substring("a"))).has_value());
    CHECK_FALSE(strings.normalizeKey(Value(1)).has_value());

    Dictionary any(KeyKind::Any, {{Value(std::make_shared<test::Tag>(7)), Value(1)}});
    CHECK(any.lookup(*any.normalizeKey(Value(std::make_shared<test::Tag>(7)))) == Value(1));
    CHECK_FALSE(any.normalizeKey(Value(std::make_shared<test::Opaque>())).has_value());

    CHECK_THROWS_AS(Dictionary(KeyKind::Boolean, {{Value(1), Value(1)}}), std::invalid_argument);
}

TEST_CASE("testing string positions", "[value]")
{
    CHECK(characterIndex("héllo", 2).offset == 3);
    CHECK(endIndex("food").offset == 4);
    CHECK(startIndex("food").offset == 0);

    auto base = std::make_shared<const std::string>("hello");
    Substring middle(base, StringIndex{1}, StringIndex{4});
    CHECK(middle.str() == "ell");
    CHECK(middle.startIndex().offset == 1);
}
