#include <catch2/catch.hpp>

#include <cstdint>
#include <string>

#include "anyexpr/subscript.hpp"
#include "test_helpers.hpp"

using namespace anyexpr;
using anyexpr::test::caughtError;

namespace {
const Symbol subscriptOperator = Symbol::infix("[]");
}

TEST_CASE("testing array subscripts", "[subscript]")
{
    const Value numbers(Array{10.0, 20.0, 30.0, 40.0});

    SECTION("single elements")
    {
        CHECK(subscript(subscriptOperator, numbers, Value(1.0)) == Value(20.0));
        CHECK(subscript(subscriptOperator, numbers, Value(3)) == Value(40.0));
        CHECK(subscript(subscriptOperator, numbers, Value(1.7)) == Value(20.0));
        CHECK(subscript(subscriptOperator, numbers, Value(-0.5)) == Value(10.0));
        CHECK(caughtError([&] { subscript(subscriptOperator, numbers, Value(4.0)); }) ==
              Error::arrayBounds(subscriptOperator, 4));
        CHECK(caughtError([&] { subscript(subscriptOperator, numbers, Value(-1.0)); }) ==
              Error::arrayBounds(subscriptOperator, -1));
    }

    SECTION("ranges produce zero-based slices")
    {
        auto slice = subscript(subscriptOperator, numbers, Value(IntRange::halfOpen(1, 3)));
        REQUIRE(slice.is<std::shared_ptr<const ArraySlice>>());
        CHECK(slice == Value(Array{20.0, 30.0}));

        CHECK(subscript(subscriptOperator, numbers, Value(IntRange::closed(2, 3))) == Value(Array{30.0, 40.0}));
        CHECK(subscript(subscriptOperator, numbers, Value(IntRange::from(2))) == Value(Array{30.0, 40.0}));
        CHECK(subscript(subscriptOperator, numbers, Value(IntRange::upTo(2))) == Value(Array{10.0, 20.0}));
        CHECK(subscript(subscriptOperator, numbers, Value(IntRange::through(0))) == Value(Array{10.0}));

        auto nested = subscript(subscriptOperator, slice, Value(0.0));
        CHECK(nested == Value(20.0));
    }

    SECTION("first violated bound is reported")
    {
        CHECK(caughtError([&] { subscript(subscriptOperator, numbers, Value(IntRange::halfOpen(3, 5))); }) ==
              Error::arrayBounds(subscriptOperator, 4));
        CHECK(caughtError([&] { subscript(subscriptOperator, numbers, Value(IntRange::upTo(5))); }) ==
              Error::arrayBounds(subscriptOperator, 4));
        CHECK(caughtError([&] { subscript(subscriptOperator, numbers, Value(IntRange::upTo(0))); }) ==
              Error::arrayBounds(subscriptOperator, 0));
        CHECK(caughtError([&] { subscript(subscriptOperator, numbers, Value(IntRange::from(4))); }) ==
              Error::arrayBounds(subscriptOperator, 4));
        CHECK(caughtError([&] { subscript(subscriptOperator, numbers, Value(IntRange::through(4))); }) ==
              Error::arrayBounds(subscriptOperator, 4));
    }

    SECTION("reversed and empty ranges")
    {
        CHECK(caughtError([&] { subscript(subscriptOperator, numbers, Value(IntRange::closed(3, 0))); }) ==
              Error::invalidRange(std::int64_t{3}, std::int64_t{0}));
        CHECK(caughtError([&] { subscript(subscriptOperator, numbers, Value(IntRange::halfOpen(2, 1))); }) ==
              Error::invalidRange(std::int64_t{2}, std::int64_t{1}));
        CHECK(subscript(subscriptOperator, numbers, Value(IntRange::halfOpen(2, 2))) == Value(Array{}));
        CHECK(subscript(subscriptOperator, numbers, Value(IntRange::halfOpen(4, 4))) == Value(Array{}));
        CHECK(caughtError([&] { subscript(subscriptOperator, numbers, Value(IntRange::halfOpen(5, 5))); }) ==
              Error::arrayBounds(subscriptOperator, 5));
    }

    SECTION("incompatible index")
    {
        CHECK(caughtError([&] { subscript(subscriptOperator, numbers, Value("a")); }).kind() ==
              Error::Kind::TypeMismatch);
        CHECK(caughtError([&] {
                  subscript(subscriptOperator, numbers, Value(IndexRange::upTo(StringIndex{1})));
              }).kind() == Error::Kind::TypeMismatch);
    }
}

TEST_CASE("testing string subscripts", "[subscript]")
{
    SECTION("characters by offset")
    {
        CHECK(subscript(subscriptOperator, Value("hello"), Value(1.0)) == Value(Character{"e"}));
        CHECK(subscript(subscriptOperator, Value("héllo"), Value(1.0)) == Value(Character{"é"}));
        CHECK(subscript(subscriptOperator, Value("héllo"), Value(2.0)) == Value(Character{"l"}));
        CHECK(caughtError([] { subscript(subscriptOperator, Value("foo"), Value(3.0)); }) ==
              Error::stringBounds("foo", 3));
    }

    SECTION("characters by position")
    {
        CHECK(subscript(subscriptOperator, Value("héllo"), Value(StringIndex{1})) == Value(Character{"é"}));
        CHECK(caughtError([] { subscript(subscriptOperator, Value("foo"), Value(endIndex("foo"))); }) ==
              Error::stringBounds("foo", 3));
    }

    SECTION("ranges produce substrings sharing positions")
    {
        auto middle = subscript(subscriptOperator, Value("hello"), Value(IntRange::closed(1, 3)));
        REQUIRE(middle.is<Substring>());
        CHECK(middle == Value("ell"));
        CHECK(middle.getIf<Substring>()->startIndex() == StringIndex{1});

        CHECK(subscript(subscriptOperator, middle, Value(0.0)) == Value(Character{"e"}));
        CHECK(subscript(subscriptOperator, middle, Value(StringIndex{2})) == Value(Character{"l"}));
        CHECK(caughtError([&] { subscript(subscriptOperator, middle, Value(StringIndex{0})); }) ==
              Error::stringBounds("ell", -1));

        CHECK(subscript(subscriptOperator, Value("héllo"), Value(IntRange::from(3))) == Value("lo"));
        CHECK(subscript(subscriptOperator, Value("hello"),
                        Value(IndexRange::halfOpen(StringIndex{0}, StringIndex{2}))) == Value("he"));
        CHECK(subscript(subscriptOperator, Value("hello"), Value(IndexRange::through(StringIndex{1}))) ==
              Value("he"));
        CHECK(caughtError([] { subscript(subscriptOperator, Value("foo"), Value(IntRange::upTo(0))); }) ==
              Error::stringBounds("foo", 0));
    }

    SECTION("reversed and empty ranges")
    {
        CHECK(caughtError([] { subscript(subscriptOperator, Value("hello"), Value(IntRange::closed(3, 1))); }) ==
              Error::invalidRange(std::int64_t{3}, std::int64_t{1}));
        CHECK(caughtError([] {
                  subscript(subscriptOperator, Value("hello"),
                            Value(IndexRange::closed(StringIndex{3}, StringIndex{1})));
              }) == Error::invalidRange(StringIndex{3}, StringIndex{1}));
        CHECK(subscript(subscriptOperator, Value("hello"), Value(IntRange::halfOpen(2, 2))) == Value(""));
        CHECK(subscript(subscriptOperator, Value("hello"),
                        Value(IndexRange::halfOpen(StringIndex{5}, StringIndex{5}))) == Value(""));
    }
}

TEST_CASE("testing dictionary subscripts", "[subscript]")
{
    const Value names(Dictionary(KeyKind::String, {{Value("one"), Value(1.0)}, {Value("two"), Value(2.0)}}));

    CHECK(subscript(subscriptOperator, names, Value("two")) == Value(2.0));
    CHECK(subscript(subscriptOperator, names, Value(Substring("one"))) == Value(1.0));
    CHECK(subscript(subscriptOperator, names, Value("three")).isNil());
    CHECK(caughtError([&] { subscript(subscriptOperator, names, Value(1.0)); }).kind() ==
          Error::Kind::TypeMismatch);
}

TEST_CASE("testing values without subscripts", "[subscript]")
{
    CHECK(caughtError([] { subscript(subscriptOperator, Value(5.0), Value(0.0)); }) ==
          Error::illegalSubscript(subscriptOperator, Value(5.0)));

    const Symbol array = Symbol::array("x");
    CHECK(caughtError([&] { subscriptEvaluator(array, Value(5.0)); }) == Error::illegalSubscript(array, Value(5.0)));

    auto evaluator = subscriptEvaluator(array, Value(Array{1.0, 2.0}));
    CHECK(evaluator({Value(1.0)}) == Value(2.0));
    CHECK(caughtError([&] { evaluator({Value(2.0)}); }) == Error::arrayBounds(array, 2));
}
