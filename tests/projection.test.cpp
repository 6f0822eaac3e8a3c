#include <catch2/catch.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "anyexpr/projection.hpp"
#include "test_helpers.hpp"

using namespace anyexpr;
using anyexpr::test::caughtError;

TEST_CASE("testing numeric projection", "[projection]")
{
    CHECK(project<double>(Value(2.5)) == 2.5);
    CHECK(project<int>(Value(2.9)) == 2);
    CHECK(project<int>(Value(-2.9)) == -2);
    CHECK(project<std::int64_t>(Value(std::int64_t{1} << 60)) == (std::int64_t{1} << 60));
    CHECK(project<std::uint8_t>(Value(255.0)) == 255);
    CHECK(project<float>(Value(0.5)) == 0.5f);

    SECTION("out of range values are rejected")
    {
        CHECK(caughtError([] { project<std::int8_t>(Value(300.0)); }) ==
              Error::resultTypeMismatch("Int8", Value(300.0)));
        CHECK(caughtError([] { project<std::uint32_t>(Value(-1)); }).kind() == Error::Kind::ResultTypeMismatch);
        CHECK(caughtError([] { project<int>(Value(NAN)); }).kind() == Error::Kind::ResultTypeMismatch);
    }

    SECTION("numbers from booleans")
    {
        CHECK(project<double>(Value(true)) == 1.0);
        CHECK(project<int>(Value(false)) == 0);
    }

    SECTION("non numbers")
    {
        CHECK(caughtError([] { project<double>(Value("5")); }) == Error::resultTypeMismatch("Double", Value("5")));
        CHECK(caughtError([] { project<double>(Value()); }).kind() == Error::Kind::ResultTypeMismatch);
    }
}

TEST_CASE("testing boolean projection", "[projection]")
{
    CHECK(project<bool>(Value(true)));
    CHECK(project<bool>(Value(2.0)));
    CHECK_FALSE(project<bool>(Value(0.0)));
    CHECK(project<bool>(Value(std::uint64_t{7})));
    CHECK(caughtError([] { project<bool>(Value("true")); }) == Error::resultTypeMismatch("Bool", Value("true")));
}

TEST_CASE("testing string projection", "[projection]")
{
    CHECK(project<std::string>(Value("abc")) == "abc");
    CHECK(project<std::string>(Value(5.0)) == "5");
    CHECK(project<std::string>(Value(true)) == "true");
    CHECK(project<std::string>(Value(Array{1.0, "a"})) == "[1, \"a\"]");
    CHECK(project<Substring>(Value("abc")).str() == "abc");
    CHECK(project<Substring>(Value(1.5)).str() == "1.5");
    CHECK(caughtError([] { project<std::string>(Value()); }) == Error::resultTypeMismatch("String", Value()));
}

TEST_CASE("testing optional projection", "[projection]")
{
    CHECK_FALSE(project<std::optional<double>>(Value()).has_value());
    CHECK_FALSE(project<std::optional<std::string>>(Value(Null{})).has_value());
    CHECK(project<std::optional<double>>(Value(3.0)) == 3.0);
    CHECK(project<std::optional<std::string>>(Value(3.0)) == std::string("3"));
    CHECK(caughtError([] { project<std::optional<double>>(Value("x")); }).kind() ==
          Error::Kind::ResultTypeMismatch);
}

TEST_CASE("testing collection projection", "[projection]")
{
    const std::vector<double> pair{1.0, 2.0};
    CHECK(project<std::vector<double>>(Value(Array{1.0, 2.0})) == pair);
    CHECK(project<std::vector<double>>(Value(ArraySlice{{3.0}})).front() == 3.0);
    CHECK(project<std::vector<Value>>(Value(Array{1.0, "a"})).size() == 2);
    CHECK(caughtError([] { project<std::vector<double>>(Value(Array{1.0, "a"})); }) ==
          Error::resultTypeMismatch("Array<Double>", Value(Array{1.0, "a"})));
    CHECK(project<ArraySlice>(Value(Array{1.0})).values.size() == 1);

    auto tuple = project<Tuple>(Value(Tuple{{1.0, "b"}}));
    CHECK(tuple.elements.size() == 2);

    auto dictionary = project<Dictionary>(Value(Dictionary(KeyKind::Number, {{Value(1.0), Value("a")}})));
    CHECK(dictionary.lookup(Value(1.0)) == Value("a"));
}

TEST_CASE("testing exact projection", "[projection]")
{
    CHECK(project<Character>(Value(Character{"x"})).text == "x");
    CHECK(project<IntRange>(Value(IntRange::closed(1, 2))) == IntRange::closed(1, 2));
    CHECK(project<StringIndex>(Value(StringIndex{3})) == StringIndex{3});
    CHECK(caughtError([] { project<Character>(Value("x")); }).kind() == Error::Kind::ResultTypeMismatch);
    CHECK(project<Value>(Value("x")) == Value("x"));

    auto tag = project<std::shared_ptr<const test::Tag>>(Value(std::make_shared<test::Tag>(1)));
    CHECK(tag->description() == "Tag(1)");
    CHECK(caughtError([] { project<std::shared_ptr<const test::Tag>>(Value(std::make_shared<test::Opaque>())); })
              .kind() == Error::Kind::ResultTypeMismatch);
}
