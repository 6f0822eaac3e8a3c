#include <catch2/catch.hpp>

#include "anyexpr/error.hpp"
#include "anyexpr/parser.hpp"

using namespace anyexpr;

namespace {
std::string normalized(const std::string& text) {
    return parse(text).description();
}
}

TEST_CASE("testing parser description", "[parser]")
{
    SECTION("spacing is normalized")
    {
        CHECK(normalized("a+b") == "a + b");
        CHECK(normalized("foo(1,2)") == "foo(1, 2)");
        CHECK(normalized("[1,2,3]") == "[1, 2, 3]");
        CHECK(normalized("foo[ 0 ]") == "foo[0]");
        CHECK(normalized("a?b:c") == "a ? b : c");
        CHECK(normalized("a ?: b") == "a ?: b");
        CHECK(normalized("- a") == "-a");
        CHECK(normalized("5...") == "5...");
        CHECK(normalized("1...5") == "1 ... 5");
    }

    SECTION("parentheses follow precedence and associativity")
    {
        CHECK(normalized("(a + b) * c") == "(a + b) * c");
        CHECK(normalized("a + (b * c)") == "a + b * c");
        CHECK(normalized("a - (b - c)") == "a - (b - c)");
        CHECK(normalized("(a - b) - c") == "a - b - c");
        CHECK(normalized("a ?? b ?? c") == "a ?? b ?? c");
        CHECK(normalized("(a ?? b) ?? c") == "(a ?? b) ?? c");
        CHECK(normalized("-(a + b)") == "-(a + b)");
        CHECK(normalized("1 + 2 == 3 && x") == "1 + 2 == 3 && x");
    }

    SECTION("quoted names are escaped")
    {
        CHECK(normalized("'a\\'b'") == "'a\\'b'");
        CHECK(normalized("\"foo\"") == "'foo'");
    }

    SECTION("subscripts of non-identifiers use the indexing operator")
    {
        auto parsed = parse("5[0]");
        CHECK(parsed.description() == "5[0]");
        CHECK(parsed.symbols().count(Symbol::infix("[]")) == 1);
    }
}

TEST_CASE("testing parser symbols", "[parser]")
{
    auto parsed = parse("foo(x) + y[1] - bar(1, 2, 3)");
    const auto& symbols = parsed.symbols();
    CHECK(symbols.count(Symbol::function("foo", Arity::exactly(1))) == 1);
    CHECK(symbols.count(Symbol::function("bar", Arity::exactly(3))) == 1);
    CHECK(symbols.count(Symbol::variable("x")) == 1);
    CHECK(symbols.count(Symbol::array("y")) == 1);
    CHECK(symbols.count(Symbol::infix("+")) == 1);
    CHECK(symbols.count(Symbol::infix("-")) == 1);
    CHECK(symbols.count(Symbol::variable("y")) == 0);

    SECTION("prefix and postfix operators")
    {
        auto ranges = parse("..<5 + (1...)");
        CHECK(ranges.symbols().count(Symbol::prefix("..<")) == 1);
        CHECK(ranges.symbols().count(Symbol::postfix("...")) == 1);
    }

    SECTION("commas inside parentheses")
    {
        CHECK(parse("(a, b)").symbols().count(Symbol::infix(",")) == 1);
    }
}

TEST_CASE("testing parser errors", "[parser]")
{
    CHECK_THROWS_WITH(parse(""), "Пустое выражение");
    CHECK_THROWS_AS(parse("   "), Error);
    CHECK_THROWS_AS(parse("(1 + 2"), Error);
    CHECK_THROWS_AS(parse("1 +"), Error);
    CHECK_THROWS_WITH(parse("1 2"), Error::unexpectedToken("2").what());
    CHECK_THROWS_AS(parse("a ? b"), Error);
}
