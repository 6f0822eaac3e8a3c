#include <catch2/catch.hpp>

#include "anyexpr/error.hpp"
#include "anyexpr/tokenizer.hpp"

using namespace anyexpr;

namespace {
std::vector<Token> tokenize(const std::string& text) {
    return Tokenizer(text).tokenize();
}
}

TEST_CASE("testing tokenizer on numbers and names", "[tokenizer]")
{
    SECTION("simple infix expression")
    {
        auto tokens = tokenize("4 + 5");
        REQUIRE(tokens.size() == 4);
        CHECK(tokens[0].type == TokenType::Number);
        CHECK(tokens[0].numericValue == 4.0);
        CHECK(tokens[1].type == TokenType::Operator);
        CHECK(tokens[1].text == "+");
        CHECK(tokens[1].spaceBefore);
        CHECK(tokens[2].numericValue == 5.0);
        CHECK(tokens[3].type == TokenType::End);
    }

    SECTION("number formats")
    {
        CHECK(tokenize("0x1F")[0].numericValue == 31.0);
        CHECK(tokenize(".5")[0].numericValue == 0.5);
        CHECK(tokenize("1e3")[0].numericValue == 1000.0);
        CHECK(tokenize("2.25")[0].numericValue == 2.25);
    }

    SECTION("a dot without a digit ends the number")
    {
        auto tokens = tokenize("1...5");
        REQUIRE(tokens.size() == 4);
        CHECK(tokens[0].numericValue == 1.0);
        CHECK(tokens[1].text == "...");
        CHECK(tokens[2].numericValue == 5.0);
    }

    SECTION("identifiers")
    {
        auto tokens = tokenize("foo.bar $x _y1");
        REQUIRE(tokens.size() == 4);
        CHECK(tokens[0].text == "foo.bar");
        CHECK(tokens[1].text == "$x");
        CHECK(tokens[2].text == "_y1");
    }
}

TEST_CASE("testing tokenizer on operators and strings", "[tokenizer]")
{
    SECTION("trailing minus is split from an operator run")
    {
        auto tokens = tokenize("a...-1");
        REQUIRE(tokens.size() == 5);
        CHECK(tokens[0].text == "a");
        CHECK(tokens[1].text == "...");
        CHECK(tokens[2].text == "-");
        CHECK_FALSE(tokens[2].spaceBefore);
        CHECK(tokens[3].numericValue == 1.0);
    }

    SECTION("half-open range operator")
    {
        auto tokens = tokenize("..<0");
        REQUIRE(tokens.size() == 3);
        CHECK(tokens[0].text == "..<");
        CHECK(tokens[1].type == TokenType::Number);
    }

    SECTION("quoted strings keep quotes and decode escapes")
    {
        auto tokens = tokenize("'a\\'b' \"c\\nd\"");
        REQUIRE(tokens.size() == 3);
        CHECK(tokens[0].type == TokenType::Identifier);
        CHECK(tokens[0].text == "'a'b'");
        CHECK(tokens[1].text == "\"c\nd\"");
    }

    SECTION("punctuation")
    {
        auto tokens = tokenize("f(a, [b])");
        REQUIRE(tokens.size() == 9);
        CHECK(tokens[1].type == TokenType::LParen);
        CHECK(tokens[3].type == TokenType::Comma);
        CHECK(tokens[4].type == TokenType::LBracket);
        CHECK(tokens[6].type == TokenType::RBracket);
        CHECK(tokens[7].type == TokenType::RParen);
    }

    SECTION("invalid input")
    {
        CHECK_THROWS_AS(tokenize("'abc"), Error);
        CHECK_THROWS_WITH(tokenize("5 ; 3"), Error::unexpectedToken(";").what());
    }
}
