#include <catch2/catch.hpp>
#include <finl/error.hpp>
#include <string>

using namespace finl;

static ErrorContext context_at(const std::string& text, int number, size_t column) {
    Line line{"doc.tex", number, text};
    return ErrorContext::at(line, column);
}

TEST_CASE("FinlError format() with location draws a caret", "[error]") {
    FinlError e{FinlError::UndefinedCommand, "undefined command '\\foo'",
                context_at("abc \\foo x", 3, 4)};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[UndefinedCommand]: undefined command '\\foo'") == 0);
    REQUIRE(formatted.find("--> doc.tex:3:5") != std::string::npos);
    REQUIRE(formatted.find(" 3 | abc \\foo x") != std::string::npos);
    REQUIRE(formatted.find("|     ^") != std::string::npos);
}

TEST_CASE("FinlError caret counts code points, not bytes", "[error]") {
    // "é" is two bytes; the backslash sits at byte 3 but display column 2
    FinlError e{FinlError::UndefinedCommand, "undefined", context_at("\xC3\xA9" "a\\x", 1, 3)};
    auto formatted = e.format();
    REQUIRE(formatted.find("--> doc.tex:1:4") != std::string::npos);
    REQUIRE(formatted.find("\n   |   ^") != std::string::npos);
}

TEST_CASE("FinlError format() with hint", "[error]") {
    FinlError e{FinlError::InvalidBoolean, "'maybe' is not a boolean", "use true, false, yes or no"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[InvalidBoolean]") != std::string::npos);
    REQUIRE(formatted.find("hint: use true, false, yes or no") != std::string::npos);
    REQUIRE(formatted.find("-->") == std::string::npos);
}

TEST_CASE("FinlError format() without hint or location", "[error]") {
    FinlError e{FinlError::Config, "bad config"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[Config]: bad config");
    REQUIRE_FALSE(e.has_location());
}

TEST_CASE("FinlError code_name() for parse codes", "[error]") {
    REQUIRE(std::string(FinlError::code_name(FinlError::UndefinedCommand)) == "UndefinedCommand");
    REQUIRE(std::string(FinlError::code_name(FinlError::BlankLineWhileParsingCommandArguments)) ==
            "BlankLineWhileParsingCommandArguments");
    REQUIRE(std::string(FinlError::code_name(FinlError::UnexpectedEOFWhileParsingCommandArguments)) ==
            "UnexpectedEOFWhileParsingCommandArguments");
    REQUIRE(std::string(FinlError::code_name(FinlError::UnterminatedGroup)) == "UnterminatedGroup");
    REQUIRE(std::string(FinlError::code_name(FinlError::NestingTooDeep)) == "NestingTooDeep");
    REQUIRE(std::string(FinlError::code_name(FinlError::InvalidArg)) == "InvalidArg");
}
