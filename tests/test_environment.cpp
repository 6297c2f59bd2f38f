#include <catch2/catch.hpp>
#include <finl/lang/parser.hpp>
#include <string>

using namespace finl;

// Parser with a few environments registered
static std::vector<ParseItem> parse_env(const std::string& src) {
    auto parser = Parser::from_text(src);
    REQUIRE(parser.define_environment("itemize", {}).is_ok());
    REQUIRE(parser.define_environment("a", {}).is_ok());
    REQUIRE(parser.define_environment("b", {}).is_ok());
    REQUIRE(parser.define_environment("list",
        {{ParameterFormat::Optional, ParameterType::KeyValueList},
         {ParameterFormat::Required, ParameterType::ParsedTokens}}).is_ok());
    REQUIRE(parser.define_environment("verbatim", {}, ParameterType::VerbatimText).is_ok());
    REQUIRE(parser.define_environment("equation", {}, ParameterType::Math).is_ok());
    REQUIRE(parser.define_command("item", {}).is_ok());
    return parser.parse();
}

static std::string kinds(const std::vector<ParseItem>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += " ";
        out += item.result.is_ok() ? token_kind_name(item.result.value().kind)
                                   : FinlError::code_name(item.result.error().code);
    }
    return out;
}

TEST_CASE("environment with a parsed body", "[environment]") {
    auto items = parse_env("\\begin{itemize}\\item one\\end{itemize}after");
    REQUIRE(kinds(items) == "Environment ParsedText");
    CHECK(describe(items[0].result.value()) ==
          "Environment(itemize, [], [Command(item, []), ParsedText(\"one\")])");
    CHECK(items[0].loc.column == 0);
    CHECK(items[1].result.value().text == "after");
}

TEST_CASE("environment body spans lines", "[environment]") {
    auto items = parse_env("\\begin{itemize}\n  \\item x\n  \\item y\n\\end{itemize}");
    REQUIRE(kinds(items) == "Environment");
    const auto& env = items[0].result.value();
    CHECK(env.name() == "itemize");
    REQUIRE(env.body.size() == 4);
    CHECK(env.body[1].loc.line == 2);
    CHECK(env.body[3].loc.line == 3);
}

TEST_CASE("environment name may be surrounded by spaces", "[environment]") {
    auto items = parse_env("\\begin { a }x\\end{a}");
    REQUIRE(kinds(items) == "Environment");
    CHECK(describe(items[0].result.value()) == "Environment(a, [], [ParsedText(\"x\")])");
}

TEST_CASE("environment parameters", "[environment]") {
    auto items = parse_env("\\begin{list}[sep=1]{Title}body\\end{list}");
    REQUIRE(kinds(items) == "Environment");
    CHECK(describe(items[0].result.value()) ==
          "Environment(list, [KeyValueList(sep=1), Tokens([ParsedText(\"Title\")])], "
          "[ParsedText(\"body\")])");
}

TEST_CASE("environment parameter errors name the environment", "[environment]") {
    auto items = parse_env("\\begin{list}\n\nx\\end{list}");
    REQUIRE(kinds(items) == "BlankLineWhileParsingCommandArguments ParsedText UnexpectedEnvironmentEnd");
    const auto& err = items[0].result.error();
    CHECK(err.name == "list");
    CHECK(err.parameter == 1);
    CHECK(err.message.find("argument 1 of environment 'list'") != std::string::npos);
}

TEST_CASE("nested environments", "[environment]") {
    auto items = parse_env("\\begin{a}\\begin{b}x\\end{b}\\end{a}");
    REQUIRE(kinds(items) == "Environment");
    CHECK(describe(items[0].result.value()) ==
          "Environment(a, [], [Environment(b, [], [ParsedText(\"x\")])])");
}

TEST_CASE("verbatim body is captured raw", "[environment]") {
    auto items = parse_env("\\begin{verbatim}\\foo{ % x\n  }\\end{verbatim}z");
    REQUIRE(kinds(items) == "Environment ParsedText");
    CHECK(describe(items[0].result.value()) ==
          "Environment(verbatim, [], [RawText(\"\\foo{ % x\n  }\")])");
    CHECK(items[1].result.value().text == "z");
}

TEST_CASE("math body goes through the math handler", "[environment]") {
    auto items = parse_env("\\begin{equation}x+1\\end{equation}");
    REQUIRE(kinds(items) == "Environment");
    CHECK(describe(items[0].result.value()) == "Environment(equation, [], [Math(\"x+1\")])");
}

TEST_CASE("undefined environment", "[environment]") {
    auto items = parse_env("\\begin{nope}x");
    REQUIRE(kinds(items) == "UndefinedEnvironment ParsedText");
    CHECK(items[0].result.error().name == "nope");
    CHECK(items[1].result.value().text == "x");
}

TEST_CASE("begin without braces", "[environment]") {
    auto items = parse_env("\\begin x");
    REQUIRE(kinds(items) == "MissingBraces ParsedText");
    CHECK_FALSE(items[0].result.error().hint.empty());
}

TEST_CASE("unterminated environment keeps its body", "[environment]") {
    auto items = parse_env("\\begin{itemize}a {b");
    REQUIRE(kinds(items) == "UnterminatedGroup ParsedText Bgroup ParsedText UnterminatedGroup");
    const auto& env_err = items[0].result.error();
    CHECK(env_err.name == "itemize");
    CHECK(env_err.context.loc.column == 0);
    REQUIRE(env_err.group.has_value());
    CHECK(std::holds_alternative<EnvironmentGroup>(*env_err.group));
    CHECK(items[4].result.error().context.loc.column == 17);
}

TEST_CASE("unterminated raw environment", "[environment]") {
    auto items = parse_env("\\begin{verbatim}abc\ndef");
    REQUIRE(kinds(items) == "UnterminatedGroup");
    CHECK(items[0].result.error().name == "verbatim");
}

TEST_CASE("mismatched end is reported and scanning continues", "[environment]") {
    auto items = parse_env("\\begin{a}\\end{b}\\end{a}");
    REQUIRE(kinds(items) == "MismatchedEnvironmentEnd Environment");
    const auto& err = items[0].result.error();
    CHECK(err.name == "b");
    CHECK(err.context.loc.column == 9);
    REQUIRE(err.group.has_value());
    CHECK(describe(*err.group) == "environment 'a'");
}

TEST_CASE("end with no environment open", "[environment]") {
    auto items = parse_env("x\\end{a}y");
    REQUIRE(kinds(items) == "ParsedText UnexpectedEnvironmentEnd ParsedText");
    CHECK(items[1].result.error().name == "a");
}

TEST_CASE("close brace directly inside an environment", "[environment]") {
    auto items = parse_env("\\begin{a}}\\end{a}");
    REQUIRE(kinds(items) == "UnexpectedCloseBrace Environment");
    REQUIRE(items[0].result.error().group.has_value());
    CHECK(std::holds_alternative<EnvironmentGroup>(*items[0].result.error().group));
}

TEST_CASE("end inside an argument does not close the environment", "[environment]") {
    auto parser = Parser::from_text("\\begin{a}\\foo{\\end{a}}\\end{a}");
    REQUIRE(parser.define_environment("a", {}).is_ok());
    REQUIRE(parser.define_command("foo", {{ParameterFormat::Required, ParameterType::ParsedTokens}}).is_ok());
    auto items = parser.parse();
    REQUIRE(kinds(items) == "MismatchedEnvironmentEnd Environment");
    CHECK(describe(items[1].result.value()) == "Environment(a, [], [Command(foo, [Tokens([])])])");
}

// \foo takes one parsed argument; itemize has a parsed body
static std::vector<ParseItem> parse_env_argument(const std::string& src) {
    auto parser = Parser::from_text(src);
    REQUIRE(parser.define_command("foo",
        {{ParameterFormat::Required, ParameterType::ParsedTokens}}).is_ok());
    REQUIRE(parser.define_environment("itemize", {}).is_ok());
    return parser.parse();
}

TEST_CASE("environment as an unbraced command argument", "[environment]") {
    auto items = parse_env_argument("\\foo\\begin{itemize}x\\end{itemize}y");
    REQUIRE(kinds(items) == "Command ParsedText");
    CHECK(describe(items[0].result.value()) ==
          "Command(foo, [Environment(itemize, [], [ParsedText(\"x\")])])");
    CHECK(items[1].result.value().text == "y");
}

TEST_CASE("environment argument running into end of input fails the command", "[environment]") {
    auto items = parse_env_argument("\\foo\\begin{itemize}abc");
    REQUIRE(kinds(items) ==
            "UnterminatedGroup ParsedText UnexpectedEOFWhileParsingCommandArguments");
    CHECK(items[0].result.error().name == "itemize");
    CHECK(items[0].loc.column == 4);
    CHECK(items[1].result.value().text == "abc");

    const auto& err = items[2].result.error();
    CHECK(err.name == "foo");
    CHECK(err.parameter == 1);
    CHECK(err.context.loc.column == 0);
}

TEST_CASE("open group inside an environment argument at end of input", "[environment]") {
    auto items = parse_env_argument("\\foo\\begin{itemize}{abc");
    REQUIRE(kinds(items) == "UnterminatedGroup Bgroup ParsedText UnterminatedGroup "
                            "UnexpectedEOFWhileParsingCommandArguments");
    CHECK(items[0].result.error().name == "itemize");
    REQUIRE(items[3].result.error().group.has_value());
    CHECK(std::holds_alternative<BraceGroup>(*items[3].result.error().group));
    CHECK(items[4].result.error().name == "foo");
}

TEST_CASE("end as an unbraced command argument is the command's error", "[environment]") {
    auto items = parse_env_argument("\\foo\\end{itemize}z");
    REQUIRE(kinds(items) == "UnexpectedEnvironmentEnd ParsedText");
    CHECK(items[0].result.error().name == "itemize");
    CHECK(items[0].loc.column == 4);
}
