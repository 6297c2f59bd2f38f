#include <catch2/catch.hpp>
#include <finl/config.hpp>
#include <fstream>
#include <cstdlib>

using namespace finl;

static std::string fixture_dir() {
    const char* src = std::getenv("FINL_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

// ===== Parsing =====

TEST_CASE("parse config with parser section", "[config]") {
    auto r = Config::parse(R"(
[parser]
max-nesting-depth = 64
file-name = "doc.tex"
)");
    REQUIRE(r.is_ok());
    CHECK(r.value().parser.max_nesting_depth == 64);
    CHECK(r.value().parser.file_name == "doc.tex");
    CHECK(r.value().max_nesting_depth_set);
}

TEST_CASE("parse config with definitions", "[config]") {
    auto r = Config::parse(R"(
[commands.emph]
parameters = [["required", "parsed_tokens"]]

[commands.section]
parameters = [["star"], ["optional"], ["required"]]

[environments.lstlisting]
parameters = [["optional", "key_value_list"]]
body = "verbatim_text"
)");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    REQUIRE(cfg.commands.count("section") == 1);

    const auto& section = cfg.commands.at("section");
    REQUIRE(section.size() == 3);
    CHECK(section[0] == Parameter{ParameterFormat::Star, ParameterType::Boolean});
    CHECK(section[1] == Parameter{ParameterFormat::Optional, ParameterType::ParsedTokens});
    CHECK(section[2] == Parameter{ParameterFormat::Required, ParameterType::ParsedTokens});

    const auto& listing = cfg.environments.at("lstlisting");
    CHECK(listing.body_type == ParameterType::VerbatimText);
    REQUIRE(listing.parameters.size() == 1);
    CHECK(listing.parameters[0].second == ParameterType::KeyValueList);
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    CHECK(r.value().commands.empty());
    CHECK(r.value().parser.max_nesting_depth == 128);
    CHECK_FALSE(r.value().log_level.has_value());
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    CHECK(r.error().code == FinlError::Config);
}

TEST_CASE("unknown parameter names are rejected", "[config]") {
    auto bad_format = Config::parse(R"(
[commands.x]
parameters = [["sometimes"]]
)");
    REQUIRE(bad_format.is_err());
    CHECK(bad_format.error().message.find("sometimes") != std::string::npos);

    auto bad_type = Config::parse(R"(
[environments.x]
body = "html"
)");
    REQUIRE(bad_type.is_err());
    CHECK(bad_type.error().code == FinlError::Config);
}

TEST_CASE("malformed parameter lists are rejected", "[config]") {
    CHECK(Config::parse("[commands.x]\nparameters = \"required\"\n").is_err());
    CHECK(Config::parse("[commands.x]\nparameters = [[]]\n").is_err());
    CHECK(Config::parse("[commands.x]\nparameters = [[\"required\", \"math\", \"x\"]]\n").is_err());
    CHECK(Config::parse("[commands.x]\nparameters = [[1]]\n").is_err());
    CHECK(Config::parse("[parser]\nmax-nesting-depth = 0\n").is_err());
}

TEST_CASE("log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = false
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level.has_value());
    CHECK(*r.value().log_level == log::Debug);
    CHECK(r.value().log_color == std::optional<bool>(false));

    auto bad = Config::parse("[log]\nlevel = \"loud\"\n");
    REQUIRE(bad.is_err());
    CHECK_FALSE(bad.error().hint.empty());
}

TEST_CASE("apply_logging sets the log level", "[config]") {
    auto r = Config::parse("[log]\nlevel = \"error\"\n");
    REQUIRE(r.is_ok());
    r.value().apply_logging();
    CHECK(log::get_level() == log::Error);
    log::set_level(log::Warn);
}

TEST_CASE("parameter name lookups", "[config]") {
    CHECK(parse_parameter_format("required_with_braces").value() == ParameterFormat::RequiredWithBraces);
    CHECK(parse_parameter_type("macro_definition").value() == ParameterType::MacroDefinition);
    CHECK(parse_parameter_format("Required").has_code(FinlError::Config));
}

// ===== Merge =====

TEST_CASE("merge overrides explicitly set fields", "[config]") {
    auto base = Config::parse(R"(
[parser]
max-nesting-depth = 10
file-name = "base.tex"

[commands.a]
parameters = []

[commands.b]
parameters = []
)");
    auto over = Config::parse(R"(
[parser]
max-nesting-depth = 20

[commands.b]
parameters = [["required"]]
)");
    REQUIRE(base.is_ok());
    REQUIRE(over.is_ok());

    auto cfg = base.value();
    cfg.merge(over.value());
    CHECK(cfg.parser.max_nesting_depth == 20);
    CHECK(cfg.parser.file_name == "base.tex");
    CHECK(cfg.commands.at("a").empty());
    CHECK(cfg.commands.at("b").size() == 1);
}

// ===== Apply =====

TEST_CASE("apply installs definitions into a parser", "[config]") {
    auto r = Config::parse(R"(
[commands.emph]
parameters = [["required"]]

[environments.quote]
)");
    REQUIRE(r.is_ok());

    auto parser = Parser::from_text("\\begin{quote}\\emph{x}\\end{quote}");
    REQUIRE(r.value().apply(parser).is_ok());
    CHECK(parser.registry().command_count() == 1);
    CHECK(parser.registry().environment_count() == 1);

    auto items = parser.parse();
    REQUIRE(items.size() == 1);
    REQUIRE(items[0].result.is_ok());
    CHECK(describe(items[0].result.value()) ==
          "Environment(quote, [], [Command(emph, [Tokens([ParsedText(\"x\")])])])");
}

TEST_CASE("apply reports a rejected definition", "[config]") {
    auto r = Config::parse("[commands.begin]\nparameters = []\n");
    REQUIRE(r.is_ok());
    auto parser = Parser::from_text("");
    auto status = r.value().apply(parser);
    REQUIRE(status.is_err());
    CHECK(status.error().code == FinlError::InvalidArg);
}

// ===== Files =====

TEST_CASE("load missing config file", "[config]") {
    auto r = Config::load(fixture_dir() + "/does_not_exist.toml");
    REQUIRE(r.is_err());
    CHECK(r.error().code == FinlError::IO);
}

TEST_CASE("load fixture config and parse fixture document", "[config]") {
    auto r = Config::load(fixture_dir() + "/article.toml");
    REQUIRE(r.is_ok());
    const auto& cfg = r.value();
    CHECK(cfg.parser.max_nesting_depth == 32);

    auto path = fixture_dir() + "/article.tex";
    auto in = std::make_unique<std::ifstream>(path);
    REQUIRE(in->is_open());
    auto parser = Parser::from_source(std::make_unique<StreamLineSource>(std::move(in)),
                                      path, cfg.parser);
    REQUIRE(cfg.apply(parser).is_ok());
    CHECK(parser.config().max_nesting_depth == 32);

    auto items = parser.parse();
    std::vector<std::string> names;
    for (const auto& item : items) {
        INFO((item.result.is_err() ? item.result.error().format() : std::string()));
        REQUIRE(item.result.is_ok());
        const auto& tok = item.result.value();
        if (tok.kind == TokenKind::Command || tok.kind == TokenKind::Environment) {
            names.push_back(tok.name());
        }
    }
    CHECK(names == std::vector<std::string>{
        "section", "emph", "verb", "itemize", "includegraphics", "verbatim"});
    CHECK(items.front().loc.line == 2);
    CHECK(items.back().loc.line == 10);
}
