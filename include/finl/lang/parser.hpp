#pragma once

#include <finl/lang/argument.hpp>
#include <finl/lang/command.hpp>
#include <finl/lang/cursor.hpp>
#include <finl/lang/group.hpp>
#include <finl/lang/registry.hpp>
#include <finl/lang/token.hpp>
#include <finl/result.hpp>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace finl {

struct ParserConfig {
    // Bound on recursive argument / environment nesting
    size_t max_nesting_depth = 128;
    // File identifier used by Parser::from_text
    std::string file_name = "<string>";
};

// One entry of the output stream: a token or an error, with its location
struct ParseItem {
    Result<Token> result;
    Location loc;
};

// Tokenizer for TeX-like markup. Text runs, brace groups, comments and
// command invocations are resolved in a single recursive pass; errors are
// interleaved with tokens in source order and never stop the parse.
class Parser {
public:
    Parser(std::unique_ptr<LineSource> source, std::string file,
           ParserConfig config = {}, std::shared_ptr<Registry> registry = nullptr);

    static Parser from_text(const std::string& source, ParserConfig config = {});
    static Parser from_lines(std::vector<std::string> lines, const std::string& file,
                             ParserConfig config = {});
    static Parser from_source(std::unique_ptr<LineSource> source, const std::string& file,
                              ParserConfig config = {});

    Status define_command(const std::string& name, std::vector<Parameter> parameters);
    Status define_environment(const std::string& name, std::vector<Parameter> parameters,
                              ParameterType body_type = ParameterType::ParsedTokens);

    // Installs the converter for KeyValueList, MacroDefinition, Math or YAML
    // arguments. The other types are handled by the scanner itself.
    Status set_argument_handler(ParameterType type, ArgumentHandler handler);

    void set_max_nesting_depth(size_t depth) { config_.max_nesting_depth = depth; }
    const ParserConfig& config() const { return config_; }

    Registry& registry() { return *registry_; }
    std::shared_ptr<Registry> shared_registry() const { return registry_; }

    // Drains the remaining input
    std::vector<ParseItem> parse();

private:
    using Output = std::vector<ParseItem>;

    // Why a text scan stopped
    enum class ScanEnd { EndOfInput, Comment, CloseBrace, CloseBracket, EndEnvironment };
    enum class SkipOutcome { Skipped, FoundBlankLine, EndOfFile };

    // The command or environment whose arguments are being resolved
    struct Invocation {
        std::string name;
        ErrorContext where;
        bool environment = false;

        std::string label() const;
    };

    // -- Scanner -------------------------------------------------------------
    ScanEnd text_parse(Output& out);
    bool scan_until(Output& out, ScanEnd closer);
    void push_text(Output& out, size_t start, size_t end);
    void skip_inline_whitespace();
    SkipOutcome skip_whitespace();

    // -- Dispatcher ----------------------------------------------------------
    // Returns true when an \end closed the innermost environment
    bool command_parse(Output& out);
    Invocation read_invocation();
    // The token or error of one \begin or command invocation. nullopt when
    // an environment body ran into the end of input; its diagnostics and
    // body are then already in `hoisted`.
    std::optional<Result<Token>> invoke(const Invocation& inv, Output& hoisted);
    std::string read_command_name(bool skip_trailing_space);
    Status resolve_parameters(const Invocation& inv, const std::vector<Parameter>& parameters,
                              std::vector<Token>& args, Output& hoisted);
    Result<std::optional<Token>> resolve_argument(const Invocation& inv, int number,
                                                  const Parameter& parameter, Output& hoisted);
    Result<Token> brace_argument(const Invocation& inv, int number, ParameterType type,
                                 Output& hoisted);
    Result<Token> bracket_argument(const Invocation& inv, int number, ParameterType type,
                                   Output& hoisted);
    Result<Token> single_token_argument(const Invocation& inv, int number, ParameterType type,
                                        Output& hoisted);
    Result<Token> delimited_argument(const Invocation& inv, int number, ParameterType type);
    Result<std::string> capture_raw(const Invocation& inv, int number, char32_t closer);
    Result<Token> convert_span(const Invocation& inv, int number, ParameterType type,
                               ArgumentSpan span);

    // -- Environments --------------------------------------------------------
    Result<std::string> read_environment_name(const Invocation& inv);
    std::optional<Result<Token>> begin_environment(const Invocation& inv, Output& hoisted);
    // nullopt when the innermost environment was closed
    std::optional<FinlError> end_environment(const Invocation& inv);
    std::optional<std::string> capture_environment_body(const std::string& name);

    // -- Diagnostics ---------------------------------------------------------
    FinlError make_error(FinlError::Code code, std::string message,
                         const Invocation& inv, int number) const;
    FinlError attribute(FinlError error, const Invocation& inv, int number) const;
    FinlError nesting_too_deep(const Invocation& inv, int number) const;
    FinlError unexpected_close_brace(size_t column, std::optional<GroupType> group) const;
    static FinlError unterminated(const OpenGroup& group);

    Cursor cursor_;
    GroupStack stack_;
    std::shared_ptr<Registry> registry_;
    std::unordered_map<ParameterType, ArgumentHandler> handlers_;
    ParserConfig config_;
    size_t depth_ = 0;
};

} // namespace finl
