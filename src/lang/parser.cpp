#include <finl/lang/parser.hpp>
#include <finl/log.hpp>
#include <iterator>

namespace finl {

namespace {

// Counts one level of recursive argument or environment scanning
struct DepthGuard {
    size_t& depth;
    explicit DepthGuard(size_t& d) : depth(d) { ++depth; }
    ~DepthGuard() { --depth; }
};

ParseItem ok_item(Token token) {
    Location loc = token.loc;
    return ParseItem{Result<Token>::ok(std::move(token)), std::move(loc)};
}

ParseItem error_item(FinlError error) {
    Location loc = error.context.loc;
    return ParseItem{Result<Token>(std::move(error)), std::move(loc)};
}

ParseItem result_item(Result<Token> result) {
    if (result.is_err()) return error_item(std::move(result).error());
    return ok_item(std::move(result).value());
}

void append(std::vector<ParseItem>& out, std::vector<ParseItem>& items) {
    out.insert(out.end(), std::make_move_iterator(items.begin()),
               std::make_move_iterator(items.end()));
    items.clear();
}

// Moves the tokens out of `items`; errors go to `errors` in order.
std::vector<Token> take_tokens(std::vector<ParseItem>& items, std::vector<ParseItem>& errors) {
    std::vector<Token> tokens;
    tokens.reserve(items.size());
    for (auto& item : items) {
        if (item.result.is_ok()) {
            tokens.push_back(std::move(item.result).value());
        } else {
            errors.push_back(std::move(item));
        }
    }
    items.clear();
    return tokens;
}

std::string trim_ascii(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

Result<std::optional<Token>> present(Result<Token> token) {
    if (token.is_err()) return std::move(token).error();
    return Result<std::optional<Token>>::ok(std::move(token).value());
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Parser::Parser(std::unique_ptr<LineSource> source, std::string file,
               ParserConfig config, std::shared_ptr<Registry> registry)
    : cursor_(std::move(source), std::move(file)),
      registry_(registry ? std::move(registry) : std::make_shared<Registry>()),
      config_(std::move(config)) {
    handlers_[ParameterType::KeyValueList] = parse_key_value_list;
    handlers_[ParameterType::Math] = capture_math;
    cursor_.advance_line();
}

Parser Parser::from_text(const std::string& source, ParserConfig config) {
    std::string file = config.file_name;
    return Parser(std::make_unique<StringLineSource>(source), std::move(file), std::move(config));
}

Parser Parser::from_lines(std::vector<std::string> lines, const std::string& file,
                          ParserConfig config) {
    return Parser(std::make_unique<VectorLineSource>(std::move(lines)), file, std::move(config));
}

Parser Parser::from_source(std::unique_ptr<LineSource> source, const std::string& file,
                           ParserConfig config) {
    return Parser(std::move(source), file, std::move(config));
}

Status Parser::define_command(const std::string& name, std::vector<Parameter> parameters) {
    return registry_->define_command(name, std::move(parameters));
}

Status Parser::define_environment(const std::string& name, std::vector<Parameter> parameters,
                                  ParameterType body_type) {
    return registry_->define_environment(name, std::move(parameters), body_type);
}

Status Parser::set_argument_handler(ParameterType type, ArgumentHandler handler) {
    switch (type) {
        case ParameterType::ParsedTokens:
        case ParameterType::VerbatimText:
        case ParameterType::Boolean:
            return FinlError{FinlError::InvalidArg,
                std::string("parameter type '") + parameter_type_name(type) +
                    "' is converted by the parser and cannot take a handler"};
        default:
            break;
    }
    if (!handler) {
        handlers_.erase(type);
    } else {
        handlers_[type] = std::move(handler);
    }
    return ok_status();
}

std::vector<ParseItem> Parser::parse() {
    Output out;
    for (;;) {
        if (text_parse(out) == ScanEnd::EndOfInput) break;
    }
    for (const auto& group : stack_.take_from(0)) {
        out.push_back(error_item(unterminated(group)));
    }

    if (log::enabled(log::Debug)) {
        size_t errors = 0;
        for (const auto& item : out) {
            if (item.result.is_err()) ++errors;
        }
        log::debug("parsed %s: %zu items, %zu errors", cursor_.line().file.c_str(),
                   out.size(), errors);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Text scanner
// ---------------------------------------------------------------------------

Parser::ScanEnd Parser::text_parse(Output& out) {
    while (!cursor_.exhausted()) {
        if (cursor_.column() == 0) skip_inline_whitespace();
        size_t start = cursor_.column();

        while (auto c = cursor_.peek()) {
            switch (c->ch) {
                case U'\\':
                    push_text(out, start, c->column);
                    if (command_parse(out)) return ScanEnd::EndEnvironment;
                    start = cursor_.column();
                    break;

                case U'%':
                    push_text(out, start, c->column);
                    cursor_.advance_line();
                    return ScanEnd::Comment;

                case U'{':
                    push_text(out, start, c->column);
                    out.push_back(ok_item(Token::bgroup(cursor_.location(c->column))));
                    stack_.push(BraceGroup{}, cursor_.context(c->column));
                    cursor_.next();
                    start = cursor_.column();
                    break;

                case U'}': {
                    push_text(out, start, c->column);
                    auto top = stack_.pop();
                    if (top && std::holds_alternative<BraceGroup>(top->type)) {
                        out.push_back(ok_item(Token::egroup(cursor_.location(c->column))));
                    } else if (top && std::holds_alternative<RequiredArgumentGroup>(top->type)) {
                        cursor_.next();
                        return ScanEnd::CloseBrace;
                    } else {
                        std::optional<GroupType> group;
                        if (top) group = top->type;
                        out.push_back(error_item(unexpected_close_brace(c->column, group)));
                        if (top) stack_.push(std::move(*top));
                    }
                    cursor_.next();
                    start = cursor_.column();
                    break;
                }

                case U'[':
                    if (stack_.top_is<OptionalArgumentGroup>()) ++stack_.top()->nested_brackets;
                    cursor_.next();
                    break;

                case U']':
                    if (stack_.top_is<OptionalArgumentGroup>()) {
                        OpenGroup* top = stack_.top();
                        if (top->nested_brackets == 0) {
                            push_text(out, start, c->column);
                            stack_.pop();
                            cursor_.next();
                            return ScanEnd::CloseBracket;
                        }
                        --top->nested_brackets;
                    }
                    cursor_.next();
                    break;

                default:
                    cursor_.next();
                    break;
            }
        }

        // Text runs stop at the line end; the line end itself is not a token
        push_text(out, start, cursor_.line().contents.size());
        cursor_.advance_line();
    }
    return ScanEnd::EndOfInput;
}

bool Parser::scan_until(Output& out, ScanEnd closer) {
    DepthGuard guard(depth_);
    for (;;) {
        ScanEnd end = text_parse(out);
        if (end == closer) return true;
        if (end == ScanEnd::EndOfInput) return false;
    }
}

void Parser::push_text(Output& out, size_t start, size_t end) {
    if (start < end) {
        out.push_back(ok_item(Token::parsed_text(cursor_.location(start), cursor_.slice(start, end))));
    }
}

void Parser::skip_inline_whitespace() {
    while (auto c = cursor_.peek()) {
        if (!is_whitespace(c->ch)) break;
        cursor_.next();
    }
}

// Skips whitespace and comments up to the next argument, crossing line ends.
// A line holding only whitespace is a paragraph break.
Parser::SkipOutcome Parser::skip_whitespace() {
    bool fresh_line = false;
    for (;;) {
        auto c = cursor_.peek();
        if (!c) {
            if (fresh_line) return SkipOutcome::FoundBlankLine;
            if (!cursor_.advance_line()) return SkipOutcome::EndOfFile;
            fresh_line = true;
            continue;
        }
        if (c->ch == U'%') {
            cursor_.skip_to_eol();
            fresh_line = false;
            continue;
        }
        if (!is_whitespace(c->ch)) return SkipOutcome::Skipped;
        cursor_.next();
    }
}

// ---------------------------------------------------------------------------
// Command dispatcher
// ---------------------------------------------------------------------------

std::string Parser::Invocation::label() const {
    return environment ? "environment '" + name + "'" : "'\\" + name + "'";
}

bool Parser::command_parse(Output& out) {
    Invocation inv = read_invocation();

    if (inv.name == "end") {
        auto error = end_environment(inv);
        if (!error) return true;
        out.push_back(error_item(std::move(*error)));
        return false;
    }

    Output hoisted;
    auto result = invoke(inv, hoisted);
    append(out, hoisted);
    if (result) out.push_back(result_item(std::move(*result)));
    return false;
}

// Consumes the backslash and the command name
Parser::Invocation Parser::read_invocation() {
    Invocation inv;
    inv.where = cursor_.context(cursor_.column());
    cursor_.next();
    inv.name = read_command_name(true);
    return inv;
}

std::optional<Result<Token>> Parser::invoke(const Invocation& inv, Output& hoisted) {
    if (inv.name == "begin") return begin_environment(inv, hoisted);

    auto command = registry_->lookup_command(inv.name);
    if (!command) {
        return Result<Token>(make_error(FinlError::UndefinedCommand,
            "undefined command '\\" + inv.name + "'", inv, 0));
    }

    if (log::enabled(log::Trace)) {
        log::trace("command \\%s at %s", inv.name.c_str(), inv.where.loc.to_string().c_str());
    }

    std::vector<Token> args;
    auto status = resolve_parameters(inv, command->parameters, args, hoisted);
    if (status.is_err()) return Result<Token>(std::move(status).error());
    return Result<Token>::ok(Token::invocation(inv.where.loc, command, std::move(args)));
}

// A run of letters, or exactly one other code point. A backslash at the end
// of a line names the command " ".
std::string Parser::read_command_name(bool skip_trailing_space) {
    auto c = cursor_.peek();
    if (!c) return " ";

    size_t begin = c->column;
    if (!is_letter(c->ch)) {
        cursor_.next();
        return cursor_.slice(begin, cursor_.column());
    }

    while (auto l = cursor_.peek()) {
        if (!is_letter(l->ch)) break;
        cursor_.next();
    }
    std::string name = cursor_.slice(begin, cursor_.column());
    if (skip_trailing_space) skip_inline_whitespace();
    return name;
}

Status Parser::resolve_parameters(const Invocation& inv, const std::vector<Parameter>& parameters,
                                  std::vector<Token>& args, Output& hoisted) {
    int number = 0;
    for (const auto& parameter : parameters) {
        ++number;
        auto arg = resolve_argument(inv, number, parameter, hoisted);
        if (arg.is_err()) return std::move(arg).error();
        if (arg.value()) args.push_back(std::move(*arg.value()));
    }
    return ok_status();
}

Result<std::optional<Token>> Parser::resolve_argument(const Invocation& inv, int number,
                                                      const Parameter& parameter, Output& hoisted) {
    using Arg = Result<std::optional<Token>>;
    const ParameterFormat format = parameter.first;
    const ParameterType type = parameter.second;

    if (format == ParameterFormat::Star) {
        auto c = cursor_.peek();
        Location loc = cursor_.location();
        bool starred = c && c->ch == U'*';
        if (starred) cursor_.next();
        return Arg::ok(Token::boolean(std::move(loc), starred));
    }
    if (format == ParameterFormat::ArbitraryDelimiters) {
        return present(delimited_argument(inv, number, type));
    }

    switch (skip_whitespace()) {
        case SkipOutcome::Skipped:
            break;
        case SkipOutcome::FoundBlankLine:
            return make_error(FinlError::BlankLineWhileParsingCommandArguments,
                "blank line while looking for argument " + std::to_string(number) +
                    " of " + inv.label(), inv, number);
        case SkipOutcome::EndOfFile:
            return make_error(FinlError::UnexpectedEOFWhileParsingCommandArguments,
                "end of input while looking for argument " + std::to_string(number) +
                    " of " + inv.label(), inv, number);
    }

    auto c = *cursor_.peek();
    if (format == ParameterFormat::Optional) {
        if (c.ch != U'[') return Arg::ok(std::nullopt);
        return present(bracket_argument(inv, number, type, hoisted));
    }
    if (c.ch == U'{') return present(brace_argument(inv, number, type, hoisted));

    if (format == ParameterFormat::RequiredWithBraces) {
        return make_error(FinlError::MissingBraces,
            "argument " + std::to_string(number) + " of " + inv.label() +
                " must be enclosed in braces", inv, number);
    }
    if (c.ch == U'}') {
        auto error = make_error(FinlError::UnexpectedCloseBrace,
            "unexpected '}' where argument " + std::to_string(number) + " of " +
                inv.label() + " was expected", inv, number);
        if (auto top = stack_.top()) error.group = top->type;
        return error;
    }
    return present(single_token_argument(inv, number, type, hoisted));
}

Result<Token> Parser::brace_argument(const Invocation& inv, int number, ParameterType type,
                                     Output& hoisted) {
    const size_t open = cursor_.column();
    if (type == ParameterType::ParsedTokens && depth_ >= config_.max_nesting_depth) {
        return nesting_too_deep(inv, number);
    }

    Location loc = cursor_.location(open);
    const size_t level = stack_.size();
    stack_.push(RequiredArgumentGroup{}, cursor_.context(open));
    cursor_.next();

    if (type != ParameterType::ParsedTokens) {
        Location content_loc = cursor_.location();
        auto text = capture_raw(inv, number, U'}');
        stack_.take_from(level);
        if (text.is_err()) return std::move(text).error();
        return convert_span(inv, number, type,
                            ArgumentSpan{std::move(text).value(), content_loc, inv.name, number});
    }

    Output content;
    if (!scan_until(content, ScanEnd::CloseBrace)) {
        stack_.take_from(level);
        append(hoisted, content);
        return make_error(FinlError::UnexpectedEOFWhileParsingCommandArguments,
            "end of input inside argument " + std::to_string(number) + " of " + inv.label(),
            inv, number);
    }
    return Result<Token>::ok(Token::tokens(loc, take_tokens(content, hoisted)));
}

Result<Token> Parser::bracket_argument(const Invocation& inv, int number, ParameterType type,
                                       Output& hoisted) {
    const size_t open = cursor_.column();
    if (type == ParameterType::ParsedTokens && depth_ >= config_.max_nesting_depth) {
        return nesting_too_deep(inv, number);
    }

    Location loc = cursor_.location(open);
    const size_t level = stack_.size();
    stack_.push(OptionalArgumentGroup{}, cursor_.context(open));
    cursor_.next();

    if (type != ParameterType::ParsedTokens) {
        Location content_loc = cursor_.location();
        auto text = capture_raw(inv, number, U']');
        stack_.take_from(level);
        if (text.is_err()) return std::move(text).error();
        return convert_span(inv, number, type,
                            ArgumentSpan{std::move(text).value(), content_loc, inv.name, number});
    }

    Output content;
    if (!scan_until(content, ScanEnd::CloseBracket)) {
        stack_.take_from(level);
        append(hoisted, content);
        return make_error(FinlError::UnexpectedEOFWhileParsingCommandArguments,
            "end of input inside optional argument " + std::to_string(number) + " of " +
                inv.label(), inv, number);
    }
    return Result<Token>::ok(Token::tokens(loc, take_tokens(content, hoisted)));
}

// An argument without braces: one complete command invocation, or one code point.
Result<Token> Parser::single_token_argument(const Invocation& inv, int number, ParameterType type,
                                            Output& hoisted) {
    const Char c = *cursor_.peek();
    Location loc = cursor_.location(c.column);

    if (c.ch == U'\\' && type == ParameterType::ParsedTokens) {
        if (depth_ >= config_.max_nesting_depth) return nesting_too_deep(inv, number);

        const size_t level = stack_.size();
        stack_.push(RequiredArgumentGroup{}, cursor_.context(c.column));
        Invocation nested = read_invocation();
        std::optional<Result<Token>> result;
        {
            DepthGuard guard(depth_);
            if (nested.name == "end") {
                // The argument group is innermost, so \end cannot close anything
                if (auto error = end_environment(nested)) result = Result<Token>(std::move(*error));
            } else {
                result = invoke(nested, hoisted);
            }
        }
        stack_.take_from(level);

        if (!result) {
            return make_error(FinlError::UnexpectedEOFWhileParsingCommandArguments,
                "end of input inside argument " + std::to_string(number) + " of " +
                    inv.label(), inv, number);
        }
        return std::move(*result);
    }

    cursor_.next();
    if (c.ch == U'\\') {
        // Non-token types take the control sequence verbatim
        read_command_name(false);
    }
    std::string text = cursor_.slice(c.column, cursor_.column());
    if (type == ParameterType::ParsedTokens) {
        return Result<Token>::ok(Token::parsed_text(std::move(loc), std::move(text)));
    }
    return convert_span(inv, number, type, ArgumentSpan{std::move(text), loc, inv.name, number});
}

Result<Token> Parser::delimited_argument(const Invocation& inv, int number, ParameterType type) {
    auto c = cursor_.peek();
    if (!c) {
        if (cursor_.exhausted()) {
            return make_error(FinlError::UnexpectedEOFWhileParsingCommandArguments,
                "end of input while looking for argument " + std::to_string(number) +
                    " of " + inv.label(), inv, number);
        }
        return make_error(FinlError::UnterminatedDelimitedArgument,
            "argument " + std::to_string(number) + " of " + inv.label() +
                " has no delimiter before the end of the line", inv, number);
    }

    const std::string delimiter = cursor_.slice(c->column, c->column + c->width);
    const size_t level = stack_.size();
    stack_.push(DelimiterGroup{delimiter}, cursor_.context(c->column));
    cursor_.next();

    Location content_loc = cursor_.location();
    const size_t close = cursor_.find(delimiter);
    stack_.take_from(level);
    if (close == std::string::npos) {
        return make_error(FinlError::UnterminatedDelimitedArgument,
            "argument " + std::to_string(number) + " of " + inv.label() +
                " is missing its closing '" + delimiter + "'", inv, number);
    }

    std::string text = cursor_.slice(cursor_.column(), close);
    cursor_.seek(close + delimiter.size());
    if (type == ParameterType::ParsedTokens) {
        return make_error(FinlError::Unimplemented,
            "delimited argument " + std::to_string(number) + " of " + inv.label() +
                " cannot be parsed as tokens", inv, number);
    }
    return convert_span(inv, number, type,
                        ArgumentSpan{std::move(text), content_loc, inv.name, number});
}

// Collects raw text up to `closer` outside nested braces. Escapes are kept
// as written; line ends become '\n'.
Result<std::string> Parser::capture_raw(const Invocation& inv, int number, char32_t closer) {
    std::string text;
    int depth = 0;
    for (;;) {
        auto c = cursor_.peek();
        if (!c) {
            if (!cursor_.advance_line()) {
                return make_error(FinlError::UnexpectedEOFWhileParsingCommandArguments,
                    "end of input inside argument " + std::to_string(number) + " of " +
                        inv.label(), inv, number);
            }
            text += '\n';
            continue;
        }

        const size_t begin = c->column;
        cursor_.next();
        if (c->ch == U'\\') {
            cursor_.next();
        } else if (c->ch == closer && depth == 0) {
            return Result<std::string>::ok(std::move(text));
        } else if (c->ch == U'{') {
            ++depth;
        } else if (c->ch == U'}' && depth > 0) {
            --depth;
        }
        text += cursor_.slice(begin, cursor_.column());
    }
}

Result<Token> Parser::convert_span(const Invocation& inv, int number, ParameterType type,
                                   ArgumentSpan span) {
    switch (type) {
        case ParameterType::ParsedTokens:
            return make_error(FinlError::Unimplemented,
                "argument " + std::to_string(number) + " of " + inv.label() +
                    " cannot be parsed as tokens here", inv, number);
        case ParameterType::VerbatimText:
            return Result<Token>::ok(Token::raw_text(span.loc, std::move(span.text)));
        case ParameterType::Boolean: {
            auto value = parse_boolean(span.text);
            if (value.is_err()) return attribute(std::move(value).error(), inv, number);
            return Result<Token>::ok(Token::boolean(span.loc, value.value()));
        }
        default:
            break;
    }

    auto it = handlers_.find(type);
    if (it == handlers_.end()) {
        return make_error(FinlError::Unimplemented,
            std::string("no handler for ") + parameter_type_name(type) + " arguments (" +
                (number > 0 ? "argument " + std::to_string(number) + " of " : "body of ") +
                inv.label() + ")", inv, number);
    }

    auto token = it->second(span, *registry_);
    if (token.is_err()) return attribute(std::move(token).error(), inv, number);
    return token;
}

// ---------------------------------------------------------------------------
// Environments
// ---------------------------------------------------------------------------

Result<std::string> Parser::read_environment_name(const Invocation& inv) {
    switch (skip_whitespace()) {
        case SkipOutcome::Skipped:
            break;
        case SkipOutcome::FoundBlankLine:
            return make_error(FinlError::BlankLineWhileParsingCommandArguments,
                "blank line while looking for the environment name of '\\" + inv.name + "'",
                inv, 1);
        case SkipOutcome::EndOfFile:
            return make_error(FinlError::UnexpectedEOFWhileParsingCommandArguments,
                "end of input while looking for the environment name of '\\" + inv.name + "'",
                inv, 1);
    }

    auto c = *cursor_.peek();
    if (c.ch != U'{') {
        auto error = make_error(FinlError::MissingBraces,
            "'\\" + inv.name + "' must be followed by an environment name in braces", inv, 1);
        error.hint = "write \\" + inv.name + "{name}";
        return error;
    }

    const size_t level = stack_.size();
    stack_.push(RequiredArgumentGroup{}, cursor_.context(c.column));
    cursor_.next();
    auto name = capture_raw(inv, 1, U'}');
    stack_.take_from(level);
    if (name.is_err()) return name;
    return Result<std::string>::ok(trim_ascii(name.value()));
}

std::optional<Result<Token>> Parser::begin_environment(const Invocation& inv, Output& hoisted) {
    auto name = read_environment_name(inv);
    if (name.is_err()) return Result<Token>(std::move(name).error());

    auto env = registry_->lookup_environment(name.value());
    if (!env) {
        auto error = make_error(FinlError::UndefinedEnvironment,
            "undefined environment '" + name.value() + "'", inv, 0);
        error.name = name.value();
        return Result<Token>(std::move(error));
    }

    Invocation env_inv{env->name, inv.where, true};
    if (log::enabled(log::Trace)) {
        log::trace("begin %s at %s", env->name.c_str(), inv.where.loc.to_string().c_str());
    }

    std::vector<Token> args;
    auto status = resolve_parameters(env_inv, env->parameters, args, hoisted);
    if (status.is_err()) return Result<Token>(std::move(status).error());

    const size_t level = stack_.size();

    if (env->body_type == ParameterType::ParsedTokens) {
        if (depth_ >= config_.max_nesting_depth) {
            return Result<Token>(nesting_too_deep(env_inv, 0));
        }
        stack_.push(EnvironmentGroup{env}, inv.where);

        Output body;
        if (!scan_until(body, ScanEnd::EndEnvironment)) {
            // The environment itself first, then whatever its body produced,
            // then the groups left open inside it
            auto leftovers = stack_.take_from(level);
            hoisted.push_back(error_item(unterminated(leftovers.front())));
            append(hoisted, body);
            for (size_t i = 1; i < leftovers.size(); ++i) {
                hoisted.push_back(error_item(unterminated(leftovers[i])));
            }
            return std::nullopt;
        }

        auto tokens = take_tokens(body, hoisted);
        return Result<Token>::ok(Token::environment_block(inv.where.loc, env, std::move(args),
                                                          std::move(tokens)));
    }

    stack_.push(EnvironmentGroup{env}, inv.where);
    Location body_loc = cursor_.location();
    auto text = capture_environment_body(env->name);
    auto leftovers = stack_.take_from(level);
    if (!text) return Result<Token>(unterminated(leftovers.front()));

    auto body = convert_span(env_inv, 0, env->body_type,
                             ArgumentSpan{std::move(*text), body_loc, env->name, 0});
    if (body.is_err()) return Result<Token>(std::move(body).error());

    std::vector<Token> tokens;
    tokens.push_back(std::move(body).value());
    return Result<Token>::ok(Token::environment_block(inv.where.loc, env, std::move(args),
                                                      std::move(tokens)));
}

std::optional<FinlError> Parser::end_environment(const Invocation& inv) {
    auto name = read_environment_name(inv);
    if (name.is_err()) return std::move(name).error();
    const std::string& n = name.value();

    if (stack_.top_is<EnvironmentGroup>()) {
        const auto& open = std::get<EnvironmentGroup>(stack_.top()->type);
        if (open.environment && open.environment->name == n) {
            stack_.pop();
            if (log::enabled(log::Trace)) {
                log::trace("end %s at %s", n.c_str(), inv.where.loc.to_string().c_str());
            }
            return std::nullopt;
        }
    }

    if (stack_.has_environment()) {
        const OpenGroup* top = stack_.top();
        auto error = make_error(FinlError::MismatchedEnvironmentEnd,
            "'\\end{" + n + "}' does not match the open " + describe(top->type), inv, 0);
        error.name = n;
        error.group = top->type;
        return error;
    }

    auto error = make_error(FinlError::UnexpectedEnvironmentEnd,
        "'\\end{" + n + "}' without a matching '\\begin{" + n + "}'", inv, 0);
    error.name = n;
    return error;
}

// Raw body up to the literal "\end{name}", which is consumed.
// nullopt when the input ends first.
std::optional<std::string> Parser::capture_environment_body(const std::string& name) {
    const std::string closer = "\\end{" + name + "}";
    std::string text;
    for (;;) {
        size_t at = cursor_.find(closer);
        if (at != std::string::npos) {
            text += cursor_.slice(cursor_.column(), at);
            cursor_.seek(at + closer.size());
            return text;
        }
        text += cursor_.slice(cursor_.column(), cursor_.line().contents.size());
        if (!cursor_.advance_line()) return std::nullopt;
        text += '\n';
    }
}

// ---------------------------------------------------------------------------
// Diagnostics
// ---------------------------------------------------------------------------

FinlError Parser::make_error(FinlError::Code code, std::string message,
                             const Invocation& inv, int number) const {
    FinlError error{code, std::move(message), inv.where};
    error.name = inv.name;
    error.parameter = number;
    return error;
}

// Gives a converter's error the invocation's location and names
FinlError Parser::attribute(FinlError error, const Invocation& inv, int number) const {
    if (!error.has_location()) error.context = inv.where;
    if (error.name.empty()) error.name = inv.name;
    if (error.parameter == 0) error.parameter = number;
    error.message = (number > 0 ? "argument " + std::to_string(number) + " of "
                                : std::string("body of ")) +
                    inv.label() + ": " + error.message;
    return error;
}

FinlError Parser::nesting_too_deep(const Invocation& inv, int number) const {
    auto error = make_error(FinlError::NestingTooDeep,
        "nesting deeper than " + std::to_string(config_.max_nesting_depth) +
            " levels in " + inv.label(), inv, number);
    error.hint = "raise parser.max-nesting-depth if the input is legitimate";
    return error;
}

FinlError Parser::unexpected_close_brace(size_t column, std::optional<GroupType> group) const {
    std::string message = group ? "unexpected '}' inside " + describe(*group)
                                : std::string("unexpected '}' with no open group");
    FinlError error{FinlError::UnexpectedCloseBrace, std::move(message), cursor_.context(column)};
    error.group = std::move(group);
    return error;
}

FinlError Parser::unterminated(const OpenGroup& group) {
    FinlError error{FinlError::UnterminatedGroup, "unterminated " + describe(group.type),
                    group.opened_at};
    if (auto env = std::get_if<EnvironmentGroup>(&group.type)) {
        if (env->environment) {
            error.name = env->environment->name;
            error.hint = "add \\end{" + env->environment->name + "}";
        }
    }
    error.group = group.type;
    return error;
}

} // namespace finl
