#pragma once

#include <finl/lang/command.hpp>
#include <finl/lang/location.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace finl {

enum class TokenKind {
    ParsedText,    // literal text run
    RawText,       // verbatim argument content
    Math,          // math content, not tokenized
    Bgroup,        // {
    Egroup,        // }
    Command,       // resolved command invocation
    Environment,   // \begin{..} ... \end{..}
    Tokens,        // nested token sequence (braced or bracketed argument)
    Boolean,       // star flag or boolean argument
    KeyValueList   // key=value pairs
};

// One unit of parser output. Owns its text and child tokens; definitions are
// shared with the registry.
struct Token {
    TokenKind kind = TokenKind::ParsedText;
    Location loc;

    std::string text;   // ParsedText, RawText, Math
    bool flag = false;  // Boolean

    std::shared_ptr<const CommandDef> command;
    std::shared_ptr<const EnvironmentDef> environment;

    // Arguments of a Command/Environment; items of a Tokens sequence
    std::vector<Token> children;
    // Body of an Environment
    std::vector<Token> body;

    std::vector<std::pair<std::string, std::string>> pairs;  // KeyValueList

    static Token parsed_text(Location loc, std::string text);
    static Token raw_text(Location loc, std::string text);
    static Token math(Location loc, std::string text);
    static Token bgroup(Location loc);
    static Token egroup(Location loc);
    static Token boolean(Location loc, bool value);
    static Token tokens(Location loc, std::vector<Token> items);
    static Token key_value_list(Location loc,
                                std::vector<std::pair<std::string, std::string>> pairs);
    static Token invocation(Location loc, std::shared_ptr<const CommandDef> def,
                            std::vector<Token> args);
    static Token environment_block(Location loc, std::shared_ptr<const EnvironmentDef> def,
                                   std::vector<Token> args, std::vector<Token> body);

    // Name of the command or environment, empty for other kinds
    const std::string& name() const;
};

const char* token_kind_name(TokenKind k);

// Debug rendering, e.g. Command(foo, [Tokens([ParsedText("a")])])
std::string describe(const Token& token);
std::string describe(const std::vector<Token>& tokens);

// Renders text, raw text and group tokens back to source. Tokens from
// different source lines are separated by a newline. Commands render as
// their bare name: they cannot be reproduced without their definitions.
std::string to_source(const std::vector<Token>& tokens);

} // namespace finl
