#include <finl/lang/token.hpp>

namespace finl {

Token Token::parsed_text(Location loc, std::string text) {
    Token t;
    t.kind = TokenKind::ParsedText;
    t.loc = std::move(loc);
    t.text = std::move(text);
    return t;
}

Token Token::raw_text(Location loc, std::string text) {
    Token t;
    t.kind = TokenKind::RawText;
    t.loc = std::move(loc);
    t.text = std::move(text);
    return t;
}

Token Token::math(Location loc, std::string text) {
    Token t;
    t.kind = TokenKind::Math;
    t.loc = std::move(loc);
    t.text = std::move(text);
    return t;
}

Token Token::bgroup(Location loc) {
    Token t;
    t.kind = TokenKind::Bgroup;
    t.loc = std::move(loc);
    return t;
}

Token Token::egroup(Location loc) {
    Token t;
    t.kind = TokenKind::Egroup;
    t.loc = std::move(loc);
    return t;
}

Token Token::boolean(Location loc, bool value) {
    Token t;
    t.kind = TokenKind::Boolean;
    t.loc = std::move(loc);
    t.flag = value;
    return t;
}

Token Token::tokens(Location loc, std::vector<Token> items) {
    Token t;
    t.kind = TokenKind::Tokens;
    t.loc = std::move(loc);
    t.children = std::move(items);
    return t;
}

Token Token::key_value_list(Location loc,
                            std::vector<std::pair<std::string, std::string>> pairs) {
    Token t;
    t.kind = TokenKind::KeyValueList;
    t.loc = std::move(loc);
    t.pairs = std::move(pairs);
    return t;
}

Token Token::invocation(Location loc, std::shared_ptr<const CommandDef> def,
                        std::vector<Token> args) {
    Token t;
    t.kind = TokenKind::Command;
    t.loc = std::move(loc);
    t.command = std::move(def);
    t.children = std::move(args);
    return t;
}

Token Token::environment_block(Location loc, std::shared_ptr<const EnvironmentDef> def,
                               std::vector<Token> args, std::vector<Token> body) {
    Token t;
    t.kind = TokenKind::Environment;
    t.loc = std::move(loc);
    t.environment = std::move(def);
    t.children = std::move(args);
    t.body = std::move(body);
    return t;
}

const std::string& Token::name() const {
    static const std::string empty;
    if (kind == TokenKind::Command && command) return command->name;
    if (kind == TokenKind::Environment && environment) return environment->name;
    return empty;
}

const char* token_kind_name(TokenKind k) {
    switch (k) {
        case TokenKind::ParsedText:   return "ParsedText";
        case TokenKind::RawText:      return "RawText";
        case TokenKind::Math:         return "Math";
        case TokenKind::Bgroup:       return "Bgroup";
        case TokenKind::Egroup:       return "Egroup";
        case TokenKind::Command:      return "Command";
        case TokenKind::Environment:  return "Environment";
        case TokenKind::Tokens:       return "Tokens";
        case TokenKind::Boolean:      return "Boolean";
        case TokenKind::KeyValueList: return "KeyValueList";
    }
    return "Unknown";
}

std::string describe(const std::vector<Token>& tokens) {
    std::string result = "[";
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) result += ", ";
        result += describe(tokens[i]);
    }
    result += "]";
    return result;
}

std::string describe(const Token& token) {
    std::string result = token_kind_name(token.kind);
    switch (token.kind) {
    case TokenKind::ParsedText:
    case TokenKind::RawText:
    case TokenKind::Math:
        result += "(\"" + token.text + "\")";
        break;
    case TokenKind::Bgroup:
    case TokenKind::Egroup:
        break;
    case TokenKind::Boolean:
        result += token.flag ? "(true)" : "(false)";
        break;
    case TokenKind::Tokens:
        result += "(" + describe(token.children) + ")";
        break;
    case TokenKind::KeyValueList:
        result += "(";
        for (size_t i = 0; i < token.pairs.size(); ++i) {
            if (i > 0) result += ", ";
            result += token.pairs[i].first;
            if (!token.pairs[i].second.empty()) result += "=" + token.pairs[i].second;
        }
        result += ")";
        break;
    case TokenKind::Command:
        result += "(" + token.name() + ", " + describe(token.children) + ")";
        break;
    case TokenKind::Environment:
        result += "(" + token.name() + ", " + describe(token.children) +
                  ", " + describe(token.body) + ")";
        break;
    }
    return result;
}

std::string to_source(const std::vector<Token>& tokens) {
    std::string out;
    int line = 0;
    for (const auto& t : tokens) {
        if (line != 0 && t.loc.line != line) out += "\n";
        line = t.loc.line;

        switch (t.kind) {
        case TokenKind::ParsedText:
        case TokenKind::RawText:
        case TokenKind::Math:
            out += t.text;
            break;
        case TokenKind::Bgroup:
            out += "{";
            break;
        case TokenKind::Egroup:
            out += "}";
            break;
        case TokenKind::Tokens:
            out += "{" + to_source(t.children) + "}";
            break;
        case TokenKind::Command:
        case TokenKind::Environment:
            out += "\\" + t.name() + " ";
            break;
        case TokenKind::Boolean:
        case TokenKind::KeyValueList:
            break;
        }
    }
    return out;
}

} // namespace finl
