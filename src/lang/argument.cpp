#include <finl/lang/argument.hpp>
#include <algorithm>
#include <cctype>

namespace finl {

static std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

Result<bool> parse_boolean(const std::string& text) {
    std::string word = trim(text);
    std::transform(word.begin(), word.end(), word.begin(),
                   [](char c) -> char {
                       return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                   });

    if (word == "true" || word == "yes") return Result<bool>::ok(true);
    if (word == "false" || word == "no") return Result<bool>::ok(false);

    return FinlError{FinlError::InvalidBoolean,
        "'" + trim(text) + "' is not a boolean",
        "use true, false, yes or no"};
}

// Splits on `separator` outside braces; "\{" and "\}" do not count as braces.
static std::vector<std::string> split_outside_braces(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::string current;
    int depth = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\\' && i + 1 < text.size()) {
            current += c;
            current += text[++i];
            continue;
        }
        if (c == '{') ++depth;
        else if (c == '}' && depth > 0) --depth;
        else if (c == separator && depth == 0) {
            parts.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    parts.push_back(current);
    return parts;
}

static std::string strip_braces(const std::string& value) {
    if (value.size() >= 2 && value.front() == '{' && value.back() == '}') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

Result<Token> parse_key_value_list(const ArgumentSpan& span, Registry&) {
    std::vector<std::pair<std::string, std::string>> pairs;

    for (const auto& entry : split_outside_braces(span.text, ',')) {
        if (trim(entry).empty()) continue;  // "a=1,,b" and trailing commas

        size_t eq = std::string::npos;
        int depth = 0;
        for (size_t i = 0; i < entry.size(); ++i) {
            if (entry[i] == '\\') { ++i; continue; }
            if (entry[i] == '{') ++depth;
            else if (entry[i] == '}' && depth > 0) --depth;
            else if (entry[i] == '=' && depth == 0) { eq = i; break; }
        }

        std::string key = trim(entry.substr(0, eq));
        std::string value = eq == std::string::npos ? "" : strip_braces(trim(entry.substr(eq + 1)));
        if (key.empty()) {
            return FinlError{FinlError::InvalidArgument,
                "empty key in key/value list '" + trim(span.text) + "'"};
        }
        pairs.emplace_back(std::move(key), std::move(value));
    }

    return Result<Token>::ok(Token::key_value_list(span.loc, std::move(pairs)));
}

Result<Token> capture_math(const ArgumentSpan& span, Registry&) {
    return Result<Token>::ok(Token::math(span.loc, span.text));
}

} // namespace finl
