#pragma once

#include <finl/lang/location.hpp>
#include <finl/lang/token.hpp>
#include <finl/result.hpp>
#include <functional>
#include <string>

namespace finl {

class Registry;

// Captured, unparsed content of one argument (or of an environment body)
struct ArgumentSpan {
    std::string text;
    Location loc;           // where the content starts
    std::string owner;      // command or environment name
    int parameter = 0;      // 1-based; 0 for an environment body
};

// Converts a captured span into a token. Handlers may define new commands or
// environments through the registry; later input sees them.
using ArgumentHandler = std::function<Result<Token>(const ArgumentSpan&, Registry&)>;

// true/yes -> true, false/no -> false (case-insensitive, surrounding
// whitespace ignored)
Result<bool> parse_boolean(const std::string& text);

// Built-in KeyValueList handler: comma-separated "key=value" or "key"
// entries. Commas and '=' inside braces do not split; one layer of braces
// around a value is removed.
Result<Token> parse_key_value_list(const ArgumentSpan& span, Registry& registry);

// Built-in Math handler: keeps the content as a Math token
Result<Token> capture_math(const ArgumentSpan& span, Registry& registry);

} // namespace finl
