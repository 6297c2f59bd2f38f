#pragma once

#include <string>
#include <utility>
#include <vector>

namespace finl {

// How an argument is delimited in the source
enum class ParameterFormat {
    Star,                 // optional leading '*'
    Required,             // {...} or a single token
    RequiredWithBraces,   // {...} only
    Optional,             // [...], may be absent
    ArbitraryDelimiters   // \verb|...| style
};

// How the captured argument content is interpreted
enum class ParameterType {
    ParsedTokens,
    VerbatimText,
    Boolean,
    KeyValueList,
    MacroDefinition,
    Math,
    YAML
};

using Parameter = std::pair<ParameterFormat, ParameterType>;

// A registered command. Immutable once inserted into a Registry and shared
// by every Command token that refers to it.
struct CommandDef {
    std::string name;
    std::vector<Parameter> parameters;
};

// A registered environment: \begin{name}<parameters> body \end{name}
struct EnvironmentDef {
    std::string name;
    std::vector<Parameter> parameters;
    ParameterType body_type = ParameterType::ParsedTokens;
};

// Names used in configuration files and diagnostics ("required", "parsed_tokens", ...)
const char* parameter_format_name(ParameterFormat f);
const char* parameter_type_name(ParameterType t);

} // namespace finl
