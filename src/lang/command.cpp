#include <finl/lang/command.hpp>

namespace finl {

const char* parameter_format_name(ParameterFormat f) {
    switch (f) {
        case ParameterFormat::Star:                return "star";
        case ParameterFormat::Required:            return "required";
        case ParameterFormat::RequiredWithBraces:  return "required_with_braces";
        case ParameterFormat::Optional:            return "optional";
        case ParameterFormat::ArbitraryDelimiters: return "arbitrary_delimiters";
    }
    return "unknown";
}

const char* parameter_type_name(ParameterType t) {
    switch (t) {
        case ParameterType::ParsedTokens:    return "parsed_tokens";
        case ParameterType::VerbatimText:    return "verbatim_text";
        case ParameterType::Boolean:         return "boolean";
        case ParameterType::KeyValueList:    return "key_value_list";
        case ParameterType::MacroDefinition: return "macro_definition";
        case ParameterType::Math:            return "math";
        case ParameterType::YAML:            return "yaml";
    }
    return "unknown";
}

} // namespace finl
