#include <finl/error.hpp>

namespace finl {

const char* FinlError::code_name(Code c) {
    switch (c) {
        case UndefinedCommand:     return "UndefinedCommand";
        case UndefinedEnvironment: return "UndefinedEnvironment";
        case Unimplemented:        return "Unimplemented";
        case BlankLineWhileParsingCommandArguments:
            return "BlankLineWhileParsingCommandArguments";
        case UnexpectedEOFWhileParsingCommandArguments:
            return "UnexpectedEOFWhileParsingCommandArguments";
        case UnexpectedCloseBrace:          return "UnexpectedCloseBrace";
        case MissingBraces:                 return "MissingBraces";
        case InvalidBoolean:                return "InvalidBoolean";
        case InvalidArgument:               return "InvalidArgument";
        case UnterminatedDelimitedArgument: return "UnterminatedDelimitedArgument";
        case UnterminatedGroup:             return "UnterminatedGroup";
        case MismatchedEnvironmentEnd:      return "MismatchedEnvironmentEnd";
        case UnexpectedEnvironmentEnd:      return "UnexpectedEnvironmentEnd";
        case NestingTooDeep:                return "NestingTooDeep";
        case IO:                            return "IO";
        case Config:                        return "Config";
        case InvalidArg:                    return "InvalidArg";
    }
    return "Unknown";
}

// Number of code points before `column`, so the caret lines up with
// multi-byte UTF-8 text.
static size_t display_width(const std::string& text, size_t column) {
    size_t width = 0;
    for (size_t i = 0; i < column && i < text.size(); ++i) {
        auto byte = static_cast<unsigned char>(text[i]);
        if ((byte & 0xC0) != 0x80) ++width;
    }
    return width;
}

std::string FinlError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (has_location()) {
        result += "\n  --> ";
        result += context.loc.to_string();

        if (!context.line_text.empty()) {
            std::string number = std::to_string(context.loc.line);
            std::string gutter(number.size() + 1, ' ');
            result += "\n" + gutter + " |";
            result += "\n " + number + " | " + context.line_text;
            result += "\n" + gutter + " | ";
            result += std::string(display_width(context.line_text, context.loc.column), ' ');
            result += "^";
        }
    } else if (!context.loc.file.empty()) {
        result += "\n  --> ";
        result += context.loc.file;
    }

    return result;
}

} // namespace finl
