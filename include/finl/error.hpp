#pragma once

#include <finl/lang/group.hpp>
#include <finl/lang/location.hpp>
#include <optional>
#include <string>

namespace finl {

struct FinlError {
    enum Code {
        // Parse diagnostics, emitted into the token stream
        UndefinedCommand,
        UndefinedEnvironment,
        Unimplemented,
        BlankLineWhileParsingCommandArguments,
        UnexpectedEOFWhileParsingCommandArguments,
        UnexpectedCloseBrace,
        MissingBraces,
        InvalidBoolean,
        InvalidArgument,
        UnterminatedDelimitedArgument,
        UnterminatedGroup,
        MismatchedEnvironmentEnd,
        UnexpectedEnvironmentEnd,
        NestingTooDeep,
        // Failures outside the token stream
        IO,
        Config,
        InvalidArg
    };

    Code code = InvalidArg;
    std::string message;
    std::string hint;
    ErrorContext context;

    // Command or environment the error belongs to, if any
    std::string name;
    // 1-based parameter number; 0 when the error is not about an argument
    int parameter = 0;
    // Offending or unterminated group, for UnexpectedCloseBrace,
    // UnterminatedGroup and MismatchedEnvironmentEnd
    std::optional<GroupType> group;

    FinlError() = default;
    FinlError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    FinlError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    FinlError(Code c, std::string msg, ErrorContext ctx)
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    bool has_location() const { return context.loc.line > 0; }

    // Multi-line rendering with location and a caret under the offending column
    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace finl
