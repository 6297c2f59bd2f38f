#pragma once

#include <cstddef>
#include <string>

namespace finl {

// One physical source line. Replaced wholesale each time the cursor advances.
struct Line {
    std::string file;
    int number = 0;          // 1-based; 0 before the first line is read
    std::string contents;    // without the line terminator
};

// Source position attached to every token and error.
// column is a 0-based byte offset into the line's contents.
struct Location {
    std::string file;
    int line = 0;
    size_t column = 0;

    static Location at(const Line& line, size_t column);

    // "file:line:col" with a 1-based column, for humans
    std::string to_string() const;
};

bool operator==(const Location& a, const Location& b);
bool operator!=(const Location& a, const Location& b);

// Snapshot of the offending line so diagnostics can draw a caret
// without re-reading the source.
struct ErrorContext {
    Location loc;
    std::string line_text;

    static ErrorContext at(const Line& line, size_t column);
};

} // namespace finl
