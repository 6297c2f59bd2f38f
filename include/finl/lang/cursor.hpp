#pragma once

#include <finl/lang/location.hpp>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finl {

// ---------------------------------------------------------------------------
// Line supply
// ---------------------------------------------------------------------------

class LineSource {
public:
    virtual ~LineSource() = default;
    // Next line without its terminator, or nullopt when exhausted
    virtual std::optional<std::string> next_line() = 0;
};

// Splits an in-memory string on '\n'. A trailing '\r' is dropped and a final
// newline does not produce an extra empty line.
class StringLineSource : public LineSource {
public:
    explicit StringLineSource(std::string source);
    std::optional<std::string> next_line() override;

private:
    std::string source_;
    size_t pos_ = 0;
};

class VectorLineSource : public LineSource {
public:
    explicit VectorLineSource(std::vector<std::string> lines);
    std::optional<std::string> next_line() override;

private:
    std::vector<std::string> lines_;
    size_t index_ = 0;
};

class StreamLineSource : public LineSource {
public:
    explicit StreamLineSource(std::unique_ptr<std::istream> in);
    std::optional<std::string> next_line() override;

private:
    std::unique_ptr<std::istream> in_;
};

// ---------------------------------------------------------------------------
// Cursor
// ---------------------------------------------------------------------------

// One decoded code point of the current line
struct Char {
    size_t column;   // byte offset of the first byte
    char32_t ch;     // U+FFFD for ill-formed UTF-8
    size_t width;    // bytes consumed
};

class Cursor {
public:
    Cursor(std::unique_ptr<LineSource> source, std::string file);

    // Pulls the next line and resets the column to 0. On exhaustion the line
    // becomes an empty sentinel (file and last line number kept) and this
    // returns false.
    bool advance_line();

    std::optional<Char> peek() const;
    void next();

    size_t column() const { return column_; }
    bool at_eol() const { return column_ >= line_.contents.size(); }
    bool exhausted() const { return exhausted_; }
    const Line& line() const { return line_; }

    void skip_to_eol() { column_ = line_.contents.size(); }
    void seek(size_t column);

    // Byte offset of `needle` at or after the cursor on this line, or npos
    size_t find(const std::string& needle) const;

    std::string slice(size_t begin, size_t end) const;

    Location location(size_t column) const { return Location::at(line_, column); }
    Location location() const { return location(column_); }
    ErrorContext context(size_t column) const { return ErrorContext::at(line_, column); }

private:
    std::unique_ptr<LineSource> source_;
    Line line_;
    size_t column_ = 0;
    bool exhausted_ = false;
};

// Unicode general category L*, Mn or Mc. Grapheme clusters such as flag
// sequences or ZWJ emoji are not treated as single letters.
bool is_letter(char32_t ch);
// Unicode White_Space property
bool is_whitespace(char32_t ch);

} // namespace finl
