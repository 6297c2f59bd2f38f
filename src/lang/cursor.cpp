#include <finl/lang/cursor.hpp>
#include <unicode/uchar.h>
#include <unicode/utf8.h>
#include <cstdint>

namespace finl {

// ---------------------------------------------------------------------------
// Line sources
// ---------------------------------------------------------------------------

static void strip_carriage_return(std::string& line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

StringLineSource::StringLineSource(std::string source)
    : source_(std::move(source)) {}

std::optional<std::string> StringLineSource::next_line() {
    if (pos_ >= source_.size()) return std::nullopt;

    std::string line;
    size_t end = source_.find('\n', pos_);
    if (end == std::string::npos) {
        line = source_.substr(pos_);
        pos_ = source_.size();
    } else {
        line = source_.substr(pos_, end - pos_);
        pos_ = end + 1;
    }
    strip_carriage_return(line);
    return line;
}

VectorLineSource::VectorLineSource(std::vector<std::string> lines)
    : lines_(std::move(lines)) {}

std::optional<std::string> VectorLineSource::next_line() {
    if (index_ >= lines_.size()) return std::nullopt;
    return std::move(lines_[index_++]);
}

StreamLineSource::StreamLineSource(std::unique_ptr<std::istream> in)
    : in_(std::move(in)) {}

std::optional<std::string> StreamLineSource::next_line() {
    if (!in_) return std::nullopt;
    std::string line;
    if (!std::getline(*in_, line)) return std::nullopt;
    strip_carriage_return(line);
    return line;
}

// ---------------------------------------------------------------------------
// Cursor
// ---------------------------------------------------------------------------

Cursor::Cursor(std::unique_ptr<LineSource> source, std::string file)
    : source_(std::move(source)) {
    line_.file = std::move(file);
}

bool Cursor::advance_line() {
    column_ = 0;
    std::optional<std::string> next;
    if (source_) next = source_->next_line();
    if (!next) {
        line_.contents.clear();
        exhausted_ = true;
        return false;
    }
    line_.number += 1;
    line_.contents = std::move(*next);
    return true;
}

std::optional<Char> Cursor::peek() const {
    const std::string& s = line_.contents;
    if (column_ >= s.size()) return std::nullopt;

    const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
    auto i = static_cast<int32_t>(column_);
    auto length = static_cast<int32_t>(s.size());
    UChar32 c;
    U8_NEXT(bytes, i, length, c);
    if (c < 0) c = 0xFFFD;

    return Char{column_, static_cast<char32_t>(c), static_cast<size_t>(i) - column_};
}

void Cursor::next() {
    if (auto c = peek()) column_ += c->width;
}

void Cursor::seek(size_t column) {
    column_ = column < line_.contents.size() ? column : line_.contents.size();
}

size_t Cursor::find(const std::string& needle) const {
    return line_.contents.find(needle, column_);
}

std::string Cursor::slice(size_t begin, size_t end) const {
    if (begin >= end || begin >= line_.contents.size()) return "";
    return line_.contents.substr(begin, end - begin);
}

bool is_letter(char32_t ch) {
    switch (u_charType(static_cast<UChar32>(ch))) {
    case U_UPPERCASE_LETTER:
    case U_LOWERCASE_LETTER:
    case U_TITLECASE_LETTER:
    case U_MODIFIER_LETTER:
    case U_OTHER_LETTER:
    case U_NON_SPACING_MARK:
    case U_COMBINING_SPACING_MARK:
        return true;
    default:
        return false;
    }
}

bool is_whitespace(char32_t ch) {
    return u_isUWhiteSpace(static_cast<UChar32>(ch));
}

} // namespace finl
