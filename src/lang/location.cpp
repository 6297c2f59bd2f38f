#include <finl/lang/location.hpp>

namespace finl {

Location Location::at(const Line& line, size_t column) {
    return {line.file, line.number, column};
}

std::string Location::to_string() const {
    std::string result = file;
    result += ":";
    result += std::to_string(line);
    result += ":";
    result += std::to_string(column + 1);
    return result;
}

bool operator==(const Location& a, const Location& b) {
    return a.line == b.line && a.column == b.column && a.file == b.file;
}

bool operator!=(const Location& a, const Location& b) {
    return !(a == b);
}

ErrorContext ErrorContext::at(const Line& line, size_t column) {
    return {Location::at(line, column), line.contents};
}

} // namespace finl
