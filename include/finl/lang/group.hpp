#pragma once

#include <finl/lang/command.hpp>
#include <finl/lang/location.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace finl {

// ---------------------------------------------------------------------------
// Open-scope markers
// ---------------------------------------------------------------------------

struct BraceGroup {};
struct RequiredArgumentGroup {};
struct OptionalArgumentGroup {};

struct EnvironmentGroup {
    std::shared_ptr<const EnvironmentDef> environment;
};

struct DelimiterGroup {
    std::string delimiter;
};

using GroupType = std::variant<BraceGroup,
                               RequiredArgumentGroup,
                               OptionalArgumentGroup,
                               EnvironmentGroup,
                               DelimiterGroup>;

bool operator==(const BraceGroup&, const BraceGroup&);
bool operator==(const RequiredArgumentGroup&, const RequiredArgumentGroup&);
bool operator==(const OptionalArgumentGroup&, const OptionalArgumentGroup&);
bool operator==(const EnvironmentGroup& a, const EnvironmentGroup& b);
bool operator==(const DelimiterGroup& a, const DelimiterGroup& b);

// Short kind name: "brace", "required_argument", "optional_argument",
// "environment", "delimiter"
const char* group_type_name(const GroupType& g);

// Human description for diagnostics, e.g. "environment 'itemize'"
std::string describe(const GroupType& g);

// ---------------------------------------------------------------------------
// Group stack
// ---------------------------------------------------------------------------

struct OpenGroup {
    GroupType type;
    ErrorContext opened_at;
    int nested_brackets = 0;  // unmatched '[' inside an optional argument
};

class GroupStack {
public:
    void push(GroupType type, ErrorContext opened_at);
    void push(OpenGroup group);

    // Removes and returns the innermost group, or nullopt when empty
    std::optional<OpenGroup> pop();

    OpenGroup* top();
    const OpenGroup* top() const;

    template<typename T>
    bool top_is() const {
        auto t = top();
        return t && std::holds_alternative<T>(t->type);
    }

    bool has_environment() const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Drops every group opened at or above `level` and returns them in open order
    std::vector<OpenGroup> take_from(size_t level);

private:
    std::vector<OpenGroup> entries_;
};

} // namespace finl
