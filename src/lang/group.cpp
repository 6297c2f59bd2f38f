#include <finl/lang/group.hpp>
#include <iterator>

namespace finl {

bool operator==(const BraceGroup&, const BraceGroup&) { return true; }
bool operator==(const RequiredArgumentGroup&, const RequiredArgumentGroup&) { return true; }
bool operator==(const OptionalArgumentGroup&, const OptionalArgumentGroup&) { return true; }

bool operator==(const EnvironmentGroup& a, const EnvironmentGroup& b) {
    return a.environment == b.environment;
}

bool operator==(const DelimiterGroup& a, const DelimiterGroup& b) {
    return a.delimiter == b.delimiter;
}

namespace {

struct NameVisitor {
    const char* operator()(const BraceGroup&) const            { return "brace"; }
    const char* operator()(const RequiredArgumentGroup&) const { return "required_argument"; }
    const char* operator()(const OptionalArgumentGroup&) const { return "optional_argument"; }
    const char* operator()(const EnvironmentGroup&) const      { return "environment"; }
    const char* operator()(const DelimiterGroup&) const        { return "delimiter"; }
};

struct DescribeVisitor {
    std::string operator()(const BraceGroup&) const            { return "brace group"; }
    std::string operator()(const RequiredArgumentGroup&) const { return "required argument"; }
    std::string operator()(const OptionalArgumentGroup&) const { return "optional argument"; }

    std::string operator()(const EnvironmentGroup& g) const {
        if (!g.environment) return "environment";
        return "environment '" + g.environment->name + "'";
    }

    std::string operator()(const DelimiterGroup& g) const {
        return "delimited argument '" + g.delimiter + "'";
    }
};

} // namespace

const char* group_type_name(const GroupType& g) {
    return std::visit(NameVisitor{}, g);
}

std::string describe(const GroupType& g) {
    return std::visit(DescribeVisitor{}, g);
}

void GroupStack::push(GroupType type, ErrorContext opened_at) {
    entries_.push_back({std::move(type), std::move(opened_at), 0});
}

void GroupStack::push(OpenGroup group) {
    entries_.push_back(std::move(group));
}

std::optional<OpenGroup> GroupStack::pop() {
    if (entries_.empty()) return std::nullopt;
    OpenGroup g = std::move(entries_.back());
    entries_.pop_back();
    return g;
}

OpenGroup* GroupStack::top() {
    return entries_.empty() ? nullptr : &entries_.back();
}

const OpenGroup* GroupStack::top() const {
    return entries_.empty() ? nullptr : &entries_.back();
}

bool GroupStack::has_environment() const {
    for (const auto& e : entries_) {
        if (std::holds_alternative<EnvironmentGroup>(e.type)) return true;
    }
    return false;
}

std::vector<OpenGroup> GroupStack::take_from(size_t level) {
    std::vector<OpenGroup> taken;
    if (level >= entries_.size()) return taken;
    taken.assign(std::make_move_iterator(entries_.begin() + level),
                 std::make_move_iterator(entries_.end()));
    entries_.erase(entries_.begin() + level, entries_.end());
    return taken;
}

} // namespace finl
