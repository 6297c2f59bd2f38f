#pragma once

#include <finl/lang/command.hpp>
#include <finl/result.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace finl {

// Name -> shared, immutable command and environment definitions.
// Definitions may be added while a parse is running (for example by a
// MacroDefinition argument handler); lookups see everything defined so far.
// A registry shared between parsers must not be modified once they run
// concurrently.
class Registry {
public:
    // Inserts or replaces. "begin" and "end" are reserved for environments.
    Status define_command(const std::string& name, std::vector<Parameter> parameters);
    Status define_environment(const std::string& name, std::vector<Parameter> parameters,
                              ParameterType body_type);

    std::shared_ptr<const CommandDef> lookup_command(const std::string& name) const;
    std::shared_ptr<const EnvironmentDef> lookup_environment(const std::string& name) const;

    size_t command_count() const { return commands_.size(); }
    size_t environment_count() const { return environments_.size(); }

private:
    std::unordered_map<std::string, std::shared_ptr<const CommandDef>> commands_;
    std::unordered_map<std::string, std::shared_ptr<const EnvironmentDef>> environments_;
};

} // namespace finl
