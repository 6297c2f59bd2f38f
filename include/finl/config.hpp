#pragma once

#include <finl/lang/command.hpp>
#include <finl/lang/parser.hpp>
#include <finl/log.hpp>
#include <finl/result.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace finl {

struct EnvironmentSpec {
    std::vector<Parameter> parameters;
    ParameterType body_type = ParameterType::ParsedTokens;
};

// Parser settings, logging and command/environment definitions read from TOML.
// Layers are combined with merge(); later layers win.
struct Config {
    ParserConfig parser;
    // Track which parser fields were explicitly set (for merge)
    bool max_nesting_depth_set = false;
    bool file_name_set = false;

    std::optional<log::Level> log_level;
    std::optional<bool> log_color;

    std::map<std::string, std::vector<Parameter>> commands;
    std::map<std::string, EnvironmentSpec> environments;

    // Load from a TOML file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Installs the depth limit and every definition. Stops at the first
    // definition the registry rejects.
    Status apply(Parser& parser) const;

    // Pushes [log] settings into finl::log
    void apply_logging() const;
};

// "star", "required", "required_with_braces", "optional", "arbitrary_delimiters"
Result<ParameterFormat> parse_parameter_format(const std::string& name);

// "parsed_tokens", "verbatim_text", "boolean", "key_value_list",
// "macro_definition", "math", "yaml"
Result<ParameterType> parse_parameter_type(const std::string& name);

} // namespace finl
