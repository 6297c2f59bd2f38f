#include <finl/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace finl {

Result<ParameterFormat> parse_parameter_format(const std::string& name) {
    for (auto f : {ParameterFormat::Star, ParameterFormat::Required,
                   ParameterFormat::RequiredWithBraces, ParameterFormat::Optional,
                   ParameterFormat::ArbitraryDelimiters}) {
        if (name == parameter_format_name(f)) return Result<ParameterFormat>::ok(f);
    }
    return FinlError{FinlError::Config,
        "unknown parameter format '" + name + "'",
        "expected star, required, required_with_braces, optional or arbitrary_delimiters"};
}

Result<ParameterType> parse_parameter_type(const std::string& name) {
    for (auto t : {ParameterType::ParsedTokens, ParameterType::VerbatimText,
                   ParameterType::Boolean, ParameterType::KeyValueList,
                   ParameterType::MacroDefinition, ParameterType::Math,
                   ParameterType::YAML}) {
        if (name == parameter_type_name(t)) return Result<ParameterType>::ok(t);
    }
    return FinlError{FinlError::Config, "unknown parameter type '" + name + "'"};
}

// parameters = [["star"], ["required", "verbatim_text"], ...]
// A missing type means boolean for "star" and parsed_tokens otherwise.
static Result<std::vector<Parameter>> parse_parameters(const toml::node* node,
                                                       const std::string& owner) {
    std::vector<Parameter> params;
    if (!node) return Result<std::vector<Parameter>>::ok(std::move(params));

    auto arr = node->as_array();
    if (!arr) {
        return FinlError{FinlError::Config,
            "'parameters' of " + owner + " must be an array"};
    }

    for (const auto& el : *arr) {
        auto pair = el.as_array();
        if (!pair || pair->empty() || pair->size() > 2) {
            return FinlError{FinlError::Config,
                "each parameter of " + owner + " must be [format] or [format, type]"};
        }

        auto format_name = (*pair)[0].value<std::string>();
        if (!format_name) {
            return FinlError{FinlError::Config,
                "parameter format of " + owner + " must be a string"};
        }
        auto format = parse_parameter_format(*format_name);
        if (format.is_err()) return std::move(format).error();

        ParameterType type = format.value() == ParameterFormat::Star
            ? ParameterType::Boolean : ParameterType::ParsedTokens;
        if (pair->size() == 2) {
            auto type_name = (*pair)[1].value<std::string>();
            if (!type_name) {
                return FinlError{FinlError::Config,
                    "parameter type of " + owner + " must be a string"};
            }
            auto parsed = parse_parameter_type(*type_name);
            if (parsed.is_err()) return std::move(parsed).error();
            type = parsed.value();
        }
        params.emplace_back(format.value(), type);
    }
    return Result<std::vector<Parameter>>::ok(std::move(params));
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return FinlError{FinlError::Config,
            std::string("config TOML parse error: ") + std::string(e.description()) +
                " (line " + std::to_string(e.source().begin.line) + ")"};
    }

    Config cfg;

    // [parser] section
    if (auto parser = doc["parser"].as_table()) {
        if (auto v = (*parser)["max-nesting-depth"].value<int64_t>()) {
            if (*v <= 0) {
                return FinlError{FinlError::Config,
                    "parser.max-nesting-depth must be positive"};
            }
            cfg.parser.max_nesting_depth = static_cast<size_t>(*v);
            cfg.max_nesting_depth_set = true;
        }
        if (auto v = (*parser)["file-name"].value<std::string>()) {
            cfg.parser.file_name = *v;
            cfg.file_name_set = true;
        }
    }

    // [log] section
    if (auto log_tbl = doc["log"].as_table()) {
        if (auto v = (*log_tbl)["level"].value<std::string>()) {
            log::Level lvl = log::Warn;
            if (!log::level_from_name(*v, lvl)) {
                return FinlError{FinlError::Config,
                    "unknown log level '" + *v + "'",
                    "expected trace, debug, info, warn, error or off"};
            }
            cfg.log_level = lvl;
        }
        if (auto v = (*log_tbl)["color"].value<bool>()) {
            cfg.log_color = *v;
        }
    }

    // [commands.<name>] sections
    if (auto commands = doc["commands"].as_table()) {
        for (const auto& [key, val] : *commands) {
            std::string name(key.str());
            auto tbl = val.as_table();
            if (!tbl) {
                return FinlError{FinlError::Config,
                    "commands." + name + " must be a table"};
            }
            auto params = parse_parameters(tbl->get("parameters"), "command '\\" + name + "'");
            if (params.is_err()) return std::move(params).error();
            cfg.commands[name] = std::move(params).value();
        }
    }

    // [environments.<name>] sections
    if (auto envs = doc["environments"].as_table()) {
        for (const auto& [key, val] : *envs) {
            std::string name(key.str());
            auto tbl = val.as_table();
            if (!tbl) {
                return FinlError{FinlError::Config,
                    "environments." + name + " must be a table"};
            }
            EnvironmentSpec spec;
            auto params = parse_parameters(tbl->get("parameters"), "environment '" + name + "'");
            if (params.is_err()) return std::move(params).error();
            spec.parameters = std::move(params).value();
            if (auto body = (*tbl)["body"].value<std::string>()) {
                auto type = parse_parameter_type(*body);
                if (type.is_err()) return std::move(type).error();
                spec.body_type = type.value();
            }
            cfg.environments[name] = std::move(spec);
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return FinlError{FinlError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        log::warn("rejected config %s", path.c_str());
        auto err = std::move(cfg).error();
        err.message = path + ": " + err.message;
        return err;
    }
    log::info("loaded config %s (%zu commands, %zu environments)", path.c_str(),
              cfg.value().commands.size(), cfg.value().environments.size());
    return cfg;
}

void Config::merge(const Config& other) {
    // Parser: other overrides only explicitly-set fields
    if (other.max_nesting_depth_set) {
        parser.max_nesting_depth = other.parser.max_nesting_depth;
        max_nesting_depth_set = true;
    }
    if (other.file_name_set) {
        parser.file_name = other.parser.file_name;
        file_name_set = true;
    }

    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;

    // Definitions: other overrides this per-name
    for (const auto& [k, v] : other.commands) {
        commands[k] = v;
    }
    for (const auto& [k, v] : other.environments) {
        environments[k] = v;
    }
}

Status Config::apply(Parser& parser) const {
    if (max_nesting_depth_set) parser.set_max_nesting_depth(this->parser.max_nesting_depth);

    for (const auto& [name, params] : commands) {
        FINL_TRY(parser.define_command(name, params));
    }
    for (const auto& [name, spec] : environments) {
        FINL_TRY(parser.define_environment(name, spec.parameters, spec.body_type));
    }
    return ok_status();
}

void Config::apply_logging() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
}

} // namespace finl
