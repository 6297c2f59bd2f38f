#include <finl/lang/registry.hpp>
#include <finl/log.hpp>

namespace finl {

static Status validate_name(const std::string& name, const char* what) {
    if (name.empty()) {
        return FinlError{FinlError::InvalidArg,
            std::string("empty ") + what + " name"};
    }
    return ok_status();
}

Status Registry::define_command(const std::string& name, std::vector<Parameter> parameters) {
    FINL_TRY(validate_name(name, "command"));
    if (name == "begin" || name == "end") {
        return FinlError{FinlError::InvalidArg,
            "cannot define command '\\" + name + "'",
            "\\begin and \\end are reserved for environments"};
    }

    auto def = std::make_shared<CommandDef>();
    def->name = name;
    def->parameters = std::move(parameters);
    log::debug("defined command \\%s (%zu parameters)", name.c_str(), def->parameters.size());
    commands_[name] = std::move(def);
    return ok_status();
}

Status Registry::define_environment(const std::string& name, std::vector<Parameter> parameters,
                                    ParameterType body_type) {
    FINL_TRY(validate_name(name, "environment"));
    if (name.find_first_of("{}") != std::string::npos) {
        return FinlError{FinlError::InvalidArg,
            "invalid environment name '" + name + "'",
            "environment names may not contain braces"};
    }

    auto def = std::make_shared<EnvironmentDef>();
    def->name = name;
    def->parameters = std::move(parameters);
    def->body_type = body_type;
    log::debug("defined environment %s (%zu parameters, %s body)", name.c_str(),
               def->parameters.size(), parameter_type_name(body_type));
    environments_[name] = std::move(def);
    return ok_status();
}

std::shared_ptr<const CommandDef> Registry::lookup_command(const std::string& name) const {
    auto it = commands_.find(name);
    if (it == commands_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<const EnvironmentDef> Registry::lookup_environment(const std::string& name) const {
    auto it = environments_.find(name);
    if (it == environments_.end()) return nullptr;
    return it->second;
}

} // namespace finl
