#include "params.hpp"
#include <core/errors.hpp>
#include <algorithm>
#include <regex>
#include <stdexcept>

// IEEE Std 1003.1, 3.235 Name: a word consisting solely of underscores,
// digits and alphabetics, not starting with a digit.
bool is_valid_param_name(const std::string& name) {
    static const std::regex pattern("^[a-zA-Z_][a-zA-Z0-9_]*$");
    return std::regex_match(name, pattern);
}

void validate_param_name(const std::string& name, const std::string& param_type) {
    if (!is_valid_param_name(name)) {
        throw NameValidationError(param_type, name);
    }
}

EnvParam::EnvParam(std::string name_, std::optional<std::string> value_)
    : name(std::move(name_)), value(std::move(value_)) {
    validate_param_name(name, "Environment variable");
}

const char* param_type_label(ParamRole role) {
    return role == ParamRole::Input ? "Input parameter" : "Output parameter";
}

FileParam::FileParam(ParamRole role_,
                     std::string name_,
                     std::optional<std::string> value_,
                     std::optional<std::string> docker_path_,
                     std::optional<UriReference> uri_,
                     bool recursive_)
    : role(role_),
      name(std::move(name_)),
      value(std::move(value_)),
      docker_path(std::move(docker_path_)),
      uri(std::move(uri_)),
      recursive(recursive_) {
    validate_param_name(name, param_type_label(role));
}

std::pair<std::optional<std::string>, std::optional<std::string>>
split_pair(const std::string& pair_string, char separator, int nullable_idx) {
    if (nullable_idx != 0 && nullable_idx != 1) {
        throw std::invalid_argument("nullable_idx should be either 0 or 1");
    }

    auto pos = pair_string.find(separator);
    if (pos == std::string::npos) {
        if (nullable_idx == 0) return {std::nullopt, pair_string};
        return {pair_string, std::nullopt};
    }
    return {pair_string.substr(0, pos), pair_string.substr(pos + 1)};
}

std::vector<EnvParam> parse_env_args(const std::vector<std::string>& args) {
    std::vector<EnvParam> envs;
    for (const auto& arg : args) {
        auto [name, value] = split_pair(arg, '=', 1);
        EnvParam param(name.value_or(""), value);
        if (std::find(envs.begin(), envs.end(), param) == envs.end()) {
            envs.push_back(std::move(param));
        }
    }
    return envs;
}
