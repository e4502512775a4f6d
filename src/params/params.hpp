#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>
#include <params/uri.hpp>

// Check that a name is a POSIX shell variable name ([A-Za-z_][A-Za-z0-9_]*).
bool is_valid_param_name(const std::string& name);

// Throws NameValidationError naming param_type ("Input parameter", ...).
void validate_param_name(const std::string& name, const std::string& param_type);

// Name/value parameter exported to every action's environment.
struct EnvParam {
    std::string name;
    std::optional<std::string> value;

    // Throws NameValidationError.
    explicit EnvParam(std::string name, std::optional<std::string> value = std::nullopt);

    bool operator==(const EnvParam& o) const { return name == o.name && value == o.value; }
};

enum class ParamRole {
    Input,    // localized onto the data disk before user actions
    Output,   // delocalized from the data disk after user actions
};

const char* param_type_label(ParamRole role);

// File parameter to be localized or delocalized.
//
// name:        parameter and environment variable name.
// value:       the string the user gave, unset for a declared-only parameter.
// docker_path: location on the data disk relative to DATA_DISK_MOUNT; also
//              the environment variable value.
// uri:         the remote location split into path and basename.
struct FileParam {
    ParamRole role;
    std::string name;
    std::optional<std::string> value;
    std::optional<std::string> docker_path;
    std::optional<UriReference> uri;
    bool recursive = false;

    // Throws NameValidationError.
    FileParam(ParamRole role,
              std::string name,
              std::optional<std::string> value = std::nullopt,
              std::optional<std::string> docker_path = std::nullopt,
              std::optional<UriReference> uri = std::nullopt,
              bool recursive = false);

    bool operator==(const FileParam& o) const {
        return role == o.role && name == o.name && value == o.value &&
               docker_path == o.docker_path && uri == o.uri && recursive == o.recursive;
    }
};

// Split "a=b" on the first separator. When the separator is missing the
// element at nullable_idx (0 or 1) is unset and the other holds the input.
// Throws std::invalid_argument if nullable_idx is not 0 or 1.
std::pair<std::optional<std::string>, std::optional<std::string>>
split_pair(const std::string& pair_string, char separator, int nullable_idx = 1);

// "KEY" or "KEY=value" flags to EnvParams, first occurrence order, exact
// repeats dropped.
std::vector<EnvParam> parse_env_args(const std::vector<std::string>& args);
