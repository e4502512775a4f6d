#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Environment bindings; a missing value is emitted as null.
using EnvMap = std::map<std::string, std::optional<std::string>>;

// Configuration structures
struct ResourceDefaults {
    std::string project;
    std::string region;
    std::string machine_type;
    std::string disk_size;                       // "200", "200G", "1T"
    std::optional<std::string> service_account;
    std::vector<std::string> scopes;
    std::string timeout;                         // "7d", "24h", "3600s", "1-00:00:00"
};

// One user container step as written in the job file. Either commands or
// script is set; a script runs under /bin/bash in strict mode.
struct UserStep {
    std::string name;
    std::string image;
    std::vector<std::string> commands;
    std::optional<std::string> script;
    std::optional<std::string> entrypoint;
    EnvMap environment;
    std::vector<std::string> flags;
    std::string timeout;                         // already formatted, e.g. "86400s"
};

struct JobConfig {
    std::vector<std::string> envs;               // "KEY" or "KEY=value"
    std::vector<std::string> inputs;             // "uri" or "NAME=uri"
    std::vector<std::string> inputs_recursive;
    std::vector<std::string> outputs;
    std::vector<std::string> outputs_recursive;
    std::vector<UserStep> steps;
};
