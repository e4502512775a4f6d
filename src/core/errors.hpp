#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// Base for every user-facing validation failure. The CLI prints kind() and
// what() and exits non-zero.
class MinsubError : public std::runtime_error {
public:
    explicit MinsubError(const std::string& msg) : std::runtime_error(msg) {}
    virtual const char* kind() const { return "Error"; }
};

// Parameter name is not a POSIX shell variable name.
class NameValidationError : public MinsubError {
public:
    NameValidationError(const std::string& param_type, const std::string& name)
        : MinsubError("Invalid " + param_type + ": " + name), name_(name) {}

    const char* kind() const override { return "Invalid name"; }
    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// URI rejected by the normalizer (provider, wildcard, traversal, basename).
class UriValidationError : public MinsubError {
public:
    UriValidationError(const std::string& msg, const std::string& uri)
        : MinsubError(msg + ": " + uri), uri_(uri) {}

    const char* kind() const override { return "Invalid URI"; }
    const std::string& uri() const { return uri_; }

private:
    std::string uri_;
};

// One or more parameter names used more than once in a job.
class CollisionError : public MinsubError {
public:
    explicit CollisionError(std::vector<std::string> duplicates);

    const char* kind() const override { return "Name collision"; }
    const std::vector<std::string>& duplicates() const { return duplicates_; }

private:
    std::vector<std::string> duplicates_;
};

// Malformed resources, timeouts or job file.
class ConfigurationError : public MinsubError {
public:
    explicit ConfigurationError(const std::string& msg) : MinsubError(msg) {}
    const char* kind() const override { return "Configuration error"; }
};
