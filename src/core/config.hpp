#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"
#include "resource_spec.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global defaults from ~/.minsub/config.yaml (empty if missing)
    static Result<Config> load_global();

    // Load a job description from a minsub.yaml file
    static Result<Config> load_job(const fs::path& path);

    // Parse a job description from YAML text
    static Result<Config> parse_job(const std::string& yaml_text);

    // Load both and combine (job file overrides global defaults)
    static Result<Config> load(const fs::path& job_path);

    // Accessors
    const ResourceDefaults& resources() const { return resources_; }
    const JobConfig& job() const { return job_; }
    const fs::path& job_path() const { return job_path_; }

    // Validated resources. Throws ConfigurationError.
    ResourceSpec resource_spec() const;

    // Pipeline timeout as "<seconds>s", SEVEN_DAYS when unset.
    // Throws ConfigurationError.
    std::string timeout() const;

    // Fill every unset resource field from defaults.
    void merge_defaults(const ResourceDefaults& defaults);

public:
    Config() = default;

private:
    ResourceDefaults resources_;
    JobConfig job_;
    fs::path job_path_;
};

bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_job_config_path(const fs::path& dir);
