#include "config.hpp"
#include "constants.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "time_utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

// Scalars stand in for one-element lists: `inputs: gs://b/x` == `inputs: [gs://b/x]`.
static std::vector<std::string> as_string_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node || node.IsNull()) return out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                throw ConfigurationError("Expected a list of strings, found a nested map or list");
            }
            out.push_back(item.as<std::string>());
        }
    } else {
        throw ConfigurationError("Expected a string or a list of strings");
    }
    return out;
}

static EnvMap parse_env_map(const YAML::Node& node) {
    EnvMap env;
    if (!node || node.IsNull()) return env;
    if (!node.IsMap()) {
        throw ConfigurationError("Step environment must be a map");
    }
    for (const auto& kv : node) {
        if (kv.second.IsNull()) {
            env[kv.first.as<std::string>()] = std::nullopt;
        } else {
            env[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    }
    return env;
}

// env: accepts ["A=1", "B"] or {A: 1, B: ~}
static std::vector<std::string> parse_env_flags(const YAML::Node& node) {
    if (node && node.IsMap()) {
        std::vector<std::string> flags;
        for (const auto& kv : node) {
            std::string name = kv.first.as<std::string>();
            if (kv.second.IsNull()) {
                flags.push_back(name);
            } else {
                flags.push_back(name + "=" + kv.second.as<std::string>(""));
            }
        }
        return flags;
    }
    return as_string_list(node);
}

static ResourceDefaults parse_resources(const YAML::Node& node) {
    ResourceDefaults res;
    res.project = node["project"].as<std::string>("");
    res.region = node["region"].as<std::string>("");
    res.machine_type = node["machine_type"].as<std::string>("");
    res.disk_size = node["disk_size"].as<std::string>("");
    res.timeout = node["timeout"].as<std::string>("");

    if (node["service_account"] && !node["service_account"].IsNull()) {
        res.service_account = node["service_account"].as<std::string>();
    }
    res.scopes = as_string_list(node["scopes"]);

    return res;
}

static UserStep parse_step(const YAML::Node& node, size_t index) {
    if (!node.IsMap()) {
        throw ConfigurationError(fmt::format("Step {} must be a map", index + 1));
    }

    std::string name = node["name"].as<std::string>(fmt::format("{}{}", USER_ACTION_PREFIX, index + 1));
    std::string image = node["image"].as<std::string>(DEBIAN_IMAGE);
    std::string timeout = ONE_DAY;
    if (node["timeout"]) {
        timeout = normalize_timeout(node["timeout"].as<std::string>(""));
    }

    bool has_script = node["script"] && !node["script"].IsNull();
    bool has_command = node["command"] && !node["command"].IsNull();
    if (has_script == has_command) {
        throw ConfigurationError(fmt::format(
            "Step '{}' must set exactly one of 'script' or 'command'", name));
    }

    UserStep step;
    step.name = name;
    step.image = image;
    step.timeout = timeout;
    if (has_script) {
        step.script = node["script"].as<std::string>();
    } else {
        step.commands = as_string_list(node["command"]);
    }
    if (node["entrypoint"] && !node["entrypoint"].IsNull()) {
        step.entrypoint = node["entrypoint"].as<std::string>();
    }
    step.environment = parse_env_map(node["environment"]);
    step.flags = as_string_list(node["flags"]);
    return step;
}

static JobConfig parse_job_config(const YAML::Node& node) {
    JobConfig job;
    job.envs = parse_env_flags(node["env"]);
    job.inputs = as_string_list(node["inputs"]);
    job.inputs_recursive = as_string_list(node["inputs_recursive"]);
    job.outputs = as_string_list(node["outputs"]);
    job.outputs_recursive = as_string_list(node["outputs_recursive"]);

    const auto& steps = node["steps"];
    if (!steps || !steps.IsSequence() || steps.size() == 0) {
        throw ConfigurationError("Job file defines no steps");
    }
    for (size_t i = 0; i < steps.size(); i++) {
        job.steps.push_back(parse_step(steps[i], i));
    }
    return job;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / GLOBAL_CONFIG_DIR;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / GLOBAL_CONFIG_FILE;
}

fs::path get_job_config_path(const fs::path& dir) {
    return dir / JOB_FILE_NAME;
}

Result<Config> Config::load_global() {
    Config config;
    if (!global_config_exists()) {
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(get_global_config_path().string());
        if (root.IsMap()) {
            config.resources_ = parse_resources(root);
        }
        minsub_log("config: loaded " + get_global_config_path().string());
        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse global config: " + std::string(e.what()));
    } catch (const MinsubError& e) {
        return Result<Config>::Err("Invalid global config: " + std::string(e.what()));
    }
}

Result<Config> Config::parse_job(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root.IsMap()) {
            return Result<Config>::Err("Job file must be a YAML map");
        }
        Config config;
        config.resources_ = parse_resources(root);
        config.job_ = parse_job_config(root);
        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse job file: " + std::string(e.what()));
    } catch (const MinsubError& e) {
        return Result<Config>::Err("Invalid job file: " + std::string(e.what()));
    }
}

Result<Config> Config::load_job(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Job file not found: " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Failed to read job file: " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse_job(text);
    if (result.is_ok()) {
        result.value.job_path_ = path;
        minsub_log("config: loaded " + path.string());
    }
    return result;
}

Result<Config> Config::load(const fs::path& job_path) {
    auto global = load_global();
    if (global.is_err()) {
        return global;
    }

    auto job = load_job(job_path);
    if (job.is_err()) {
        return job;
    }

    job.value.merge_defaults(global.value.resources());
    return job;
}

void Config::merge_defaults(const ResourceDefaults& defaults) {
    if (resources_.project.empty()) resources_.project = defaults.project;
    if (resources_.region.empty()) resources_.region = defaults.region;
    if (resources_.machine_type.empty()) resources_.machine_type = defaults.machine_type;
    if (resources_.disk_size.empty()) resources_.disk_size = defaults.disk_size;
    if (!resources_.service_account) resources_.service_account = defaults.service_account;
    if (resources_.scopes.empty()) resources_.scopes = defaults.scopes;
    if (resources_.timeout.empty()) resources_.timeout = defaults.timeout;
}

ResourceSpec Config::resource_spec() const {
    int disk_size = DEFAULT_DISK_SIZE_GB;
    if (!resources_.disk_size.empty()) {
        disk_size = parse_disk_size_gb(resources_.disk_size);
        if (disk_size <= 0) {
            throw ConfigurationError(fmt::format("Invalid disk size: '{}'", resources_.disk_size));
        }
    }

    std::string machine_type = resources_.machine_type.empty()
        ? std::string(DEFAULT_MACHINE_TYPE) : resources_.machine_type;

    return ResourceSpec(resources_.project, resources_.region, machine_type, disk_size,
                        resources_.service_account, resources_.scopes);
}

std::string Config::timeout() const {
    if (resources_.timeout.empty()) return SEVEN_DAYS;
    return normalize_timeout(resources_.timeout);
}
