#include "minsub_cli.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <pipeline/request_builder.hpp>
#include <pipeline/request_writer.hpp>
#include <fmt/format.h>
#include <iostream>

static void print_error(const MinsubError& e) {
    std::cerr << theme::fail(fmt::format("{}: {}", e.kind(), e.what()));
}

static std::string describe(const FileParam& param) {
    if (!param.uri) return theme::dim("(unset)");
    std::string kind = param.recursive ? "dir " : "file";
    return fmt::format("{} {} -> {}/{}", kind, param.uri->str(), DATA_DISK_MOUNT,
                       param.docker_path.value_or(""));
}

int MinsubCLI::run_build(const std::filesystem::path& job_path, bool yaml_output) {
    minsub_log("cli: build " + job_path.string());

    auto config = Config::load(job_path);
    if (config.is_err()) {
        std::cerr << theme::fail(config.error);
        return 1;
    }

    try {
        RequestDocument doc = build_request(config.value);
        std::cout << (yaml_output ? to_yaml(doc) : to_json(doc)) << "\n";
        return 0;
    } catch (const MinsubError& e) {
        minsub_log(fmt::format("cli: build failed: {}", e.what()));
        print_error(e);
        return 1;
    }
}

int MinsubCLI::run_check(const std::filesystem::path& job_path) {
    minsub_log("cli: check " + job_path.string());

    auto config = Config::load(job_path);
    if (config.is_err()) {
        std::cerr << theme::fail(config.error);
        return 1;
    }

    try {
        ResourceSpec resources = config.value.resource_spec();
        std::string timeout = config.value.timeout();
        JobParameterSet params = build_job_params(config.value);

        std::cerr << theme::section("Resources");
        std::cerr << theme::kv("project", resources.project());
        std::cerr << theme::kv("region", resources.region());
        std::cerr << theme::kv("machine", resources.machine_type());
        std::cerr << theme::kv("disk", fmt::format("{} GB", resources.disk_size_gb()));
        std::cerr << theme::kv("timeout", timeout);

        std::cerr << theme::section("Parameters");
        for (const auto& env : params.envs()) {
            std::cerr << theme::kv(env.name, env.value.value_or(theme::dim("(unset)")));
        }
        for (const auto* set : {&params.inputs(), &params.recursive_inputs()}) {
            for (const auto& f : *set) std::cerr << theme::kv(f.name, "in  " + describe(f));
        }
        for (const auto* set : {&params.outputs(), &params.recursive_outputs()}) {
            for (const auto& f : *set) std::cerr << theme::kv(f.name, "out " + describe(f));
        }

        std::cerr << "\n" << theme::ok(fmt::format("{} step(s), job file is valid",
                                                  config.value.job().steps.size()));
        return 0;
    } catch (const MinsubError& e) {
        minsub_log(fmt::format("cli: check failed: {}", e.what()));
        print_error(e);
        return 1;
    }
}
