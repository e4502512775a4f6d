#include "request_builder.hpp"
#include <core/log.hpp>
#include <pipeline/actions.hpp>
#include <fmt/format.h>

JobParameterSet build_job_params(const Config& config) {
    const auto& job = config.job();
    ParamSetBuilder builder;
    return builder.build(job.envs, job.inputs, job.inputs_recursive,
                         job.outputs, job.outputs_recursive);
}

RequestDocument build_request(const Config& config) {
    ResourceSpec resources = config.resource_spec();
    std::string timeout = config.timeout();
    JobParameterSet params = build_job_params(config);
    auto actions = build_actions(params, config.job().steps);

    minsub_log(fmt::format("build: {} user step(s) from {}", config.job().steps.size(),
                           config.job_path().empty() ? "<memory>" : config.job_path().string()));
    return assemble_request(resources, params, actions, timeout);
}
