#include "request.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

EnvMap merge_environment(const JobParameterSet& job) {
    EnvMap envs;
    std::vector<std::string> names;

    auto bind = [&](const std::string& name, std::optional<std::string> value) {
        names.push_back(name);
        envs.emplace(name, std::move(value));
    };

    for (const auto& env : job.envs()) {
        bind(env.name, env.value);
    }
    for (const auto* set : {&job.inputs(), &job.recursive_inputs(),
                            &job.outputs(), &job.recursive_outputs()}) {
        for (const auto& file : *set) {
            std::optional<std::string> value;
            if (file.docker_path) value = join_path(DATA_DISK_MOUNT, *file.docker_path);
            bind(file.name, value);
        }
    }

    // JobParameterSet already rejects repeats, so this should never fire.
    auto duplicates = find_duplicate_names(names);
    if (!duplicates.empty()) {
        throw CollisionError(duplicates);
    }
    return envs;
}

Resources make_resources(const ResourceSpec& spec) {
    VirtualMachine vm;
    vm.machine_type = spec.machine_type();
    vm.preemptible = false;
    vm.disks = {Disk{DATA_DISK_NAME, spec.disk_size_gb()}};
    vm.service_account.scopes = spec.scopes();
    vm.service_account.email = spec.service_account();

    Resources resources;
    resources.project_id = spec.project();
    resources.regions = {spec.region()};
    resources.virtual_machine = vm;
    return resources;
}

RequestDocument assemble_request(const ResourceSpec& resources,
                                 const JobParameterSet& job,
                                 const std::vector<ActionSpec>& actions,
                                 const std::string& timeout) {
    if (timeout.empty()) {
        throw ConfigurationError("Missing pipeline timeout");
    }

    RequestDocument doc;
    doc.actions_ = actions;
    doc.resources_ = make_resources(resources);
    doc.environment_ = merge_environment(job);
    doc.timeout_ = timeout;
    doc.labels_ = {{LABEL_KEY, LABEL_VALUE}};

    minsub_log(fmt::format("request: project={} region={} actions={} env={} timeout={}",
                           resources.project(), resources.region(), actions.size(),
                           doc.environment_.size(), timeout));
    return doc;
}
