#include "job_params.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <set>

std::vector<std::string> find_duplicate_names(const std::vector<std::string>& names) {
    std::set<std::string> known;
    std::vector<std::string> duplicates;
    for (const auto& name : names) {
        if (known.insert(name).second) continue;
        if (std::find(duplicates.begin(), duplicates.end(), name) == duplicates.end()) {
            duplicates.push_back(name);
        }
    }
    return duplicates;
}

JobParameterSet::JobParameterSet(std::vector<EnvParam> envs,
                                 std::vector<FileParam> inputs,
                                 std::vector<FileParam> recursive_inputs,
                                 std::vector<FileParam> outputs,
                                 std::vector<FileParam> recursive_outputs)
    : envs_(std::move(envs)),
      inputs_(std::move(inputs)),
      recursive_inputs_(std::move(recursive_inputs)),
      outputs_(std::move(outputs)),
      recursive_outputs_(std::move(recursive_outputs)) {
    auto duplicates = find_duplicate_names(names());
    if (!duplicates.empty()) {
        throw CollisionError(duplicates);
    }
}

std::vector<std::string> JobParameterSet::names() const {
    std::vector<std::string> out;
    for (const auto& e : envs_) out.push_back(e.name);
    for (const auto* set : {&inputs_, &recursive_inputs_, &outputs_, &recursive_outputs_}) {
        for (const auto& f : *set) out.push_back(f.name);
    }
    return out;
}

// ── Builder ────────────────────────────────────────────────

ParamSetBuilder::ParamSetBuilder(UriNormalizer normalizer)
    : normalizer_(std::move(normalizer)) {}

std::string ParamSetBuilder::get_variable_name(ParamRole role, const std::string& name) {
    if (!name.empty()) return name;
    if (role == ParamRole::Input) {
        return fmt::format("{}{}", AUTO_PREFIX_INPUT, input_index_++);
    }
    return fmt::format("{}{}", AUTO_PREFIX_OUTPUT, output_index_++);
}

FileParam ParamSetBuilder::make_param(ParamRole role, const std::string& name,
                                      const std::string& raw_uri, bool recursive) const {
    if (raw_uri.empty()) {
        return FileParam(role, name, std::nullopt, std::nullopt, std::nullopt, recursive);
    }
    // Validate the name before touching the URI so a bad name is reported
    // as such even when the URI is also bad.
    validate_param_name(name, param_type_label(role));
    auto normalized = normalizer_.normalize(raw_uri, recursive);
    return FileParam(role, name, raw_uri, normalized.docker_path, normalized.uri, recursive);
}

std::vector<FileParam> ParamSetBuilder::parse_file_args(ParamRole role,
                                                        const std::vector<std::string>& args,
                                                        bool recursive) {
    std::vector<FileParam> params;
    for (const auto& arg : args) {
        auto [name, value] = split_pair(arg, '=', 0);
        std::string var_name = get_variable_name(role, name.value_or(""));
        FileParam param = make_param(role, var_name, value.value_or(""), recursive);
        if (std::find(params.begin(), params.end(), param) == params.end()) {
            params.push_back(std::move(param));
        }
    }
    return params;
}

JobParameterSet ParamSetBuilder::build(const std::vector<std::string>& envs,
                                       const std::vector<std::string>& inputs,
                                       const std::vector<std::string>& inputs_recursive,
                                       const std::vector<std::string>& outputs,
                                       const std::vector<std::string>& outputs_recursive) {
    auto env_data = parse_env_args(envs);
    auto input_data = parse_file_args(ParamRole::Input, inputs, false);
    auto r_input_data = parse_file_args(ParamRole::Input, inputs_recursive, true);
    auto output_data = parse_file_args(ParamRole::Output, outputs, false);
    auto r_output_data = parse_file_args(ParamRole::Output, outputs_recursive, true);

    minsub_log(fmt::format("params: {} env, {} input, {} recursive input, {} output, {} recursive output",
                           env_data.size(), input_data.size(), r_input_data.size(),
                           output_data.size(), r_output_data.size()));

    return JobParameterSet(std::move(env_data), std::move(input_data), std::move(r_input_data),
                           std::move(output_data), std::move(r_output_data));
}

JobParameterSet args_to_job_params(const std::vector<std::string>& envs,
                                   const std::vector<std::string>& inputs,
                                   const std::vector<std::string>& inputs_recursive,
                                   const std::vector<std::string>& outputs,
                                   const std::vector<std::string>& outputs_recursive) {
    ParamSetBuilder builder;
    return builder.build(envs, inputs, inputs_recursive, outputs, outputs_recursive);
}
