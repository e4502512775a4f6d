#pragma once

#include <string>
#include <vector>
#include <params/params.hpp>
#include <params/uri.hpp>

// The validated parameters of one job. Names are unique across all five
// collections; construction throws CollisionError listing every repeated name.
class JobParameterSet {
public:
    JobParameterSet(std::vector<EnvParam> envs,
                    std::vector<FileParam> inputs,
                    std::vector<FileParam> recursive_inputs,
                    std::vector<FileParam> outputs,
                    std::vector<FileParam> recursive_outputs);

    const std::vector<EnvParam>& envs() const { return envs_; }
    const std::vector<FileParam>& inputs() const { return inputs_; }
    const std::vector<FileParam>& recursive_inputs() const { return recursive_inputs_; }
    const std::vector<FileParam>& outputs() const { return outputs_; }
    const std::vector<FileParam>& recursive_outputs() const { return recursive_outputs_; }

    // Every parameter name, envs first then inputs, recursive inputs,
    // outputs and recursive outputs.
    std::vector<std::string> names() const;

private:
    std::vector<EnvParam> envs_;
    std::vector<FileParam> inputs_;
    std::vector<FileParam> recursive_inputs_;
    std::vector<FileParam> outputs_;
    std::vector<FileParam> recursive_outputs_;
};

// Names that occur more than once, each listed once, in first-repeat order.
std::vector<std::string> find_duplicate_names(const std::vector<std::string>& names);

// Builds a JobParameterSet from raw flag values. Owns the auto-name counters,
// so use one builder per job.
class ParamSetBuilder {
public:
    explicit ParamSetBuilder(UriNormalizer normalizer = UriNormalizer());

    JobParameterSet build(const std::vector<std::string>& envs,
                          const std::vector<std::string>& inputs,
                          const std::vector<std::string>& inputs_recursive,
                          const std::vector<std::string>& outputs,
                          const std::vector<std::string>& outputs_recursive);

    // "INPUT_<n>" / "OUTPUT_<n>" when name is empty, otherwise name.
    std::string get_variable_name(ParamRole role, const std::string& name);

    // One FileParam from a name and raw value. An empty value declares the
    // parameter without a path.
    FileParam make_param(ParamRole role, const std::string& name,
                         const std::string& raw_uri, bool recursive) const;

    // "uri" or "NAME=uri" flags for one class.
    std::vector<FileParam> parse_file_args(ParamRole role,
                                           const std::vector<std::string>& args,
                                           bool recursive);

private:
    UriNormalizer normalizer_;
    int input_index_ = 0;
    int output_index_ = 0;
};

// Convenience wrapper using a fresh builder with the default normalizer.
JobParameterSet args_to_job_params(const std::vector<std::string>& envs,
                                   const std::vector<std::string>& inputs,
                                   const std::vector<std::string>& inputs_recursive,
                                   const std::vector<std::string>& outputs,
                                   const std::vector<std::string>& outputs_recursive);
