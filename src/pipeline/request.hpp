#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <core/constants.hpp>
#include <core/resource_spec.hpp>
#include <core/types.hpp>
#include <params/job_params.hpp>
#include <pipeline/actions.hpp>

struct Disk {
    std::string name;
    int size_gb;
};

struct ServiceAccount {
    std::vector<std::string> scopes;
    std::optional<std::string> email;
};

struct VirtualMachine {
    std::string machine_type;
    bool preemptible = false;
    std::vector<Disk> disks;
    ServiceAccount service_account;
};

struct Resources {
    std::string project_id;
    std::vector<std::string> regions;
    VirtualMachine virtual_machine;
};

class RequestDocument;

// Throws CollisionError (repeated name) or ConfigurationError (empty timeout).
RequestDocument assemble_request(const ResourceSpec& resources,
                                 const JobParameterSet& job,
                                 const std::vector<ActionSpec>& actions,
                                 const std::string& timeout = SEVEN_DAYS);

// A complete pipelines request. Only assemble_request() builds one; it holds
// copies of everything it needs and is never changed afterwards.
class RequestDocument {
public:
    const std::vector<ActionSpec>& actions() const { return actions_; }
    const Resources& resources() const { return resources_; }
    const EnvMap& environment() const { return environment_; }
    const std::string& timeout() const { return timeout_; }
    const std::map<std::string, std::string>& labels() const { return labels_; }

private:
    RequestDocument() = default;

    std::vector<ActionSpec> actions_;
    Resources resources_;
    EnvMap environment_;
    std::string timeout_;
    std::map<std::string, std::string> labels_;

    friend RequestDocument assemble_request(const ResourceSpec&, const JobParameterSet&,
                                            const std::vector<ActionSpec>&, const std::string&);
};

// Flatten every parameter into one name -> value map. File parameters map to
// their absolute path on the data disk. Throws CollisionError on a repeated name.
EnvMap merge_environment(const JobParameterSet& job);

// The resources block for a ResourceSpec.
Resources make_resources(const ResourceSpec& spec);
