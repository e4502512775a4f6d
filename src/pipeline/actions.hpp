#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <params/job_params.hpp>

struct Mount {
    std::string disk;
    std::string path;
    bool read_only = false;
};

// One pipeline action: a container run with its own commands and environment.
struct ActionSpec {
    std::string name;
    std::string image_uri;
    std::optional<std::string> entrypoint;
    std::vector<std::string> commands;
    EnvMap environment;
    std::vector<std::string> flags;
    std::vector<Mount> mounts;
    std::string timeout;
};

// The data disk mount shared by every action.
Mount data_disk_mount();

// Prefix a script with errexit/nounset/pipefail.
std::string strict_bash_script(const std::string& body);

// Copy every input (cp) and recursive input (rsync -r) onto the data disk.
ActionSpec make_localize_action(const JobParameterSet& job);

// Copy every output (cp) and recursive output (rsync -r) back to storage.
ActionSpec make_delocalize_action(const JobParameterSet& job);

// A caller-defined container step. Empty image and timeout fall back to
// DEBIAN_IMAGE and ONE_DAY.
ActionSpec make_user_action(const UserStep& step);

// A user step that runs a shell script under /bin/bash in strict mode.
UserStep make_script_step(const std::string& name, const std::string& image,
                          const std::string& script, const std::string& timeout = ONE_DAY);

// localize, then one action per user step in order, then delocalize.
std::vector<ActionSpec> build_actions(const JobParameterSet& job,
                                      const std::vector<UserStep>& steps);
