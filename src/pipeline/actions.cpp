#include "actions.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

Mount data_disk_mount() {
    return Mount{DATA_DISK_NAME, DATA_DISK_MOUNT, false};
}

std::string strict_bash_script(const std::string& body) {
    return fmt::format(
        "set -o errexit\n"
        "set -o nounset\n"
        "set -o pipefail\n"
        "\n"
        "{}\n", body);
}

static std::string copy_command(bool recursive, const std::string& src, const std::string& dst) {
    if (recursive) {
        return fmt::format("gsutil -mq rsync -r \"{}\" \"{}\"", src, dst);
    }
    return fmt::format("gsutil -mq cp \"{}\" \"{}\"", src, dst);
}

static std::string on_disk(const FileParam& param) {
    return join_path(DATA_DISK_MOUNT, param.docker_path.value_or(""));
}

// Base shape of the stage-in/stage-out actions.
static ActionSpec copy_action(const std::string& name, const std::vector<std::string>& copy_lines) {
    std::string body;
    for (size_t i = 0; i < copy_lines.size(); i++) {
        if (i > 0) body += "\n";
        body += copy_lines[i];
    }

    ActionSpec action;
    action.name = name;
    action.image_uri = CLOUD_SDK_IMAGE;
    action.entrypoint = std::string(BASH_ENTRYPOINT);
    action.commands = {"-c", strict_bash_script(body)};
    action.mounts = {data_disk_mount()};
    action.timeout = ONE_DAY;
    return action;
}

ActionSpec make_localize_action(const JobParameterSet& job) {
    std::vector<std::string> lines;
    for (const auto* set : {&job.inputs(), &job.recursive_inputs()}) {
        for (const auto& input : *set) {
            // Declared-only parameters have nothing to copy.
            if (!input.uri) continue;
            lines.push_back(copy_command(input.recursive, input.uri->str(), on_disk(input)));
        }
    }
    return copy_action(LOCALIZE_ACTION_NAME, lines);
}

ActionSpec make_delocalize_action(const JobParameterSet& job) {
    std::vector<std::string> lines;
    for (const auto* set : {&job.outputs(), &job.recursive_outputs()}) {
        for (const auto& output : *set) {
            if (!output.uri) continue;
            lines.push_back(copy_command(output.recursive, on_disk(output), output.uri->str()));
        }
    }
    return copy_action(DELOCALIZE_ACTION_NAME, lines);
}

ActionSpec make_user_action(const UserStep& step) {
    if (step.name.empty()) {
        throw ConfigurationError("User action is missing a name");
    }
    if (step.script && !step.commands.empty()) {
        throw ConfigurationError(fmt::format("User action '{}' sets both a script and a command",
                                             step.name));
    }
    if (!step.script && step.commands.empty()) {
        throw ConfigurationError(fmt::format("User action '{}' has no command", step.name));
    }

    ActionSpec action;
    action.name = step.name;
    action.image_uri = step.image.empty() ? DEBIAN_IMAGE : step.image;
    if (step.script) {
        action.entrypoint = step.entrypoint.value_or(BASH_ENTRYPOINT);
        action.commands = {"-c", strict_bash_script(*step.script)};
    } else {
        action.entrypoint = step.entrypoint;
        action.commands = step.commands;
    }
    action.environment = step.environment;
    action.flags = step.flags;
    action.mounts = {data_disk_mount()};
    action.timeout = step.timeout.empty() ? ONE_DAY : step.timeout;
    return action;
}

UserStep make_script_step(const std::string& name, const std::string& image,
                          const std::string& script, const std::string& timeout) {
    UserStep step;
    step.name = name;
    step.image = image;
    step.script = script;
    step.timeout = timeout;
    return step;
}

std::vector<ActionSpec> build_actions(const JobParameterSet& job,
                                      const std::vector<UserStep>& steps) {
    std::vector<ActionSpec> actions;
    actions.push_back(make_localize_action(job));
    for (const auto& step : steps) {
        actions.push_back(make_user_action(step));
    }
    actions.push_back(make_delocalize_action(job));
    return actions;
}
