#include "request_writer.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

static void emit_optional(YAML::Emitter& out, const std::optional<std::string>& value) {
    if (value) {
        out << *value;
    } else {
        out << YAML::Null;
    }
}

static void emit_strings(YAML::Emitter& out, const std::vector<std::string>& values) {
    out << YAML::BeginSeq;
    for (const auto& v : values) out << v;
    out << YAML::EndSeq;
}

static void emit_env(YAML::Emitter& out, const EnvMap& env) {
    out << YAML::BeginMap;
    for (const auto& [name, value] : env) {
        out << YAML::Key << name << YAML::Value;
        emit_optional(out, value);
    }
    out << YAML::EndMap;
}

static void emit_action(YAML::Emitter& out, const ActionSpec& action) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << action.name;
    out << YAML::Key << "imageUri" << YAML::Value << action.image_uri;
    out << YAML::Key << "commands" << YAML::Value;
    emit_strings(out, action.commands);
    out << YAML::Key << "environment" << YAML::Value;
    emit_env(out, action.environment);
    out << YAML::Key << "flags" << YAML::Value;
    emit_strings(out, action.flags);

    out << YAML::Key << "mounts" << YAML::Value << YAML::BeginSeq;
    for (const auto& mount : action.mounts) {
        out << YAML::BeginMap;
        out << YAML::Key << "disk" << YAML::Value << mount.disk;
        out << YAML::Key << "path" << YAML::Value << mount.path;
        out << YAML::Key << "readOnly" << YAML::Value << mount.read_only;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "timeout" << YAML::Value << action.timeout;
    if (action.entrypoint) {
        out << YAML::Key << "entrypoint" << YAML::Value << *action.entrypoint;
    }
    out << YAML::EndMap;
}

static void emit_resources(YAML::Emitter& out, const Resources& resources) {
    const auto& vm = resources.virtual_machine;

    out << YAML::BeginMap;
    out << YAML::Key << "projectId" << YAML::Value << resources.project_id;
    out << YAML::Key << "regions" << YAML::Value;
    emit_strings(out, resources.regions);

    out << YAML::Key << "virtualMachine" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "machineType" << YAML::Value << vm.machine_type;
    out << YAML::Key << "preemptible" << YAML::Value << vm.preemptible;
    out << YAML::Key << "disks" << YAML::Value << YAML::BeginSeq;
    for (const auto& disk : vm.disks) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << disk.name;
        out << YAML::Key << "sizeGb" << YAML::Value << disk.size_gb;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "serviceAccount" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "scopes" << YAML::Value;
    emit_strings(out, vm.service_account.scopes);
    if (vm.service_account.email) {
        out << YAML::Key << "email" << YAML::Value << *vm.service_account.email;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    out << YAML::EndMap;
}

static void emit_document(YAML::Emitter& out, const RequestDocument& doc) {
    out << YAML::BeginMap;
    out << YAML::Key << "pipeline" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "actions" << YAML::Value << YAML::BeginSeq;
    for (const auto& action : doc.actions()) {
        emit_action(out, action);
    }
    out << YAML::EndSeq;
    out << YAML::Key << "resources" << YAML::Value;
    emit_resources(out, doc.resources());
    out << YAML::Key << "environment" << YAML::Value;
    emit_env(out, doc.environment());
    out << YAML::Key << "timeout" << YAML::Value << doc.timeout();
    out << YAML::EndMap;

    out << YAML::Key << "labels" << YAML::Value << YAML::BeginMap;
    for (const auto& [key, value] : doc.labels()) {
        out << YAML::Key << key << YAML::Value << value;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;
}

static std::string finish(const YAML::Emitter& out) {
    if (!out.good()) {
        throw std::runtime_error("Failed to render request: " + out.GetLastError());
    }
    return std::string(out.c_str());
}

std::string to_json(const RequestDocument& doc) {
    // JSON is the flow-style, double-quoted subset of YAML.
    YAML::Emitter out;
    out.SetOutputCharset(YAML::EscapeAsJson);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetBoolFormat(YAML::TrueFalseBool);
    out.SetNullFormat(YAML::LowerNull);
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    emit_document(out, doc);
    return finish(out);
}

std::string to_yaml(const RequestDocument& doc) {
    YAML::Emitter out;
    out.SetBoolFormat(YAML::TrueFalseBool);
    out.SetNullFormat(YAML::LowerNull);
    emit_document(out, doc);
    return finish(out);
}
