#pragma once

#include <string>
#include <pipeline/request.hpp>

// Render the request in the pipelines wire format: a single-line JSON object
// {"pipeline": {"actions", "resources", "environment", "timeout"}, "labels"}.
// Unset values are written as null. Throws std::runtime_error if the emitter
// reports an error.
std::string to_json(const RequestDocument& doc);

// Same tree as block YAML, for reading.
std::string to_yaml(const RequestDocument& doc);
