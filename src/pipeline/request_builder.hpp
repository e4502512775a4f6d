#pragma once

#include <core/config.hpp>
#include <params/job_params.hpp>
#include <pipeline/request.hpp>

// Run the whole chain for one loaded job file: parameters, actions, request.
// Throws MinsubError subclasses for every validation failure.
RequestDocument build_request(const Config& config);

// Just the parameter stage, for `minsub check`.
JobParameterSet build_job_params(const Config& config);
