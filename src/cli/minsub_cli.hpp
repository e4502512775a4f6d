#pragma once

#include <string>
#include <filesystem>

// Front end for the `minsub` binary. Requests go to stdout; status and
// errors go to stderr so the output can be piped straight to a submitter.
class MinsubCLI {
public:
    // Print the request for a job file as JSON (or YAML). Returns the exit code.
    int run_build(const std::filesystem::path& job_path, bool yaml_output);

    // Validate a job file and list its parameters. Returns the exit code.
    int run_check(const std::filesystem::path& job_path);
};
