#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/constants.hpp>

// Virtual machine resources for one pipeline run. Validated on construction
// and immutable afterwards.
class ResourceSpec {
public:
    // Throws ConfigurationError if project, region or machine type is empty,
    // disk_size_gb is not positive, or a scope is empty. An empty scope list
    // falls back to DEFAULT_SCOPE.
    ResourceSpec(std::string project,
                 std::string region,
                 std::string machine_type = DEFAULT_MACHINE_TYPE,
                 int disk_size_gb = DEFAULT_DISK_SIZE_GB,
                 std::optional<std::string> service_account = std::nullopt,
                 std::vector<std::string> scopes = {DEFAULT_SCOPE});

    const std::string& project() const { return project_; }
    const std::string& region() const { return region_; }
    const std::string& machine_type() const { return machine_type_; }
    int disk_size_gb() const { return disk_size_gb_; }
    const std::optional<std::string>& service_account() const { return service_account_; }
    const std::vector<std::string>& scopes() const { return scopes_; }

private:
    std::string project_;
    std::string region_;
    std::string machine_type_;
    int disk_size_gb_;
    std::optional<std::string> service_account_;
    std::vector<std::string> scopes_;
};

// Parse a disk size string like "200", "200G", "200GB", "1T" to gigabytes.
// Returns 0 on parse failure or when the size does not fit in an int.
int parse_disk_size_gb(const std::string& size_str);
