#pragma once

#include <string>
#include <set>
#include <utility>
#include <optional>

// Where a file parameter's data lives outside the VM.
enum class FileProvider {
    Google,   // gs://bucket/object
    Local,    // file:/..., ~/..., ./..., plain paths
};

// A URI split into its hierarchical location and the trailing name.
//
//   | uri                         | path                  | basename   |
//   |-----------------------------+-----------------------+------------|
//   | gs://bucket/folder/file.txt | gs://bucket/folder/   | file.txt   |
//   | gs://bucket/folder/         | gs://bucket/folder/   |            |
//   | /tmp/ab.txt                 | /tmp/                 | ab.txt     |
struct UriReference {
    std::string path;       // the URI up to and including its last '/'
    std::string basename;   // file name or wildcard; empty for a directory
    bool recursive = false;

    std::string str() const { return path + basename; }

    bool operator==(const UriReference& o) const {
        return path == o.path && basename == o.basename && recursive == o.recursive;
    }
};

struct NormalizedUri {
    UriReference uri;
    std::string docker_path;   // relative to DATA_DISK_MOUNT
};

// Ensure a directory reference ends with exactly one '/'.
std::string directory_fmt(const std::string& directory);

// Split at the last '/' into (head, tail) like POSIX dirname/basename. The
// slashes of a "scheme://" separator never count, so "gs://bucket" splits to
// ("gs://bucket", "").
std::pair<std::string, std::string> split_uri(const std::string& uri);

// Lexically collapse "." and ".." segments and repeated slashes.
// Returns "." for an empty result.
std::string normpath(const std::string& path);

// Provider for a raw URI, or nullopt for an unknown scheme (http://, s3://).
std::optional<FileProvider> detect_provider(const std::string& uri);

// Wildcard, traversal and basename rules shared by every provider.
// Throws UriValidationError.
void validate_uri_or_throw(const std::string& uri, bool recursive);

// Returns (uri, docker_path). The uri is unchanged; the docker path swaps
// "gs://" for "gs/". Throws UriValidationError when no bucket is named.
std::pair<std::string, std::string> rewrite_gcs_uri(const std::string& raw_uri);

// Returns (uri, docker_path) for a local file or directory. The uri is made
// absolute with "~" expanded; the docker path is rooted at "file/" with
// leading ".." rewritten as "_dotdot_" and "~" as "_home_" so nothing about
// the invoking host's layout reaches the VM. The basename is never rewritten.
std::pair<std::string, std::string> rewrite_local_uri(const std::string& raw_uri);

class UriNormalizer {
public:
    // Only the Google provider is enabled unless a caller opts in to more.
    explicit UriNormalizer(std::set<FileProvider> providers = {FileProvider::Google});

    // Validate and rewrite one flag value. Recursive values are coerced to
    // directory form first. Throws UriValidationError.
    NormalizedUri normalize(const std::string& raw_uri, bool recursive) const;

    bool is_enabled(FileProvider provider) const;

private:
    std::set<FileProvider> providers_;
};
