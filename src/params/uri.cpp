#include "uri.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <cstring>

std::string directory_fmt(const std::string& directory) {
    size_t end = directory.find_last_not_of('/');
    if (end == std::string::npos) return "/";
    return directory.substr(0, end + 1) + "/";
}

std::pair<std::string, std::string> split_uri(const std::string& uri) {
    size_t slash = uri.rfind('/');
    if (slash == std::string::npos) return {"", uri};

    size_t scheme = uri.find("://");
    if (scheme != std::string::npos && slash < scheme + 3) {
        return {uri, ""};
    }

    std::string head = uri.substr(0, slash + 1);
    std::string tail = uri.substr(slash + 1);

    // Drop trailing slashes from the head, but never the root or the
    // scheme separator.
    size_t keep = scheme != std::string::npos ? scheme + 3 : 1;
    size_t end = head.size();
    while (end > keep && head[end - 1] == '/') end--;
    head.resize(end);
    return {head, tail};
}

std::string normpath(const std::string& path) {
    bool absolute = !path.empty() && path[0] == '/';
    std::vector<std::string> parts;
    for (const auto& comp : split(path, '/')) {
        if (comp.empty() || comp == ".") continue;
        if (comp == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!absolute) {
                parts.push_back(comp);
            }
            continue;
        }
        parts.push_back(comp);
    }

    std::string out = absolute ? "/" : "";
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += "/";
        out += parts[i];
    }
    return out.empty() ? "." : out;
}

std::optional<FileProvider> detect_provider(const std::string& uri) {
    if (starts_with(uri, GCS_SCHEME)) return FileProvider::Google;
    if (starts_with(uri, "file:")) return FileProvider::Local;
    if (uri.find("://") != std::string::npos) return std::nullopt;
    return FileProvider::Local;
}

void validate_uri_or_throw(const std::string& uri, bool recursive) {
    // Character ranges could be supported with more work; for now a basic
    // asterisk is the only wildcard. Brackets or '?' that happen to work
    // would do so by accident.
    if (uri.find('[') != std::string::npos || uri.find(']') != std::string::npos) {
        throw UriValidationError("Square brackets (character ranges) are not supported", uri);
    }
    if (uri.find('?') != std::string::npos) {
        throw UriValidationError("Question mark wildcards are not supported", uri);
    }
    // Copy commands quote URIs with double quotes; these would still expand.
    if (uri.find_first_of("\"$`\\\n") != std::string::npos) {
        throw UriValidationError("Shell metacharacters ($, `, \\, \", newline) are not supported", uri);
    }

    // Directory wildcards and "**" would expand to many parameters.
    auto [path, filename] = split_uri(uri);
    if (path.find('*') != std::string::npos) {
        throw UriValidationError("Path wildcards (*) are only supported for files", uri);
    }
    if (filename.find("**") != std::string::npos) {
        throw UriValidationError("Recursive wildcards (\"**\") are not supported", uri);
    }
    if (filename == "." || filename == "..") {
        throw UriValidationError("Path characters \"..\" and \".\" are not supported for file names", uri);
    }

    if (!recursive && filename.empty()) {
        throw UriValidationError(
            "Input or output values that are not recursive must reference a filename or wildcard",
            uri);
    }
}

std::pair<std::string, std::string> rewrite_gcs_uri(const std::string& raw_uri) {
    std::string rest = raw_uri.substr(std::strlen(GCS_SCHEME));
    if (rest.substr(0, rest.find('/')).empty()) {
        throw UriValidationError("Missing bucket name", raw_uri);
    }
    return {raw_uri, GCS_DOCKER_PREFIX + rest};
}

std::pair<std::string, std::string> rewrite_local_uri(const std::string& raw_uri) {
    std::string local = raw_uri;
    if (starts_with(local, "file://")) {
        local = local.substr(7);
    } else if (starts_with(local, "file:")) {
        local = local.substr(5);
    }

    // Only the directory is rewritten; the filename passes through.
    auto [raw_path, filename] = split_uri(local);
    bool home = raw_path == "~" || starts_with(raw_path, "~/");

    std::string resolved = raw_path;
    if (home) {
        resolved = join_path(platform::home_dir().string(), raw_path.substr(raw_path.size() > 1 ? 2 : 1));
    } else if (!starts_with(raw_path, "/")) {
        resolved = join_path(platform::current_dir().string(), raw_path);
    }
    std::string uri = directory_fmt(normpath(resolved)) + filename;

    std::string docker = normpath(raw_path.empty() ? "." : raw_path);
    std::vector<std::string> segments = split(docker, '/');
    for (auto& seg : segments) {
        if (seg == "..") seg = DOTDOT_TOKEN;
    }
    if (home && !segments.empty() && segments[0] == "~") {
        segments[0] = HOME_TOKEN;
    }

    std::string rel;
    for (const auto& seg : segments) {
        if (seg.empty() || seg == ".") continue;
        if (!rel.empty()) rel += "/";
        rel += seg;
    }
    std::string docker_path = directory_fmt(LOCAL_DOCKER_PREFIX + rel) + filename;
    return {uri, docker_path};
}

// The mount path is joined onto DATA_DISK_MOUNT, so it must stay relative and
// must not climb out of the mount root.
static void check_docker_path(const std::string& docker_path, const std::string& uri) {
    if (starts_with(docker_path, "/")) {
        throw UriValidationError("Mount path must be relative to the data disk", uri);
    }
    for (const auto& seg : split(docker_path, '/')) {
        if (seg == "..") {
            throw UriValidationError("Path traversal (\"..\") is not supported", uri);
        }
    }
}

// Cut at the last '/' without touching the head, so str() gives back the
// URI exactly, repeated slashes included.
static UriReference make_reference(const std::string& uri, bool recursive) {
    size_t slash = uri.rfind('/');
    size_t scheme = uri.find("://");
    if (slash == std::string::npos || (scheme != std::string::npos && slash < scheme + 3)) {
        return UriReference{directory_fmt(uri), "", recursive};
    }
    return UriReference{uri.substr(0, slash + 1), uri.substr(slash + 1), recursive};
}

UriNormalizer::UriNormalizer(std::set<FileProvider> providers)
    : providers_(std::move(providers)) {}

bool UriNormalizer::is_enabled(FileProvider provider) const {
    return providers_.count(provider) > 0;
}

NormalizedUri UriNormalizer::normalize(const std::string& raw_uri, bool recursive) const {
    // Assume recursive URIs are directory paths.
    std::string uri = recursive ? directory_fmt(raw_uri) : raw_uri;
    validate_uri_or_throw(uri, recursive);

    auto provider = detect_provider(uri);
    if (!provider || !is_enabled(*provider)) {
        throw UriValidationError("Unsupported file provider (expected gs://)", uri);
    }

    auto [normed, docker_path] = *provider == FileProvider::Google
        ? rewrite_gcs_uri(uri)
        : rewrite_local_uri(uri);
    check_docker_path(docker_path, uri);

    return NormalizedUri{make_reference(normed, recursive), docker_path};
}
