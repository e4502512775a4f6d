#include "platform.hpp"
#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path p = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return p;
}

fs::path current_dir() {
    std::error_code ec;
    fs::path p = fs::current_path(ec);
    if (ec) return fs::path("/");
    return p;
}

} // namespace platform
