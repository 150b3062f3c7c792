#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace tasktracker::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr const char* kAppDirName = "tasktracker";
constexpr const char* kConfigFileName = "tasktracker.json";
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetUserConfigFile() {
    return GetConfigHome() / kAppDirName / kConfigFileName;
}

fs::path PathUtils::GetSystemConfigFile() {
    return fs::path("/etc") / kAppDirName / kConfigFileName;
}

} // namespace tasktracker::infrastructure
