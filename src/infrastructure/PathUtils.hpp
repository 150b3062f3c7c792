// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace tasktracker::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetUserConfigFile();
    static std::filesystem::path GetSystemConfigFile();
};

} // namespace tasktracker::infrastructure
