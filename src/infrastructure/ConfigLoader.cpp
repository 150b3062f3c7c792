/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

namespace tasktracker::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kConfigEnvVar = "TASKTRACKER_CONFIG";

std::optional<std::string> ReadString(const json& section, const char* sectionName, const char* key) {
    if (!section.contains(key) || !section[key].is_string() || section[key].get<std::string>().empty()) {
        std::cerr << "[ConfigLoader] Missing or empty string '" << sectionName << "." << key << "'" << std::endl;
        return std::nullopt;
    }
    return section[key].get<std::string>();
}

// Ports may be written as numbers or, INI style, as numeric strings.
std::optional<int> ReadPort(const json& section, const char* sectionName, const char* key) {
    if (!section.contains(key)) {
        std::cerr << "[ConfigLoader] Missing port '" << sectionName << "." << key << "'" << std::endl;
        return std::nullopt;
    }
    const json& value = section[key];
    long port = -1;
    if (value.is_number_integer()) {
        port = value.get<long>();
    } else if (value.is_string()) {
        const std::string s = value.get<std::string>();
        if (!s.empty() && s.size() <= 5 &&
            std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
            port = std::stol(s);
        }
    }
    if (port < 1 || port > 65535) {
        std::cerr << "[ConfigLoader] Invalid port '" << sectionName << "." << key << "': " << value.dump() << std::endl;
        return std::nullopt;
    }
    return static_cast<int>(port);
}

} // namespace

std::string TaskTrackerApiConfig::BaseUrl() const {
    std::string host = hostAddress;
    while (!host.empty() && host.back() == '/') {
        host.pop_back();
    }
    return host + ":" + std::to_string(port);
}

std::string TaskTrackerApiConfig::AddTaskPath() const {
    if (!addTaskApi.empty() && addTaskApi.front() == '/') {
        return addTaskApi;
    }
    return "/" + addTaskApi;
}

std::optional<fs::path> ConfigLoader::ResolveConfigPath(const std::optional<std::string>& explicitPath) {
    if (explicitPath && !explicitPath->empty()) {
        return fs::path(*explicitPath);
    }

    const char* fromEnv = std::getenv(kConfigEnvVar);
    if (fromEnv && *fromEnv) {
        return fs::path(fromEnv);
    }

    for (const fs::path& candidate : {PathUtils::GetUserConfigFile(), PathUtils::GetSystemConfigFile()}) {
        std::error_code ec;
        if (fs::exists(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<AppConfig> ConfigLoader::Load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        std::cerr << "[ConfigLoader] Config file not found: " << path << std::endl;
        return std::nullopt;
    }

    try {
        std::ifstream f(path);
        if (!f.is_open()) {
            std::cerr << "[ConfigLoader] Cannot open " << path << std::endl;
            return std::nullopt;
        }
        json j = json::parse(f);
        auto config = FromJson(j);
        if (config) {
            std::cout << "[ConfigLoader] Loaded " << path << std::endl;
        }
        return config;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<AppConfig> ConfigLoader::FromJson(const json& j) {
    if (!j.is_object() || !j.contains("webui") || !j["webui"].is_object()) {
        std::cerr << "[ConfigLoader] Missing section 'webui'" << std::endl;
        return std::nullopt;
    }
    if (!j.contains("tasktrackerapi") || !j["tasktrackerapi"].is_object()) {
        std::cerr << "[ConfigLoader] Missing section 'tasktrackerapi'" << std::endl;
        return std::nullopt;
    }

    const json& webui = j["webui"];
    const json& api = j["tasktrackerapi"];

    AppConfig config;

    auto webPort = ReadPort(webui, "webui", "port");
    if (!webPort) return std::nullopt;
    config.webui.port = *webPort;
    if (webui.contains("host")) {
        auto host = ReadString(webui, "webui", "host");
        if (!host) return std::nullopt;
        config.webui.host = *host;
    }

    auto hostAddress = ReadString(api, "tasktrackerapi", "hostaddress");
    auto apiPort = ReadPort(api, "tasktrackerapi", "port");
    auto addTaskApi = ReadString(api, "tasktrackerapi", "addTaskApi");
    if (!hostAddress || !apiPort || !addTaskApi) {
        return std::nullopt;
    }
    config.api.hostAddress = *hostAddress;
    config.api.port = *apiPort;
    config.api.addTaskApi = *addTaskApi;

    return config;
}

} // namespace tasktracker::infrastructure
