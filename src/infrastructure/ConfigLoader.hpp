/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the service configuration (tasktracker.json).
 *
 * Keeps JSON parsing of the configuration in one place. The file holds two
 * sections: "webui" (where the form is served) and "tasktrackerapi" (where
 * tasks are sent).
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace tasktracker::infrastructure {

struct WebUIConfig {
    std::string host = "0.0.0.0"; ///< Listen address.
    int port = 0;                 ///< Listen port.
};

struct TaskTrackerApiConfig {
    std::string hostAddress; ///< Scheme and host, e.g. "http://localhost".
    int port = 0;
    std::string addTaskApi;  ///< Path of the add-task endpoint, without leading slash.

    /** @brief "<hostAddress>:<port>", as accepted by httplib::Client. */
    std::string BaseUrl() const;

    /** @brief "/<addTaskApi>". */
    std::string AddTaskPath() const;
};

struct AppConfig {
    WebUIConfig webui;
    TaskTrackerApiConfig api;
};

class ConfigLoader {
public:
    /**
     * @brief Picks the configuration file to use.
     *
     * Order: explicit path, TASKTRACKER_CONFIG, the user config file under
     * XDG_CONFIG_HOME, /etc/tasktracker/tasktracker.json. An explicit path or
     * environment override is returned even if it does not exist so that the
     * load error names it.
     * @return The path, or nullopt if no candidate exists.
     */
    static std::optional<std::filesystem::path> ResolveConfigPath(const std::optional<std::string>& explicitPath);

    /**
     * @brief Reads and parses a configuration file.
     * @return The configuration, or nullopt after logging the reason.
     */
    static std::optional<AppConfig> Load(const std::filesystem::path& path);

    /**
     * @brief Builds the configuration from an already parsed document.
     * @return The configuration, or nullopt after logging the missing/invalid key.
     */
    static std::optional<AppConfig> FromJson(const nlohmann::json& j);
};

} // namespace tasktracker::infrastructure
