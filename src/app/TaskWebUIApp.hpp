/**
 * @file TaskWebUIApp.hpp
 * @brief Main application class for the TaskTracker web UI.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/TaskWebServer.hpp"

namespace tasktracker::app {

/**
 * @class TaskWebUIApp
 * @brief Loads configuration, wires the services and runs the HTTP server.
 */
class TaskWebUIApp {
public:
    /**
     * @param configPath Optional configuration file given on the command line.
     */
    explicit TaskWebUIApp(std::optional<std::string> configPath = std::nullopt);

    /**
     * @brief Starts the server and blocks until it stops.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    /**
     * @brief Resolves and loads the configuration, then builds the server.
     * @return True if initialization succeeded.
     */
    bool Init();

    std::optional<std::string> m_configPath;
    std::optional<infrastructure::AppConfig> m_config;
    std::unique_ptr<infrastructure::TaskWebServer> m_server;
};

} // namespace tasktracker::app
