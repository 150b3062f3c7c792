/**
 * @file TaskWebUIApp.cpp
 * @brief Implementation of the TaskWebUIApp class.
 */
#include "app/TaskWebUIApp.hpp"

#include <iostream>
#include <utility>

#include "application/AddTaskService.hpp"
#include "infrastructure/TaskTrackerClient.hpp"

namespace tasktracker::app {

TaskWebUIApp::TaskWebUIApp(std::optional<std::string> configPath)
    : m_configPath(std::move(configPath)) {}

bool TaskWebUIApp::Init() {
    auto path = infrastructure::ConfigLoader::ResolveConfigPath(m_configPath);
    if (!path) {
        std::cerr << "[TaskWebUIApp] No configuration file found. Pass one as argument or set TASKTRACKER_CONFIG."
                  << std::endl;
        return false;
    }

    m_config = infrastructure::ConfigLoader::Load(*path);
    if (!m_config) {
        return false;
    }

    auto client = std::make_shared<infrastructure::TaskTrackerClient>(m_config->api.BaseUrl(),
                                                                      m_config->api.AddTaskPath());
    std::cout << "[TaskWebUIApp] Tasks are posted to " << client->baseUrl() << client->addTaskPath() << std::endl;

    auto service = std::make_shared<application::AddTaskService>(client);
    m_server = std::make_unique<infrastructure::TaskWebServer>(service, m_config->webui.host, m_config->webui.port);
    return true;
}

int TaskWebUIApp::Run() {
    if (!Init()) {
        return 1;
    }
    return m_server->Listen() ? 0 : 1;
}

} // namespace tasktracker::app
