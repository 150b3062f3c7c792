/**
 * @file TaskTrackerClient.hpp
 * @brief Low-level HTTP client for the TaskTracker REST API.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "domain/TaskTrackerGateway.hpp"

namespace tasktracker::infrastructure {

/**
 * @class TaskTrackerClient
 * @brief Implements TaskTrackerGateway with a blocking HTTP POST.
 */
class TaskTrackerClient : public domain::TaskTrackerGateway {
public:
    static constexpr int kDefaultTimeoutSeconds = 10;

    /**
     * @param baseUrl "scheme://host:port" (scheme optional, defaults to http).
     * @param addTaskPath Endpoint path, e.g. "/api/add_task".
     * @param timeoutSeconds Applied to connect, read and write.
     */
    TaskTrackerClient(const std::string& baseUrl,
                      const std::string& addTaskPath,
                      int timeoutSeconds = kDefaultTimeoutSeconds);

    /** @brief Sends a POST request to the add-task endpoint. @see domain::TaskTrackerGateway::addTask */
    void addTask(const nlohmann::json& payload) override;

    const std::string& baseUrl() const { return m_baseUrl; }
    const std::string& addTaskPath() const { return m_addTaskPath; }

private:
    std::string m_baseUrl;
    std::string m_addTaskPath;
    int m_timeoutSeconds;
};

} // namespace tasktracker::infrastructure
