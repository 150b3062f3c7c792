#include "infrastructure/TaskTrackerClient.hpp"
#include <httplib.h>
#include <iostream>

namespace tasktracker::infrastructure {

using json = nlohmann::json;
using domain::TaskTrackerError;

TaskTrackerClient::TaskTrackerClient(const std::string& baseUrl,
                                     const std::string& addTaskPath,
                                     int timeoutSeconds)
    : m_baseUrl(baseUrl), m_addTaskPath(addTaskPath), m_timeoutSeconds(timeoutSeconds) {}

void TaskTrackerClient::addTask(const json& payload) {
    httplib::Client cli(m_baseUrl);
    cli.set_connection_timeout(m_timeoutSeconds, 0);
    cli.set_read_timeout(m_timeoutSeconds, 0);
    cli.set_write_timeout(m_timeoutSeconds, 0);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    // Server certificates are not verified.
    cli.enable_server_certificate_verification(false);
#endif

    auto res = cli.Post(m_addTaskPath, payload.dump(), "application/json");
    if (!res) {
        const int code = static_cast<int>(res.error());
        std::cerr << "[TaskTrackerClient] Connection failed: " << code << std::endl;
        throw TaskTrackerError(TaskTrackerError::Reason::ConnectionFailed,
                               "Connection to " + m_baseUrl + m_addTaskPath + " failed (httplib error " +
                               std::to_string(code) + ")");
    }

    if (res->status != 200) {
        std::cerr << "[TaskTrackerClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        throw TaskTrackerError(TaskTrackerError::Reason::Rejected,
                               "TaskTracker API answered HTTP " + std::to_string(res->status),
                               res->status, res->body);
    }
}

} // namespace tasktracker::infrastructure
