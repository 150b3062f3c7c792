/**
 * @file TaskWebServer.hpp
 * @brief HTTP front end serving the add-task form.
 */

#pragma once

#include <memory>
#include <string>

#include <httplib.h>

#include "application/AddTaskService.hpp"
#include "domain/TaskField.hpp"

namespace tasktracker::infrastructure {

/**
 * @class TaskWebServer
 * @brief Routes GET / to the form page and POST / to AddTaskService.
 *
 * Responses for POST /:
 *  - 200 with the form page when the task was added,
 *  - 400 text/plain when the form input is invalid,
 *  - 502 text/plain when the TaskTracker API failed.
 */
class TaskWebServer {
public:
    TaskWebServer(std::shared_ptr<application::AddTaskService> service, std::string host, int port);

    /** @brief Binds the configured host/port and serves until Stop(). */
    bool Listen();

    /** @brief Binds the configured host on an ephemeral port. @return The port, or -1. */
    int BindToAnyPort();

    /** @brief Serves on a socket bound by BindToAnyPort(). Blocks until Stop(). */
    bool ListenAfterBind();

    void Stop();
    bool IsRunning() const;

    /** @brief First value of each known form field in the request. */
    static domain::RawTaskInput ExtractForm(const httplib::Request& req);

private:
    void RegisterRoutes();
    void HandleSubmit(const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<application::AddTaskService> m_service;
    std::string m_host;
    int m_port;
    httplib::Server m_server;
};

} // namespace tasktracker::infrastructure
