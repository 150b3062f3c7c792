/**
 * @file TaskWebServer.cpp
 * @brief Implementation of TaskWebServer.
 */

#include "infrastructure/TaskWebServer.hpp"

#include <iostream>
#include <utility>

#include "ui/InputTaskPage.hpp"

namespace tasktracker::infrastructure {

namespace {
constexpr std::size_t kMaxPayloadBytes = 64 * 1024;
constexpr const char* kHtml = "text/html; charset=utf-8";
constexpr const char* kText = "text/plain; charset=utf-8";
}

TaskWebServer::TaskWebServer(std::shared_ptr<application::AddTaskService> service, std::string host, int port)
    : m_service(std::move(service)), m_host(std::move(host)), m_port(port) {
    m_server.set_payload_max_length(kMaxPayloadBytes);
    m_server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cout << "[TaskWebServer] " << req.method << " " << req.path << " -> " << res.status << std::endl;
    });
    RegisterRoutes();
}

void TaskWebServer::RegisterRoutes() {
    m_server.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(ui::InputTaskPage(), kHtml);
    });

    m_server.Post("/", [this](const httplib::Request& req, httplib::Response& res) {
        HandleSubmit(req, res);
    });
}

domain::RawTaskInput TaskWebServer::ExtractForm(const httplib::Request& req) {
    domain::RawTaskInput input;
    for (auto field : {domain::TaskField::Start, domain::TaskField::Time,
                       domain::TaskField::Name, domain::TaskField::RepeatInfo}) {
        const char* key = domain::FieldKey(field);
        if (req.has_param(key)) {
            input[key] = req.get_param_value(key);
        }
    }
    return input;
}

void TaskWebServer::HandleSubmit(const httplib::Request& req, httplib::Response& res) {
    const auto outcome = m_service->Submit(ExtractForm(req));
    switch (outcome.status) {
        case application::SubmitStatus::Accepted:
            res.status = 200;
            res.set_content(ui::InputTaskPage(), kHtml);
            break;
        case application::SubmitStatus::InvalidInput:
            res.status = 400;
            res.set_content(outcome.message, kText);
            break;
        case application::SubmitStatus::ConnectionFailed:
        case application::SubmitStatus::Rejected:
            res.status = 502;
            res.set_content(outcome.message, kText);
            break;
    }
}

bool TaskWebServer::Listen() {
    std::cout << "[TaskWebServer] Running on " << m_host << ":" << m_port << std::endl;
    if (!m_server.listen(m_host, m_port)) {
        std::cerr << "[TaskWebServer] Cannot listen on " << m_host << ":" << m_port << std::endl;
        return false;
    }
    return true;
}

int TaskWebServer::BindToAnyPort() {
    int port = m_server.bind_to_any_port(m_host);
    if (port < 0) {
        std::cerr << "[TaskWebServer] Cannot bind " << m_host << std::endl;
        return -1;
    }
    m_port = port;
    return port;
}

bool TaskWebServer::ListenAfterBind() {
    std::cout << "[TaskWebServer] Running on " << m_host << ":" << m_port << std::endl;
    return m_server.listen_after_bind();
}

void TaskWebServer::Stop() {
    m_server.stop();
}

bool TaskWebServer::IsRunning() const {
    return m_server.is_running();
}

} // namespace tasktracker::infrastructure
