#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "infrastructure/TaskTrackerClient.hpp"

using namespace tasktracker::infrastructure;
using tasktracker::domain::TaskTrackerError;

namespace {

// Loopback stand-in for the TaskTracker API.
class FakeTaskTrackerApi {
public:
    FakeTaskTrackerApi() {
        m_server.Post("/api/add_task", [this](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_lastBody = req.body;
                m_lastContentType = req.get_header_value("Content-Type");
            }
            res.status = m_status.load();
            res.set_content(m_status.load() == 200 ? "ok" : "database locked", "text/plain");
        });
        m_port = m_server.bind_to_any_port("127.0.0.1");
        assert(m_port > 0);
        m_thread = std::thread([this]() { m_server.listen_after_bind(); });
    }

    ~FakeTaskTrackerApi() {
        m_server.stop();
        if (m_thread.joinable()) m_thread.join();
    }

    int port() const { return m_port; }
    void setStatus(int status) { m_status = status; }

    std::string lastBody() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastBody;
    }

    std::string lastContentType() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastContentType;
    }

private:
    httplib::Server m_server;
    std::thread m_thread;
    int m_port = -1;
    std::atomic<int> m_status{200};
    mutable std::mutex m_mutex;
    std::string m_lastBody;
    std::string m_lastContentType;
};

} // namespace

int main() {
    std::cout << "[Test] Starting TaskTrackerClient Test..." << std::endl;

    const nlohmann::json payload = {
        {"taskName", "Water plants"},
        {"taskStart", 1710495000},
        {"taskRepeatInfo", 7},
        {"taskRepeatType", 4}
    };

    {
        FakeTaskTrackerApi api;
        TaskTrackerClient client("http://127.0.0.1:" + std::to_string(api.port()), "/api/add_task");
        client.addTask(payload);

        auto received = nlohmann::json::parse(api.lastBody());
        assert(received == payload);
        assert(api.lastContentType().find("application/json") != std::string::npos);
        std::cout << "[PASS] Payload posted as JSON." << std::endl;

        api.setStatus(500);
        bool rejected = false;
        try {
            client.addTask(payload);
        } catch (const TaskTrackerError& e) {
            rejected = true;
            assert(e.reason() == TaskTrackerError::Reason::Rejected);
            assert(e.status() == 500);
            assert(e.body() == "database locked");
        }
        assert(rejected);
        std::cout << "[PASS] Non-200 answer reported as rejection." << std::endl;
    }

    // A port nobody serves: either refused or no answer before the timeout.
    int closedPort = -1;
    {
        httplib::Server probe;
        closedPort = probe.bind_to_any_port("127.0.0.1");
    }
    assert(closedPort > 0);

    TaskTrackerClient unreachable("http://127.0.0.1:" + std::to_string(closedPort), "/api/add_task", 2);
    bool failed = false;
    try {
        unreachable.addTask(payload);
    } catch (const TaskTrackerError& e) {
        failed = true;
        assert(e.reason() == TaskTrackerError::Reason::ConnectionFailed);
    }
    assert(failed);
    std::cout << "[PASS] Unreachable API reported as connection failure." << std::endl;

    std::cout << "[PASS] TaskTrackerClient Test." << std::endl;
    return 0;
}
