#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>

#include "application/AddTaskService.hpp"
#include "infrastructure/TaskWebServer.hpp"

using namespace tasktracker;

namespace {

// Mock gateway that keeps what it was sent.
class RecordingGateway : public domain::TaskTrackerGateway {
public:
    void addTask(const nlohmann::json& payload) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_unreachable) {
            throw domain::TaskTrackerError(domain::TaskTrackerError::Reason::ConnectionFailed, "refused");
        }
        m_payloads.push_back(payload);
    }

    void setUnreachable(bool unreachable) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_unreachable = unreachable;
    }

    std::vector<nlohmann::json> payloads() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_payloads;
    }

private:
    mutable std::mutex m_mutex;
    bool m_unreachable = false;
    std::vector<nlohmann::json> m_payloads;
};

} // namespace

int main() {
    std::cout << "[Test] Starting TaskWebServer Test..." << std::endl;
    setenv("TZ", "UTC0", 1);
    tzset();

    auto gateway = std::make_shared<RecordingGateway>();
    auto service = std::make_shared<application::AddTaskService>(gateway);
    infrastructure::TaskWebServer server(service, "127.0.0.1", 0);

    const int port = server.BindToAnyPort();
    assert(port > 0);
    std::thread serverThread([&server]() { server.ListenAfterBind(); });

    httplib::Client cli("127.0.0.1", port);
    cli.set_read_timeout(5, 0);

    auto page = cli.Get("/");
    assert(page && page->status == 200);
    assert(page->body.find("name=\"task_name\"") != std::string::npos);
    assert(page->body.find("value=\"four_weeks\"") != std::string::npos);
    std::cout << "[PASS] GET / serves the form." << std::endl;

    httplib::Params form = {
        {"task_start", "2024-3-15"},
        {"task_time", "9:30"},
        {"task_name", "Water plants"},
        {"repeat_info", "weekly"},
    };
    auto added = cli.Post("/", form);
    assert(added && added->status == 200);
    assert(added->body.find("<form") != std::string::npos);

    auto sent = gateway->payloads();
    assert(sent.size() == 1);
    assert(sent[0]["taskName"] == "Water plants");
    assert(sent[0]["taskStart"].get<std::int64_t>() == 1710495000);
    assert(sent[0]["taskRepeatInfo"].get<std::int64_t>() == 7);
    assert(sent[0]["taskRepeatType"].get<int>() == 4);
    std::cout << "[PASS] POST / forwards a valid task." << std::endl;

    httplib::Params bogus = form;
    bogus.erase("repeat_info");
    bogus.emplace("repeat_info", "bogus");
    auto rejected = cli.Post("/", bogus);
    assert(rejected && rejected->status == 400);
    assert(rejected->body.find("bogus") != std::string::npos);

    httplib::Params noTime = form;
    noTime.erase("task_time");
    auto missing = cli.Post("/", noTime);
    assert(missing && missing->status == 400);
    assert(missing->body.find("task_time") != std::string::npos);

    assert(gateway->payloads().size() == 1);
    std::cout << "[PASS] POST / rejects invalid input as plain text." << std::endl;

    gateway->setUnreachable(true);
    auto down = cli.Post("/", form);
    assert(down && down->status == 502);
    assert(down->body == "Failed to connect to TaskTracker API.");
    std::cout << "[PASS] POST / reports an unreachable API." << std::endl;

    server.Stop();
    serverThread.join();

    std::cout << "[PASS] TaskWebServer Test." << std::endl;
    return 0;
}
