/**
 * @file TaskTrackerGateway.hpp
 * @brief Interface to the remote service that stores tasks.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace tasktracker::domain {

/**
 * @class TaskTrackerError
 * @brief Transport-level failure talking to the TaskTracker API.
 *
 * Kept apart from TaskFormError: the submission itself was valid.
 */
class TaskTrackerError : public std::runtime_error {
public:
    enum class Reason {
        ConnectionFailed, ///< No HTTP response at all.
        Rejected          ///< The API answered with a non-200 status.
    };

    TaskTrackerError(Reason reason, const std::string& message, int status = 0, std::string body = {})
        : std::runtime_error(message), m_reason(reason), m_status(status), m_body(std::move(body)) {}

    Reason reason() const { return m_reason; }
    int status() const { return m_status; }
    const std::string& body() const { return m_body; }

private:
    Reason m_reason;
    int m_status;
    std::string m_body;
};

/**
 * @class TaskTrackerGateway
 * @brief Abstract sink for translated add-task payloads.
 *
 * Implementations block until the remote side has answered and throw on
 * transport failure or rejection.
 */
class TaskTrackerGateway {
public:
    virtual ~TaskTrackerGateway() = default;

    /**
     * @brief Sends one add-task request body.
     * @param payload JSON object with taskName, taskStart, taskRepeatInfo, taskRepeatType.
     * @throws TaskTrackerError
     */
    virtual void addTask(const nlohmann::json& payload) = 0;
};

} // namespace tasktracker::domain
