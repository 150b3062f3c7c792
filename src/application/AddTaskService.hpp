/**
 * @file AddTaskService.hpp
 * @brief Application service behind the add-task form.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "domain/TaskCreationRequest.hpp"
#include "domain/TaskField.hpp"
#include "domain/TaskTrackerGateway.hpp"

namespace tasktracker::application {

/**
 * @enum SubmitStatus
 * @brief How a single form submission ended.
 */
enum class SubmitStatus {
    Accepted,         ///< Forwarded and acknowledged by the API.
    InvalidInput,     ///< Rejected by validation, nothing was sent.
    ConnectionFailed, ///< The API could not be reached.
    Rejected          ///< The API answered with an error status.
};

struct SubmitOutcome {
    SubmitStatus status = SubmitStatus::InvalidInput;
    std::string message;                               ///< Plain text for the user.
    std::optional<domain::TaskCreationRequest> request; ///< Set once translation succeeded.
};

/**
 * @class AddTaskService
 * @brief Validates, translates and forwards one submission at a time.
 *
 * Holds no per-request state, so the web server may call Submit from
 * several worker threads at once.
 */
class AddTaskService {
public:
    explicit AddTaskService(std::shared_ptr<domain::TaskTrackerGateway> gateway);

    /** @brief Runs the full pipeline for one form submission. */
    SubmitOutcome Submit(const domain::RawTaskInput& input) const;

private:
    std::shared_ptr<domain::TaskTrackerGateway> m_gateway;
};

} // namespace tasktracker::application
