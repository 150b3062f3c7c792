/**
 * @file AddTaskService.cpp
 * @brief Implementation of AddTaskService.
 */

#include "application/AddTaskService.hpp"

#include <iostream>
#include <sstream>
#include <utility>

#include "application/TaskTranslator.hpp"
#include "domain/TaskFormError.hpp"

namespace tasktracker::application {

namespace {

std::string DescribeInput(const domain::RawTaskInput& input) {
    std::ostringstream out;
    out << "{";
    bool first = true;
    for (const auto& [key, value] : input) {
        if (!first) out << ", ";
        out << "'" << key << "': '" << value << "'";
        first = false;
    }
    out << "}";
    return out.str();
}

} // namespace

AddTaskService::AddTaskService(std::shared_ptr<domain::TaskTrackerGateway> gateway)
    : m_gateway(std::move(gateway)) {}

SubmitOutcome AddTaskService::Submit(const domain::RawTaskInput& input) const {
    std::cout << "[AddTaskService] Received form: " << DescribeInput(input) << std::endl;

    SubmitOutcome outcome;
    try {
        outcome.request = TaskTranslator::BuildRequest(input);
    } catch (const domain::TaskFormError& e) {
        std::cerr << "[AddTaskService] Error in post data (" << domain::ErrorKindToString(e.kind())
                  << ", " << domain::FieldIssueToString(e.issue()) << "): " << e.what() << std::endl;
        outcome.status = SubmitStatus::InvalidInput;
        outcome.message = e.what();
        return outcome;
    }

    try {
        m_gateway->addTask(TaskTranslator::ToPayload(*outcome.request));
    } catch (const domain::TaskTrackerError& e) {
        if (e.reason() == domain::TaskTrackerError::Reason::ConnectionFailed) {
            std::cerr << "[AddTaskService] ConnectionError: " << e.what() << std::endl;
            outcome.status = SubmitStatus::ConnectionFailed;
            outcome.message = "Failed to connect to TaskTracker API.";
        } else {
            std::cerr << "[AddTaskService] TaskTracker API rejected task (HTTP " << e.status() << "): "
                      << e.body() << std::endl;
            outcome.status = SubmitStatus::Rejected;
            outcome.message = "TaskTracker API rejected the task: " + e.body();
        }
        return outcome;
    }

    std::cout << "[AddTaskService] Task '" << outcome.request->name << "' added, start "
              << outcome.request->startEpoch << ", repeat "
              << domain::RepeatTypeToString(outcome.request->repeat.type) << "/"
              << outcome.request->repeat.info << std::endl;
    outcome.status = SubmitStatus::Accepted;
    outcome.message = "Task added.";
    return outcome;
}

} // namespace tasktracker::application
