/**
 * @file TaskCreationRequest.hpp
 * @brief Validated task ready to be sent to the TaskTracker API.
 */

#pragma once

#include <cstdint>
#include <string>

#include "domain/RecurrenceRule.hpp"

namespace tasktracker::domain {

/// Calendar date as entered in the form. Not checked for feasibility.
struct StartDate {
    int year = 0;
    int month = 0;
    int day = 0;
};

/// Time of day as entered in the form. Not range-checked.
struct StartTime {
    int hour = 0;
    int minute = 0;
};

/**
 * @struct TaskCreationRequest
 * @brief Outbound value object, one per accepted submission.
 *
 * Invariant: name is not blank.
 */
struct TaskCreationRequest {
    std::string name;            ///< taskName.
    std::int64_t startEpoch = 0; ///< taskStart, Unix seconds composed in local time.
    RecurrenceRule repeat;       ///< taskRepeatType / taskRepeatInfo.

    bool operator==(const TaskCreationRequest& other) const {
        return name == other.name &&
               startEpoch == other.startEpoch &&
               repeat == other.repeat;
    }
};

} // namespace tasktracker::domain
