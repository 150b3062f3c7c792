/**
 * @file TaskTranslator.hpp
 * @brief Maps validated form fields onto the TaskTracker API schema.
 */

#pragma once

#include <cstdint>

#include <nlohmann/json.hpp>

#include "application/TaskFormValidator.hpp"
#include "domain/TaskCreationRequest.hpp"

namespace tasktracker::application {

/**
 * @class TaskTranslator
 * @brief Composes the start instant and builds the outbound request.
 *
 * Times are always interpreted in the local time zone of the server process.
 * There is deliberately no per-request time zone.
 */
class TaskTranslator {
public:
    /**
     * @brief Local calendar date + time of day -> Unix seconds.
     *
     * Seconds are zero. DST ambiguities are resolved by the C library.
     * @throws domain::TaskFormError InvalidStartDate for any date/time the
     *         composition cannot place (Feb 30, month 13, year outside
     *         1..9999, hour outside 0..23, minute outside 0..59).
     */
    static std::int64_t ComposeLocalInstant(const domain::StartDate& date, const domain::StartTime& time);

    /** @brief Builds the request from already validated fields. */
    static domain::TaskCreationRequest Translate(const ValidatedTaskInput& input);

    /** @brief Serializes a request into the add-task wire object. */
    static nlohmann::json ToPayload(const domain::TaskCreationRequest& request);

    /**
     * @brief Date, time, name, composition, then repeat keyword.
     * @throws domain::TaskFormError from whichever stage fails first.
     */
    static domain::TaskCreationRequest BuildRequest(const domain::RawTaskInput& input);
};

} // namespace tasktracker::application
