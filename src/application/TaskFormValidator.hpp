/**
 * @file TaskFormValidator.hpp
 * @brief Structural validation of the add-task form fields.
 */

#pragma once

#include <map>
#include <optional>
#include <string>

#include "domain/RecurrenceRule.hpp"
#include "domain/TaskCreationRequest.hpp"
#include "domain/TaskField.hpp"
#include "domain/TaskFormError.hpp"

namespace tasktracker::application {

/**
 * @struct ValidatedTaskInput
 * @brief Typed form fields, structurally valid but not yet composed.
 */
struct ValidatedTaskInput {
    domain::StartDate date;
    domain::StartTime time;
    std::string name;
    domain::RecurrenceRule repeat;
};

/**
 * @class TaskFormValidator
 * @brief Turns raw string fields into typed components.
 *
 * Stateless. Every operation either returns a value or throws
 * domain::TaskFormError.
 */
class TaskFormValidator {
public:
    /**
     * @brief Parses "YYYY-M-D" into three integers.
     * @throws domain::TaskFormError InvalidStartDate when absent, not three
     *         dash-separated components, or a component is not an integer.
     */
    static domain::StartDate ParseStartDate(const std::optional<std::string>& raw);

    /**
     * @brief Parses "H:M" into two integers.
     * @throws domain::TaskFormError InvalidStartTime when absent, not two
     *         colon-separated components, or a component is not an integer.
     */
    static domain::StartTime ParseStartTime(const std::optional<std::string>& raw);

    /**
     * @brief Returns the task name unchanged.
     * @throws domain::TaskFormError MissingTaskName when absent, empty or blank.
     */
    static std::string ValidateName(const std::optional<std::string>& raw);

    /**
     * @brief Looks up a repeat keyword (case-sensitive).
     * @throws domain::TaskFormError UnknownRepeatKeyword for anything outside the table.
     */
    static domain::RecurrenceRule ResolveRepeat(const std::optional<std::string>& raw);

    /**
     * @brief Runs the four checks in order date, time, name, repeat.
     * The first failing check aborts validation.
     */
    static ValidatedTaskInput Validate(const domain::RawTaskInput& input);

    /** @brief Every accepted repeat keyword with the rule it maps to. */
    static const std::map<std::string, domain::RecurrenceRule>& RepeatKeywordTable();
};

} // namespace tasktracker::application
