/**
 * @file TaskField.hpp
 * @brief Form fields submitted by the task input page.
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace tasktracker::domain {

/**
 * @enum TaskField
 * @brief The four keys of the add-task form.
 */
enum class TaskField {
    Start,      ///< "task_start", date as YYYY-M-D.
    Time,       ///< "task_time", time of day as H:M.
    Name,       ///< "task_name".
    RepeatInfo  ///< "repeat_info", recurrence keyword.
};

/// Form key as it appears in the submitted body.
inline const char* FieldKey(TaskField field) {
    switch (field) {
        case TaskField::Start: return "task_start";
        case TaskField::Time: return "task_time";
        case TaskField::Name: return "task_name";
        case TaskField::RepeatInfo: return "repeat_info";
    }
    return "";
}

/**
 * @brief Raw submission: field key -> value. A missing key means the
 * browser did not send the field at all.
 */
using RawTaskInput = std::map<std::string, std::string>;

inline std::optional<std::string> GetField(const RawTaskInput& input, TaskField field) {
    auto it = input.find(FieldKey(field));
    if (it == input.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace tasktracker::domain
