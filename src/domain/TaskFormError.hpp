/**
 * @file TaskFormError.hpp
 * @brief Validation errors raised while turning form input into a task.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "domain/TaskField.hpp"

namespace tasktracker::domain {

/**
 * @enum TaskFormErrorKind
 * @brief Which stage of the form rejected the submission.
 */
enum class TaskFormErrorKind {
    InvalidStartDate,
    InvalidStartTime,
    MissingTaskName,
    UnknownRepeatKeyword
};

/**
 * @enum FieldIssue
 * @brief What exactly was wrong with the offending field.
 */
enum class FieldIssue {
    Absent,       ///< Key not present in the submission.
    Empty,        ///< Present but empty or blank.
    WrongArity,   ///< Wrong number of separated components.
    NotANumber,   ///< A component is not an integer.
    OutOfRange,   ///< Integers parse but do not form a real date/time.
    Unrecognized  ///< Value not in the accepted set.
};

inline std::string ErrorKindToString(TaskFormErrorKind kind) {
    switch (kind) {
        case TaskFormErrorKind::InvalidStartDate: return "InvalidStartDate";
        case TaskFormErrorKind::InvalidStartTime: return "InvalidStartTime";
        case TaskFormErrorKind::MissingTaskName: return "MissingTaskName";
        case TaskFormErrorKind::UnknownRepeatKeyword: return "UnknownRepeatKeyword";
        default: return "Unknown";
    }
}

inline std::string FieldIssueToString(FieldIssue issue) {
    switch (issue) {
        case FieldIssue::Absent: return "absent";
        case FieldIssue::Empty: return "empty";
        case FieldIssue::WrongArity: return "wrong component count";
        case FieldIssue::NotANumber: return "not a number";
        case FieldIssue::OutOfRange: return "out of range";
        case FieldIssue::Unrecognized: return "unrecognized";
        default: return "invalid";
    }
}

/**
 * @class TaskFormError
 * @brief Thrown by the validator and translator. Terminal for the submission.
 *
 * what() is the plain-text message shown to the user. It names the field and
 * the offending value.
 */
class TaskFormError : public std::runtime_error {
public:
    TaskFormError(TaskFormErrorKind kind,
                  FieldIssue issue,
                  std::optional<std::string> rawValue,
                  std::optional<std::size_t> componentCount,
                  const std::string& message)
        : std::runtime_error(message),
          m_kind(kind),
          m_issue(issue),
          m_rawValue(std::move(rawValue)),
          m_componentCount(componentCount) {}

    TaskFormErrorKind kind() const { return m_kind; }
    FieldIssue issue() const { return m_issue; }

    /// Field value as submitted, nullopt when the field was absent.
    const std::optional<std::string>& rawValue() const { return m_rawValue; }

    /// Number of components seen when splitting a date or time.
    std::optional<std::size_t> componentCount() const { return m_componentCount; }

    TaskField field() const {
        switch (m_kind) {
            case TaskFormErrorKind::InvalidStartDate: return TaskField::Start;
            case TaskFormErrorKind::InvalidStartTime: return TaskField::Time;
            case TaskFormErrorKind::MissingTaskName: return TaskField::Name;
            case TaskFormErrorKind::UnknownRepeatKeyword: return TaskField::RepeatInfo;
        }
        return TaskField::Name;
    }

private:
    TaskFormErrorKind m_kind;
    FieldIssue m_issue;
    std::optional<std::string> m_rawValue;
    std::optional<std::size_t> m_componentCount;
};

} // namespace tasktracker::domain
