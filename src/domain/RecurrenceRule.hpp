/**
 * @file RecurrenceRule.hpp
 * @brief Value Object describing how (and whether) a task repeats.
 */

#pragma once

#include <cstdint>
#include <string>

namespace tasktracker::domain {

/**
 * @enum RepeatType
 * @brief Repeat kinds understood by the TaskTracker API.
 *
 * The ordinals are part of the wire format and must not change.
 */
enum class RepeatType : int {
    NoRepeat = 0,       ///< Single occurrence.
    Monthly = 1,        ///< Same date every month.
    MonthlyOnDay = 2,   ///< Reserved by the API, never produced by the form.
    SpecifiedDays = 3,  ///< Weekday set, see RecurrenceRule::info.
    WithInterval = 4    ///< Every N days, see RecurrenceRule::info.
};

inline std::string RepeatTypeToString(RepeatType type) {
    switch (type) {
        case RepeatType::NoRepeat: return "NoRepeat";
        case RepeatType::Monthly: return "Monthly";
        case RepeatType::MonthlyOnDay: return "MonthlyOnDay";
        case RepeatType::SpecifiedDays: return "SpecifiedDays";
        case RepeatType::WithInterval: return "WithInterval";
        default: return "Unknown";
    }
}

inline int RepeatTypeOrdinal(RepeatType type) {
    return static_cast<int>(type);
}

/**
 * @struct RecurrenceRule
 * @brief The (type, info) pair sent as taskRepeatType / taskRepeatInfo.
 *
 * For SpecifiedDays, info is the weekday digits 1-7 concatenated
 * (1234567 = every day, 12345 = Monday to Friday). For WithInterval it is
 * the interval in days. Zero for the other types.
 */
struct RecurrenceRule {
    RepeatType type = RepeatType::NoRepeat;
    std::int64_t info = 0;

    bool operator==(const RecurrenceRule& other) const {
        return type == other.type && info == other.info;
    }
    bool operator!=(const RecurrenceRule& other) const {
        return !(*this == other);
    }
};

} // namespace tasktracker::domain
