/**
 * @file TaskTranslator.cpp
 * @brief Implementation of TaskTranslator.
 */

#include "application/TaskTranslator.hpp"

#include <cstddef>
#include <ctime>
#include <sstream>
#include <string>

namespace tasktracker::application {

using domain::FieldIssue;
using domain::TaskFormError;
using domain::TaskFormErrorKind;

namespace {

constexpr int kMinYear = 1;
constexpr int kMaxYear = 9999;

std::string FormatDate(const domain::StartDate& date) {
    std::ostringstream out;
    out << date.year << "-" << date.month << "-" << date.day;
    return out.str();
}

std::string FormatTime(const domain::StartTime& time) {
    std::ostringstream out;
    out << time.hour << ":" << time.minute;
    return out.str();
}

[[noreturn]] void ThrowImpossibleDate(const domain::StartDate& date, const std::string& reason) {
    const std::string raw = FormatDate(date);
    throw TaskFormError(TaskFormErrorKind::InvalidStartDate, FieldIssue::OutOfRange, raw, std::size_t{3},
                        "Invalid value for start date! " + std::string(domain::FieldKey(domain::TaskField::Start)) +
                        " '" + raw + "' " + reason + ".");
}

} // namespace

std::int64_t TaskTranslator::ComposeLocalInstant(const domain::StartDate& date, const domain::StartTime& time) {
    if (date.year < kMinYear || date.year > kMaxYear) {
        ThrowImpossibleDate(date, "has a year outside 1..9999");
    }
    if (date.month < 1 || date.month > 12) {
        ThrowImpossibleDate(date, "has a month outside 1..12");
    }
    // A time mktime would roll into a neighbouring day cannot be placed on this date.
    if (time.hour < 0 || time.hour > 23 || time.minute < 0 || time.minute > 59) {
        ThrowImpossibleDate(date, "cannot be combined with time of day " + FormatTime(time));
    }

    std::tm local{};
    local.tm_year = date.year - 1900;
    local.tm_mon = date.month - 1;
    local.tm_mday = date.day;
    local.tm_hour = time.hour;
    local.tm_min = time.minute;
    local.tm_sec = 0;
    local.tm_isdst = -1;

    const std::time_t composed = std::mktime(&local);
    if (composed == static_cast<std::time_t>(-1)) {
        ThrowImpossibleDate(date, "cannot be represented in local time");
    }

    // mktime normalizes Feb 30 into March 2; a moved date means it never existed.
    if (local.tm_year != date.year - 1900 || local.tm_mon != date.month - 1 || local.tm_mday != date.day) {
        ThrowImpossibleDate(date, "is not a calendar date");
    }

    return static_cast<std::int64_t>(composed);
}

domain::TaskCreationRequest TaskTranslator::Translate(const ValidatedTaskInput& input) {
    domain::TaskCreationRequest request;
    request.name = input.name;
    request.startEpoch = ComposeLocalInstant(input.date, input.time);
    request.repeat = input.repeat;
    return request;
}

nlohmann::json TaskTranslator::ToPayload(const domain::TaskCreationRequest& request) {
    return nlohmann::json{
        {"taskName", request.name},
        {"taskStart", request.startEpoch},
        {"taskRepeatInfo", request.repeat.info},
        {"taskRepeatType", domain::RepeatTypeOrdinal(request.repeat.type)}
    };
}

domain::TaskCreationRequest TaskTranslator::BuildRequest(const domain::RawTaskInput& input) {
    using domain::GetField;
    using domain::TaskField;

    const auto date = TaskFormValidator::ParseStartDate(GetField(input, TaskField::Start));
    const auto time = TaskFormValidator::ParseStartTime(GetField(input, TaskField::Time));

    domain::TaskCreationRequest request;
    request.name = TaskFormValidator::ValidateName(GetField(input, TaskField::Name));
    // Composition precedes the keyword lookup so a date that does not exist wins.
    request.startEpoch = ComposeLocalInstant(date, time);
    request.repeat = TaskFormValidator::ResolveRepeat(GetField(input, TaskField::RepeatInfo));
    return request;
}

} // namespace tasktracker::application
