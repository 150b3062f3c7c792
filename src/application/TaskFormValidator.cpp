/**
 * @file TaskFormValidator.cpp
 * @brief Implementation of TaskFormValidator.
 */

#include "application/TaskFormValidator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <limits>
#include <map>
#include <sstream>
#include <system_error>
#include <vector>

namespace tasktracker::application {

using domain::FieldIssue;
using domain::RecurrenceRule;
using domain::RepeatType;
using domain::TaskFormError;
using domain::TaskFormErrorKind;

namespace {

enum class IntParse { Ok, NotANumber, OutOfRange };

bool IsBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string Trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

// Same split semantics as the form has always had: empty components are kept.
std::vector<std::string> Split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

// Optional blanks, optional sign, decimal digits.
IntParse ParseInteger(const std::string& raw, int& out) {
    std::string s = Trim(raw);
    if (s.empty()) return IntParse::NotANumber;

    bool negative = false;
    std::size_t pos = 0;
    if (s[0] == '+' || s[0] == '-') {
        negative = s[0] == '-';
        pos = 1;
    }
    if (pos == s.size()) return IntParse::NotANumber;
    if (!std::all_of(s.begin() + static_cast<std::ptrdiff_t>(pos), s.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return IntParse::NotANumber;
    }

    long long value = 0;
    auto [ptr, ec] = std::from_chars(s.data() + pos, s.data() + s.size(), value);
    if (ec == std::errc::result_out_of_range) return IntParse::OutOfRange;
    if (ec != std::errc() || ptr != s.data() + s.size()) return IntParse::NotANumber;

    if (negative) value = -value;
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return IntParse::OutOfRange;
    }
    out = static_cast<int>(value);
    return IntParse::Ok;
}

/**
 * Splits raw on sep and parses every component. All components are parsed
 * before the count is checked, so "a-b" is reported as not a number rather
 * than as the wrong arity.
 */
std::vector<int> ParseComponents(const std::optional<std::string>& raw,
                                 char sep,
                                 std::size_t expected,
                                 TaskFormErrorKind kind,
                                 const std::string& label,
                                 const std::string& format) {
    const std::string key = kind == TaskFormErrorKind::InvalidStartDate
        ? domain::FieldKey(domain::TaskField::Start)
        : domain::FieldKey(domain::TaskField::Time);
    const std::string prefix = "Invalid value for " + label + "! ";

    if (!raw) {
        throw TaskFormError(kind, FieldIssue::Absent, std::nullopt, std::nullopt,
                            prefix + key + " is missing.");
    }
    if (IsBlank(*raw)) {
        throw TaskFormError(kind, FieldIssue::Empty, raw, std::size_t{0},
                            prefix + key + " is empty.");
    }

    const auto parts = Split(*raw, sep);
    std::vector<int> values;
    values.reserve(parts.size());
    for (const auto& part : parts) {
        int value = 0;
        IntParse status = ParseInteger(part, value);
        if (status != IntParse::Ok) {
            std::ostringstream msg;
            msg << prefix << key << " '" << *raw << "' is not a " << format << " value ('"
                << part << "' " << (status == IntParse::OutOfRange ? "is out of range" : "is not a number")
                << ").";
            throw TaskFormError(kind,
                                status == IntParse::OutOfRange ? FieldIssue::OutOfRange : FieldIssue::NotANumber,
                                raw, parts.size(), msg.str());
        }
        values.push_back(value);
    }

    if (values.size() != expected) {
        std::ostringstream msg;
        msg << prefix << key << " '" << *raw << "' has " << values.size()
            << " components, expected " << expected << " (" << format << ").";
        throw TaskFormError(kind, FieldIssue::WrongArity, raw, values.size(), msg.str());
    }
    return values;
}

} // namespace

const std::map<std::string, RecurrenceRule>& TaskFormValidator::RepeatKeywordTable() {
    static const std::map<std::string, RecurrenceRule> table = {
        {"daily", {RepeatType::SpecifiedDays, 1234567}},
        {"weekly", {RepeatType::WithInterval, 7}},
        {"weekdays", {RepeatType::SpecifiedDays, 12345}},
        {"biweekly", {RepeatType::WithInterval, 14}},
        {"once", {RepeatType::NoRepeat, 0}},
        {"monthly", {RepeatType::Monthly, 0}},
        {"four_weeks", {RepeatType::WithInterval, 7 * 4}},
    };
    return table;
}

domain::StartDate TaskFormValidator::ParseStartDate(const std::optional<std::string>& raw) {
    auto v = ParseComponents(raw, '-', 3, TaskFormErrorKind::InvalidStartDate, "start date", "YYYY-M-D");
    return domain::StartDate{v[0], v[1], v[2]};
}

domain::StartTime TaskFormValidator::ParseStartTime(const std::optional<std::string>& raw) {
    auto v = ParseComponents(raw, ':', 2, TaskFormErrorKind::InvalidStartTime, "start time", "H:M");
    return domain::StartTime{v[0], v[1]};
}

std::string TaskFormValidator::ValidateName(const std::optional<std::string>& raw) {
    const std::string key = domain::FieldKey(domain::TaskField::Name);
    if (!raw) {
        throw TaskFormError(TaskFormErrorKind::MissingTaskName, FieldIssue::Absent, std::nullopt, std::nullopt,
                            "No task name! " + key + " is missing.");
    }
    if (IsBlank(*raw)) {
        throw TaskFormError(TaskFormErrorKind::MissingTaskName, FieldIssue::Empty, raw, std::nullopt,
                            "No task name! " + key + " is empty.");
    }
    return *raw;
}

RecurrenceRule TaskFormValidator::ResolveRepeat(const std::optional<std::string>& raw) {
    const std::string key = domain::FieldKey(domain::TaskField::RepeatInfo);
    if (!raw) {
        throw TaskFormError(TaskFormErrorKind::UnknownRepeatKeyword, FieldIssue::Absent, std::nullopt, std::nullopt,
                            "Wrong repeat info! " + key + " is missing.");
    }

    const auto& table = RepeatKeywordTable();
    auto it = table.find(*raw);
    if (it == table.end()) {
        throw TaskFormError(TaskFormErrorKind::UnknownRepeatKeyword,
                            raw->empty() ? FieldIssue::Empty : FieldIssue::Unrecognized,
                            raw, std::nullopt,
                            "Wrong repeat info! Unknown " + key + " '" + *raw + "'.");
    }
    return it->second;
}

ValidatedTaskInput TaskFormValidator::Validate(const domain::RawTaskInput& input) {
    using domain::GetField;
    using domain::TaskField;

    ValidatedTaskInput validated;
    validated.date = ParseStartDate(GetField(input, TaskField::Start));
    validated.time = ParseStartTime(GetField(input, TaskField::Time));
    validated.name = ValidateName(GetField(input, TaskField::Name));
    validated.repeat = ResolveRepeat(GetField(input, TaskField::RepeatInfo));
    return validated;
}

} // namespace tasktracker::application
