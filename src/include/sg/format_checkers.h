#pragma once

#include <sg/dictionary.h>
#include <sg/errors.h>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace sg {

// One failed check. The caller attaches the field path.
struct Violation {
    ErrorKind kind;
    std::string message;
    std::string suggestion;
};

using CheckResult = std::optional<Violation>;

struct NumericBounds {
    std::optional<double> min;  // inclusive
    std::optional<double> max;  // inclusive
    std::optional<double> gt;   // exclusive
    std::optional<double> lt;   // exclusive

    bool empty() const { return !min && !max && !gt && !lt; }
};

struct LengthBounds {
    std::optional<int64_t> min;
    std::optional<int64_t> max;

    bool empty() const { return !min && !max; }
};

// RFC 5321 limits for a whole address and its local part.
constexpr size_t max_email_length = 254;
constexpr size_t max_email_local_length = 64;

// Longer strings fail check_pattern without running the regex.
constexpr size_t max_pattern_input_length = 8192;

// All checkers expect a value that already passed the type check.
CheckResult check_email(const std::string& value);
CheckResult check_date(const std::string& value);
CheckResult check_pattern(const std::string& value, const std::regex& re, const std::string& pattern_text);
CheckResult check_numeric_bounds(double value, const NumericBounds& bounds);
CheckResult check_enum(const Dictionary& value, const std::vector<Dictionary>& allowed);

// unit is "characters" or "items"; used only in messages.
CheckResult check_length(size_t length, const LengthBounds& bounds, const std::string& unit);

bool is_leap_year(int year);
int days_in_month(int year, int month);

// Short, single-line rendering of a value for error messages.
std::string value_preview(const Dictionary& d, size_t maxlen = 40);

}  // namespace sg
