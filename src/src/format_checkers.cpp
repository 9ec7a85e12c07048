#include <sg/format_checkers.h>
#include <sg/text_utils.h>
#include <cctype>
#include <cmath>
#include <sstream>

namespace sg {

namespace {

// Prints 5 rather than 5.0 for integral bounds so messages read naturally.
std::string format_number(double x) {
    if (std::isfinite(x) && std::floor(x) == x && std::fabs(x) < 1e15) {
        return std::to_string(static_cast<int64_t>(x));
    }
    std::ostringstream ss;
    ss << x;
    return ss.str();
}

bool all_digits(const std::string& s, size_t pos, size_t count) {
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool is_atext(char c) {
    static const std::string specials = "!#$%&'*+/=?^_`{|}~-";
    return std::isalnum(static_cast<unsigned char>(c)) || specials.find(c) != std::string::npos;
}

// Dot-separated atoms, none empty.
bool valid_local_part(const std::string& local) {
    if (local.empty() || local.size() > max_email_local_length) return false;
    bool after_dot = true;
    for (char c : local) {
        if (c == '.') {
            if (after_dot) return false;
            after_dot = true;
        } else if (is_atext(c)) {
            after_dot = false;
        } else {
            return false;
        }
    }
    return !after_dot;
}

// Two or more labels; hyphens only inside a label; an alphabetic top-level
// label of at least two letters.
bool valid_domain(const std::string& domain) {
    size_t labels = 0;
    size_t start = 0;
    while (start <= domain.size()) {
        size_t dot = domain.find('.', start);
        if (dot == std::string::npos) dot = domain.size();
        const std::string label = domain.substr(start, dot - start);
        if (label.empty() || label.size() > 63) return false;
        if (label.front() == '-' || label.back() == '-') return false;
        for (char c : label) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
        }
        ++labels;
        if (dot == domain.size()) {
            if (labels < 2 || label.size() < 2) return false;
            for (char c : label) {
                if (!std::isalpha(static_cast<unsigned char>(c))) return false;
            }
            return true;
        }
        start = dot + 1;
    }
    return false;
}

}  // namespace

std::string value_preview(const Dictionary& d, size_t maxlen) {
    std::string s = d.dump();
    if (s.size() > maxlen) s = s.substr(0, maxlen - 3) + "...";
    return s;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return days[month - 1];
}

CheckResult check_email(const std::string& value) {
    if (value.size() <= max_email_length) {
        const auto at = value.find('@');
        if (at != std::string::npos && valid_local_part(value.substr(0, at)) && valid_domain(value.substr(at + 1))) {
            return std::nullopt;
        }
    }
    return Violation{ErrorKind::InvalidEmail,
                     value_preview(value) + " is not a valid email address",
                     "Use the form local-part@domain.tld, e.g. jane.doe@example.com"};
}

CheckResult check_date(const std::string& value) {
    const Violation bad{ErrorKind::InvalidDate,
                        value_preview(value) + " is not a valid date",
                        "Use the ISO format YYYY-MM-DD, e.g. 2023-10-15"};
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') return bad;
    if (!all_digits(value, 0, 4) || !all_digits(value, 5, 2) || !all_digits(value, 8, 2)) return bad;

    int year = std::stoi(value.substr(0, 4));
    int month = std::stoi(value.substr(5, 2));
    int day = std::stoi(value.substr(8, 2));
    if (month < 1 || month > 12) {
        return Violation{ErrorKind::InvalidDate,
                         "'" + value + "' has month " + std::to_string(month) + " outside 1-12",
                         "Use the ISO format YYYY-MM-DD with a month between 01 and 12"};
    }
    if (day < 1 || day > days_in_month(year, month)) {
        return Violation{ErrorKind::InvalidDate,
                         "'" + value + "' has day " + std::to_string(day) + " which does not exist in that month",
                         "Use a calendar date that exists, in the form YYYY-MM-DD"};
    }
    return std::nullopt;
}

CheckResult check_pattern(const std::string& value, const std::regex& re, const std::string& pattern_text) {
    // std::regex recurses per input character; longer input would exhaust the stack.
    if (value.size() > max_pattern_input_length) {
        return Violation{ErrorKind::PatternMismatch,
                         "value of " + std::to_string(value.size()) + " characters is too long to match pattern " +
                             pattern_text + " (limit " + std::to_string(max_pattern_input_length) + ")",
                         "Provide a shorter value that fully matches " + pattern_text};
    }
    if (std::regex_match(value, re)) return std::nullopt;
    return Violation{ErrorKind::PatternMismatch,
                     value_preview(value) + " does not match pattern " + pattern_text,
                     "Provide a value that fully matches " + pattern_text};
}

CheckResult check_numeric_bounds(double value, const NumericBounds& bounds) {
    const std::string v = format_number(value);
    if (bounds.min && value < *bounds.min) {
        return Violation{ErrorKind::OutOfRange,
                         "value " + v + " is less than the minimum " + format_number(*bounds.min),
                         "Provide a value greater than or equal to " + format_number(*bounds.min)};
    }
    if (bounds.max && value > *bounds.max) {
        return Violation{ErrorKind::OutOfRange,
                         "value " + v + " is greater than the maximum " + format_number(*bounds.max),
                         "Provide a value less than or equal to " + format_number(*bounds.max)};
    }
    if (bounds.gt && !(value > *bounds.gt)) {
        return Violation{ErrorKind::OutOfRange,
                         "value " + v + " must be greater than " + format_number(*bounds.gt),
                         "Provide a value strictly greater than " + format_number(*bounds.gt)};
    }
    if (bounds.lt && !(value < *bounds.lt)) {
        return Violation{ErrorKind::OutOfRange,
                         "value " + v + " must be less than " + format_number(*bounds.lt),
                         "Provide a value strictly less than " + format_number(*bounds.lt)};
    }
    return std::nullopt;
}

CheckResult check_enum(const Dictionary& value, const std::vector<Dictionary>& allowed) {
    std::vector<std::string> options;
    options.reserve(allowed.size());
    for (auto const& a : allowed) {
        if (a == value) return std::nullopt;
        options.push_back(a.isString() ? a.asString() : a.dump());
    }

    std::string listing;
    for (auto const& o : options) {
        if (!listing.empty()) listing += ", ";
        listing += o;
    }
    std::string suggestion = "Use one of: " + listing;
    if (value.isString()) {
        std::string close = text_utils::suggest_similar_option(value.asString(), options);
        if (!close.empty()) suggestion = "Did you mean '" + close + "'? " + suggestion;
    }
    return Violation{ErrorKind::NotInEnum, value_preview(value) + " is not one of the allowed values", suggestion};
}

CheckResult check_length(size_t length, const LengthBounds& bounds, const std::string& unit) {
    const auto n = static_cast<int64_t>(length);
    if (bounds.min && n < *bounds.min) {
        return Violation{ErrorKind::LengthViolation,
                         "length " + std::to_string(n) + " is shorter than the minimum of " + std::to_string(*bounds.min) +
                             " " + unit,
                         "Provide at least " + std::to_string(*bounds.min) + " " + unit};
    }
    if (bounds.max && n > *bounds.max) {
        return Violation{ErrorKind::LengthViolation,
                         "length " + std::to_string(n) + " is longer than the maximum of " + std::to_string(*bounds.max) +
                             " " + unit,
                         "Provide at most " + std::to_string(*bounds.max) + " " + unit};
    }
    return std::nullopt;
}

}  // namespace sg
