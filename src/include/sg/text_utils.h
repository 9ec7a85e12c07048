#pragma once

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>
#include <vector>

namespace sg {
namespace text_utils {

// Compute Levenshtein distance between two strings
// This measures how many single-character edits are needed to change one string into another
inline int levenshtein_distance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.size();
    const size_t n = s2.size();

    std::vector<std::vector<int>> dp(m + 1, std::vector<int>(n + 1));

    for (size_t i = 0; i <= m; ++i) {
        dp[i][0] = static_cast<int>(i);
    }
    for (size_t j = 0; j <= n; ++j) {
        dp[0][j] = static_cast<int>(j);
    }

    for (size_t i = 1; i <= m; ++i) {
        for (size_t j = 1; j <= n; ++j) {
            if (s1[i - 1] == s2[j - 1]) {
                dp[i][j] = dp[i - 1][j - 1];
            } else {
                dp[i][j] = 1 + std::min({
                                   dp[i - 1][j],     // deletion
                                   dp[i][j - 1],     // insertion
                                   dp[i - 1][j - 1]  // substitution
                               });
            }
        }
    }

    return dp[m][n];
}

// Find the most similar option from a list of valid options.
// Returns an empty string if nothing is close enough.
inline std::string suggest_similar_option(const std::string& unknown, const std::vector<std::string>& valid_options) {
    if (valid_options.empty()) {
        return "";
    }

    int min_distance = std::numeric_limits<int>::max();
    std::string best_match;

    for (const auto& option : valid_options) {
        int dist = levenshtein_distance(unknown, option);
        if (dist < min_distance) {
            min_distance = dist;
            best_match = option;
        }
    }

    // Only suggest if the distance is reasonable (within 3 edits or 40% of the string length)
    int threshold = std::max(3, static_cast<int>(unknown.length() * 0.4));
    if (min_distance <= threshold) {
        return best_match;
    }

    return "";
}

// Create an error message for an unknown argument with a helpful suggestion
inline std::string create_unknown_arg_error(const std::string& unknown_arg, const std::vector<std::string>& valid_options) {
    std::string error = "Unknown argument: " + unknown_arg;

    std::string suggestion = suggest_similar_option(unknown_arg, valid_options);
    if (!suggestion.empty()) {
        error += "\n  Did you mean '" + suggestion + "'?";
    }

    return error;
}

// Splits UTF-8 text into code points (one std::string per code point).
// Malformed lead bytes are kept as single-byte code points.
inline std::vector<std::string> utf8_code_points(const std::string& s) {
    std::vector<std::string> out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = 1;
        if (c >= 0xF0)
            len = 4;
        else if (c >= 0xE0)
            len = 3;
        else if (c >= 0xC0)
            len = 2;
        if (i + len > s.size()) len = 1;
        out.push_back(s.substr(i, len));
        i += len;
    }
    return out;
}

inline size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

inline std::string to_lower_ascii(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

inline std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

}  // namespace text_utils
}  // namespace sg
