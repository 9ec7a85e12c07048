#include <sg/name_heuristic.h>
#include <sg/text_utils.h>
#include <algorithm>
#include <set>
#include <vector>

namespace sg {

namespace {

// Rows and columns of a US QWERTY layout, lower case.
const std::vector<std::string>& keyboard_sequences() {
    static const std::vector<std::string> seqs = {
        "1234567890", "!@#$%^&*()", "qwertyuiop", "asdfghjkl", "zxcvbnm", "1qaz", "2wsx",
        "3edc",       "4rfv",       "5tgb",       "6yhn",      "7ujm",    "8ik",  "9ol",  "0p"};
    return seqs;
}

const std::set<std::pair<char, char>>& adjacent_keys() {
    static const std::set<std::pair<char, char>> pairs = [] {
        std::set<std::pair<char, char>> out;
        for (auto const& s : keyboard_sequences()) {
            for (size_t i = 1; i < s.size(); ++i) {
                out.insert({s[i - 1], s[i]});
                out.insert({s[i], s[i - 1]});
            }
        }
        return out;
    }();
    return pairs;
}

bool is_keyboard_char(const std::string& cp) {
    if (cp.size() != 1) return false;
    for (auto const& s : keyboard_sequences()) {
        if (s.find(cp[0]) != std::string::npos) return true;
    }
    return false;
}

bool is_separator(const std::string& cp) {
    return cp == " " || cp == "-" || cp == "'" || cp == "." || cp == "\t";
}

bool occurs_in_sequence(const std::string& run) {
    for (auto const& s : keyboard_sequences()) {
        if (s.find(run) != std::string::npos) return true;
        std::string r(s.rbegin(), s.rend());
        if (r.find(run) != std::string::npos) return true;
    }
    return false;
}

// Longest stretch of consecutive keyboard characters that appears verbatim
// in one sequence, forward or reversed. Non-ASCII breaks a stretch.
size_t longest_keyboard_run(const std::vector<std::string>& letters) {
    size_t best = 0;
    for (size_t i = 0; i < letters.size(); ++i) {
        std::string run;
        for (size_t j = i; j < letters.size(); ++j) {
            if (!is_keyboard_char(letters[j])) break;
            run += letters[j];
            if (!occurs_in_sequence(run)) break;
            best = std::max(best, run.size());
        }
    }
    return best;
}

NameVerdict reject(NameReason reason, const std::string& detail) {
    NameVerdict v;
    v.accepted = false;
    v.reason = reason;
    v.detail = detail;
    return v;
}

}  // namespace

std::string to_string(NameReason reason) {
    switch (reason) {
        case NameReason::Accepted:
            return "accepted";
        case NameReason::TooShort:
            return "too_short";
        case NameReason::LowEntropy:
            return "low_entropy";
        case NameReason::KeyboardPattern:
            return "keyboard_pattern";
        case NameReason::RepeatingChars:
            return "repeating_chars";
    }
    return "unknown";
}

NameVerdict check_name(const std::string& value, const NameHeuristicConfig& config) {
    std::vector<std::string> cps = text_utils::utf8_code_points(text_utils::to_lower_ascii(text_utils::trim(value)));

    if (cps.size() < config.min_length) {
        return reject(NameReason::TooShort,
                      "name has " + std::to_string(cps.size()) + " characters, at least " +
                          std::to_string(config.min_length) + " required");
    }

    std::vector<std::string> letters;
    for (auto const& cp : cps) {
        if (!is_separator(cp)) letters.push_back(cp);
    }

    if (letters.size() >= config.entropy_min_length) {
        std::set<std::string> distinct(letters.begin(), letters.end());
        double ratio = static_cast<double>(distinct.size()) / static_cast<double>(letters.size());
        if (ratio < config.min_distinct_ratio) {
            return reject(NameReason::LowEntropy, "name uses too few distinct characters");
        }
    }

    if (longest_keyboard_run(letters) >= config.keyboard_min_run) {
        return reject(NameReason::KeyboardPattern, "name follows a keyboard sequence");
    }

    // Pairs of neighbouring keys, counted only where both sides are on the keyboard.
    size_t mapped = 0;
    size_t pairs = 0;
    size_t adjacent = 0;
    for (size_t i = 0; i < letters.size(); ++i) {
        if (!is_keyboard_char(letters[i])) continue;
        ++mapped;
        if (i + 1 < letters.size() && is_keyboard_char(letters[i + 1])) {
            ++pairs;
            if (adjacent_keys().count({letters[i][0], letters[i + 1][0]})) ++adjacent;
        }
    }
    if (mapped >= config.adjacency_min_length && pairs > 0 &&
        static_cast<double>(adjacent) / static_cast<double>(pairs) >= config.keyboard_adjacency_ratio) {
        return reject(NameReason::KeyboardPattern, "name closely tracks neighbouring keyboard keys");
    }

    size_t run = 1;
    for (size_t i = 1; i < cps.size(); ++i) {
        run = (cps[i] == cps[i - 1]) ? run + 1 : 1;
        if (run > config.max_repeat_run) {
            return reject(NameReason::RepeatingChars,
                          "character '" + cps[i] + "' repeats " + std::to_string(run) + " times in a row");
        }
    }

    return NameVerdict{};
}

}  // namespace sg
