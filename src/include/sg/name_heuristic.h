#pragma once

#include <string>

namespace sg {

// Tunable thresholds for check_name(). Lengths count UTF-8 code points.
struct NameHeuristicConfig {
    size_t min_length = 2;
    double min_distinct_ratio = 0.3;
    size_t entropy_min_length = 4;
    size_t keyboard_min_run = 4;
    double keyboard_adjacency_ratio = 0.8;
    size_t adjacency_min_length = 5;
    size_t max_repeat_run = 3;
};

enum class NameReason { Accepted, TooShort, LowEntropy, KeyboardPattern, RepeatingChars };

std::string to_string(NameReason reason);

struct NameVerdict {
    bool accepted = true;
    NameReason reason = NameReason::Accepted;
    std::string detail;

    explicit operator bool() const { return accepted; }
};

// Plausibility of a human name. Checks run in order (length, distinct
// character ratio, keyboard sequences, repeated runs) and stop at the first
// failure.
NameVerdict check_name(const std::string& value, const NameHeuristicConfig& config = NameHeuristicConfig{});

}  // namespace sg
