#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

namespace autopilot::context {

// Word and byte counts of a piece of text. Counts of texts joined at whitespace
// boundaries add up, which lets the budgeter grow a prompt without rebuilding it.
struct TextStats {
    std::size_t words = 0;
    std::size_t bytes = 0;

    TextStats& operator+=(const TextStats& other) {
        words += other.words;
        bytes += other.bytes;
        return *this;
    }
};

inline TextStats operator+(TextStats lhs, const TextStats& rhs) {
    lhs += rhs;
    return lhs;
}

inline TextStats measure(const std::string& text) {
    TextStats stats;
    stats.bytes = text.size();
    bool in_word = false;
    for (const char c : text) {
        const bool space = std::isspace(static_cast<unsigned char>(c)) != 0;
        if (!space && !in_word) {
            ++stats.words;
        }
        in_word = !space;
    }
    return stats;
}

// Coarse token estimate: max(whitespace-separated words, bytes / 4).
inline std::size_t estimate_tokens(const TextStats& stats) {
    return std::max(stats.words, stats.bytes / 4);
}

inline std::size_t estimate_tokens(const std::string& text) {
    return estimate_tokens(measure(text));
}

}  // namespace autopilot::context
