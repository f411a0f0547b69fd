#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace jr {
namespace cli_utils {

// Number of single-character insertions, deletions or substitutions needed
// to turn `a` into `b`.
inline int edit_distance(const std::string& a, const std::string& b) {
    std::vector<int> prev(b.size() + 1);
    std::vector<int> cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = static_cast<int>(i);
        for (size_t j = 1; j <= b.size(); ++j) {
            int substitution = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, substitution});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

// Closest known flag to `arg`, or "" when nothing is close enough.
inline std::string closest_flag(const std::string& arg, const std::vector<std::string>& flags) {
    std::string best;
    int best_distance = 0;
    for (const auto& flag : flags) {
        int d = edit_distance(arg, flag);
        if (best.empty() or d < best_distance) {
            best = flag;
            best_distance = d;
        }
    }
    int threshold = std::max(3, static_cast<int>(arg.size() * 0.4));
    return best_distance <= threshold ? best : std::string();
}

inline std::string unknown_flag_error(const std::string& arg, const std::vector<std::string>& flags) {
    std::string error = "Unknown argument: " + arg;
    std::string suggestion = closest_flag(arg, flags);
    if (not suggestion.empty()) error += "\n  Did you mean '" + suggestion + "'?";
    return error;
}

}  // namespace cli_utils
}  // namespace jr
