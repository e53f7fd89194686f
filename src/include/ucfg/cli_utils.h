#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace ucfg {
namespace cli_utils {

// Number of single-character edits turning one string into the other.
inline size_t edit_distance(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t subst = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, subst});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

inline bool is_long_option(const std::string& s) { return s.size() > 2 and s.compare(0, 2, "--") == 0; }

// Long option closest to a mistyped `--flag`, or "" when none is close.
// Short flags and positional words get no suggestion: every one-letter flag
// is a single edit away from every other.
inline std::string closest_option(const std::string& arg, const std::vector<std::string>& options) {
    if (not is_long_option(arg)) return "";
    std::string name = arg.substr(0, arg.find('='));

    std::string best;
    size_t best_distance = 0;
    for (const auto& opt : options) {
        if (not is_long_option(opt)) continue;
        size_t d = edit_distance(name, opt);
        if (best.empty() or d < best_distance) {
            best = opt;
            best_distance = d;
        }
    }
    size_t allowed = std::max<size_t>(2, (name.size() - 2) / 3);
    return best_distance <= allowed ? best : "";
}

inline std::string unknown_option_message(const std::string& arg, const std::vector<std::string>& options) {
    std::string msg = "unrecognized option '" + arg + "'";
    std::string hint = closest_option(arg, options);
    if (not hint.empty()) msg += " (did you mean '" + hint + "'?)";
    return msg;
}

}  // namespace cli_utils
}  // namespace ucfg
