#pragma once

#include <algorithm>
#include <cctype>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace loregraph::common {

// String-like concept (C++20): anything convertible to std::string_view
template <class T>
concept StringLike = requires(T&& t) { std::string_view{std::forward<T>(t)}; };

/**
 * constexpr, allocation-free wildcard match supporting:
 *  - '?' matches any single character
 *  - '*' matches any sequence of characters (including empty)
 *
 * Case-sensitive. Iterative (no recursion, no backtracking explosion).
 */
[[nodiscard]] inline constexpr bool wildcard_match(std::string_view text,
                                                   std::string_view pattern) noexcept {
    size_t t = 0;
    size_t p = 0;
    size_t starPos = std::string_view::npos;
    size_t matchPos = 0;

    const size_t tlen = text.size();
    const size_t plen = pattern.size();

    while (t < tlen) {
        if (p < plen && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++t;
            ++p;
        } else if (p < plen && pattern[p] == '*') {
            starPos = p++;
            matchPos = t;
        } else if (starPos != std::string_view::npos) {
            p = starPos + 1;
            ++matchPos;
            t = matchPos;
        } else {
            return false;
        }
    }

    while (p < plen && pattern[p] == '*') {
        ++p;
    }

    return p == plen;
}

/**
 * Returns true if the pattern contains any wildcard metacharacters.
 */
[[nodiscard]] inline constexpr bool has_wildcards(std::string_view pattern) noexcept {
    for (char c : pattern) {
        if (c == '*' || c == '?')
            return true;
    }
    return false;
}

/**
 * Trim helpers for std::string_view (no allocation).
 */
[[nodiscard]] inline std::string_view ltrim(std::string_view s) noexcept {
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r'))
        ++i;
    return s.substr(i);
}

[[nodiscard]] inline std::string_view rtrim(std::string_view s) noexcept {
    size_t i = s.size();
    while (i > 0 && (s[i - 1] == ' ' || s[i - 1] == '\t' || s[i - 1] == '\n' || s[i - 1] == '\r'))
        --i;
    return s.substr(0, i);
}

[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
    return rtrim(ltrim(s));
}

/**
 * Normalize a vault-relative path: backslashes become '/', repeated slashes collapse,
 * a leading "./" and trailing '/' are dropped.
 */
[[nodiscard]] inline std::string normalize_path(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (char c : path) {
        const char ch = (c == '\\') ? '/' : c;
        if (ch == '/' && !out.empty() && out.back() == '/')
            continue;
        out.push_back(ch);
    }
    while (out.size() >= 2 && out[0] == '.' && out[1] == '/') {
        out.erase(0, 2);
    }
    if (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

namespace detail {

inline std::vector<std::string_view> split_segments(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t pos = path.find('/', start);
        auto seg = (pos == std::string_view::npos) ? path.substr(start)
                                                   : path.substr(start, pos - start);
        if (!seg.empty())
            segments.push_back(seg);
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return segments;
}

} // namespace detail

/**
 * Glob match for '/'-separated paths. '*' and '?' never cross a separator; a "**" segment
 * matches zero or more whole segments. A pattern without any '/' matches against the basename.
 */
[[nodiscard]] inline bool glob_match_path(std::string_view path, std::string_view pattern) {
    const std::string normPath = normalize_path(path);
    const std::string normPattern = normalize_path(pattern);

    if (normPattern.find('/') == std::string::npos && normPattern != "**") {
        auto slash = normPath.rfind('/');
        std::string_view base = slash == std::string::npos
                                    ? std::string_view(normPath)
                                    : std::string_view(normPath).substr(slash + 1);
        return wildcard_match(base, normPattern);
    }

    const auto ps = detail::split_segments(normPath);
    const auto gs = detail::split_segments(normPattern);

    // dp[i][j]: first i path segments match first j glob segments
    std::vector<std::vector<bool>> dp(ps.size() + 1, std::vector<bool>(gs.size() + 1, false));
    dp[0][0] = true;
    for (size_t j = 1; j <= gs.size(); ++j) {
        dp[0][j] = dp[0][j - 1] && gs[j - 1] == "**";
    }
    for (size_t i = 1; i <= ps.size(); ++i) {
        for (size_t j = 1; j <= gs.size(); ++j) {
            if (gs[j - 1] == "**") {
                dp[i][j] = dp[i][j - 1] || dp[i - 1][j];
            } else {
                dp[i][j] = dp[i - 1][j - 1] && wildcard_match(ps[i - 1], gs[j - 1]);
            }
        }
    }
    return dp[ps.size()][gs.size()];
}

/**
 * Matches the given path against any of the provided glob patterns.
 */
template <std::ranges::input_range Range>
requires StringLike<std::ranges::range_value_t<Range>>
[[nodiscard]] inline bool matches_any(std::string_view text, const Range& patterns) {
    for (const auto& pat : patterns) {
        if (glob_match_path(text, std::string_view{pat})) {
            return true;
        }
    }
    return false;
}

/**
 * Split a comma-separated list of patterns into a vector of strings.
 * - Trims whitespace around each token
 * - Skips empty entries
 */
[[nodiscard]] inline std::vector<std::string> split_patterns(std::string_view csv) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= csv.size()) {
        size_t pos = csv.find(',', start);
        std::string_view token =
            (pos == std::string_view::npos) ? csv.substr(start) : csv.substr(start, pos - start);
        token = trim(token);
        if (!token.empty()) {
            out.emplace_back(token);
        }
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return out;
}

} // namespace loregraph::common
