// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_WILDCARDMATCHER_H
#define FINDEX_WILDCARDMATCHER_H

#include <string>
#include <string_view>

/**
 * Matches lowercase UTF-8 text against a '*' / '?' pattern.
 *
 * '*' matches any run of characters (including none), '?' matches exactly one
 * character (code point, not byte). The pattern must match the whole text.
 * A pattern containing a path separator is meant to be tested against full
 * paths; see matchesFullPath().
 */
class WildcardMatcher {
public:
    explicit WildcardMatcher(std::string_view lowerPattern);

    [[nodiscard]] bool matches(std::string_view lowerText) const;

    [[nodiscard]] bool matchesFullPath() const { return m_fullPath; }
    [[nodiscard]] const std::u32string& pattern() const { return m_pattern; }

    [[nodiscard]] static bool isWildcard(std::string_view text) {
        return text.find_first_of("*?") != std::string_view::npos;
    }

private:
    std::u32string m_pattern;
    bool m_fullPath = false;
};

#endif //FINDEX_WILDCARDMATCHER_H
