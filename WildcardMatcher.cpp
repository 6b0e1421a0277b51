// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <utf8.h>

#include "Utils.h"
#include "WildcardMatcher.h"

WildcardMatcher::WildcardMatcher(std::string_view lowerPattern)
    : m_pattern(Utils::toCodePoints(lowerPattern))
    , m_fullPath(Utils::containsPathSeparator(lowerPattern)) {
    // Collapse runs of '*'; they are equivalent and only cost backtracking
    std::u32string collapsed;
    collapsed.reserve(m_pattern.size());
    for (char32_t c : m_pattern) {
        if (c == U'*' && !collapsed.empty() && collapsed.back() == U'*') continue;
        collapsed.push_back(c);
    }
    m_pattern = std::move(collapsed);
}

bool WildcardMatcher::matches(std::string_view lowerText) const {
    // Text coming out of a DriveStore has been through QString and is valid UTF-8.
    // Anything else is repaired first so the unchecked iteration below is safe.
    std::string repaired;
    if (!utf8::is_valid(lowerText.begin(), lowerText.end())) {
        utf8::replace_invalid(lowerText.begin(), lowerText.end(), std::back_inserter(repaired));
        lowerText = repaired;
    }

    const char32_t* p = m_pattern.data();
    const char32_t* const pEnd = p + m_pattern.size();
    const char* t = lowerText.data();
    const char* const tEnd = t + lowerText.size();

    // Greedy match with a single backtrack point: the last '*' seen.
    const char32_t* starP = nullptr;
    const char* starT = nullptr;

    while (t != tEnd) {
        if (p != pEnd && *p == U'*') {
            starP = ++p;
            starT = t;
            continue;
        }

        if (p != pEnd) {
            const char* next = t;
            const char32_t c = utf8::unchecked::next(next);
            if (*p == U'?' || *p == c) {
                ++p;
                t = next;
                continue;
            }
        }

        if (starP) {
            // Let the star swallow one more character and retry
            utf8::unchecked::next(starT);
            p = starP;
            t = starT;
            continue;
        }

        return false;
    }

    while (p != pEnd && *p == U'*') ++p;
    return p == pEnd;
}
