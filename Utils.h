// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_UTILS_H
#define FINDEX_UTILS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {
    /**
     * Lowercases a UTF-8 string using Unicode case mapping (not just ASCII).
     * Invalid sequences are replaced with U+FFFD by the conversion.
     */
    [[nodiscard]] std::string toLowerUtf8(std::string_view text);

    /**
     * Decodes UTF-8 into code points.
     *
     * Invalid input is repaired first (each bad sequence becomes U+FFFD), so the
     * result is always usable for character-level matching.
     *
     * @param text UTF-8 encoded text.
     * @return The decoded code points.
     */
    [[nodiscard]] std::u32string toCodePoints(std::string_view text);

    /**
     * Number of characters (code points) in a UTF-8 string.
     */
    [[nodiscard]] std::size_t characterCount(std::string_view text);

    /**
     * Packs three code points into one 64-bit trigram key (21 bits each).
     */
    [[nodiscard]] constexpr uint64_t packTrigram(char32_t a, char32_t b, char32_t c) {
        return (static_cast<uint64_t>(a & 0x1FFFFFu) << 42) |
               (static_cast<uint64_t>(b & 0x1FFFFFu) << 21) |
               (static_cast<uint64_t>(c & 0x1FFFFFu));
    }

    /**
     * Every overlapping 3-character window of the given code points, sorted and
     * de-duplicated. Empty when fewer than 3 characters are present.
     */
    [[nodiscard]] std::vector<uint64_t> trigramsOf(const std::u32string& codePoints);

    /**
     * Lowercase extension of a (lowercase) file name, without the dot.
     * Returns an empty string for names without a dot, names ending in a dot,
     * and dot files such as ".bashrc".
     */
    [[nodiscard]] std::string extensionOf(std::string_view lowerName);

    [[nodiscard]] inline bool isPathSeparator(char32_t c) {
        return c == U'/' || c == U'\\';
    }

    [[nodiscard]] bool containsPathSeparator(std::string_view text);

    /**
     * Byte-wise substring test. Both sides are expected to be lowercased already;
     * for valid UTF-8 a byte match is always a character match.
     */
    [[nodiscard]] inline bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

    /**
     * Converts seconds since the Unix epoch into "YYYY-MM-DD HH:MM:SS" local time.
     */
    [[nodiscard]] std::string secondsToFormattedTime(int64_t seconds);
}

#endif //FINDEX_UTILS_H
