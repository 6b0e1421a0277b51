// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include <ctime>
#include <iterator>

#include <QString>

#include <utf8.h>

#include "Utils.h"

namespace Utils {
    std::string toLowerUtf8(std::string_view text) {
        if (text.empty())
            return {};

        const QByteArray lowered = QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()))
                                       .toLower()
                                       .toUtf8();
        return std::string(lowered.constData(), static_cast<size_t>(lowered.size()));
    }

    std::u32string toCodePoints(std::string_view text) {
        std::u32string out;
        if (text.empty())
            return out;

        out.reserve(text.size());
        try {
            utf8::utf8to32(text.begin(), text.end(), std::back_inserter(out));
        } catch (const utf8::exception&) {
            // Names read straight off a raw filesystem are not guaranteed to be UTF-8.
            out.clear();
            std::string repaired;
            repaired.reserve(text.size());
            utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(repaired));
            utf8::utf8to32(repaired.begin(), repaired.end(), std::back_inserter(out));
        }
        return out;
    }

    std::size_t characterCount(std::string_view text) {
        if (utf8::is_valid(text.begin(), text.end())) {
            return static_cast<std::size_t>(utf8::distance(text.begin(), text.end()));
        }
        return toCodePoints(text).size();
    }

    std::vector<uint64_t> trigramsOf(const std::u32string& codePoints) {
        std::vector<uint64_t> tris;
        if (codePoints.size() < 3)
            return tris;

        tris.reserve(codePoints.size() - 2);
        for (size_t i = 0; i + 2 < codePoints.size(); ++i) {
            tris.push_back(packTrigram(codePoints[i], codePoints[i + 1], codePoints[i + 2]));
        }

        std::sort(tris.begin(), tris.end());
        tris.erase(std::unique(tris.begin(), tris.end()), tris.end());
        return tris;
    }

    std::string extensionOf(std::string_view lowerName) {
        const auto dot = lowerName.rfind('.');
        if (dot == std::string_view::npos || dot == 0 || dot + 1 >= lowerName.size())
            return {};
        return std::string(lowerName.substr(dot + 1));
    }

    bool containsPathSeparator(std::string_view text) {
        return text.find_first_of("/\\") != std::string_view::npos;
    }

    std::string secondsToFormattedTime(int64_t seconds) {
        const std::time_t t = static_cast<std::time_t>(seconds);
        std::tm tmBuf{};
        if (!localtime_r(&t, &tmBuf))
            return "invalid-time";

        char buf[20];
        if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmBuf) == 0)
            return "format-error";
        return std::string{buf};
    }
}
