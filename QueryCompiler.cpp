// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include <functional>

#include <QDate>
#include <QDateTime>
#include <QRegularExpression>

#include "IndexEngine.h"
#include "Logging.h"
#include "QueryCompiler.h"
#include "WildcardMatcher.h"

namespace QueryCompiler {
    namespace {
        constexpr int64_t kSecondsPerMinute = 60;
        constexpr int64_t kSecondsPerHour = 60 * kSecondsPerMinute;
        constexpr int64_t kSecondsPerDay = 24 * kSecondsPerHour;

        constexpr ValueRange kEmptyRange{1, 0};

        std::string lowerUtf8(const QString& s) {
            const QByteArray b = s.toLower().toUtf8();
            return std::string(b.constData(), static_cast<size_t>(b.size()));
        }

        Atom makeAtom(const QString& text) {
            Atom a;
            a.text = lowerUtf8(text);
            a.kind = WildcardMatcher::isWildcard(a.text) ? Atom::Kind::Wildcard : Atom::Kind::Literal;
            return a;
        }

        // "a|b|c" -> OR-list; empty alternatives are dropped, duplicates kept once
        AtomGroup atomsOf(const QString& text) {
            AtomGroup group;
            const QStringList parts = text.split(QLatin1Char('|'), Qt::SkipEmptyParts);
            for (const QString& part : parts) {
                Atom a = makeAtom(part);
                if (std::find(group.begin(), group.end(), a) == group.end()) {
                    group.push_back(std::move(a));
                }
            }
            return group;
        }

        std::optional<uint64_t> parsePlainNumber(const QString& text) {
            bool ok = false;
            const qulonglong v = text.toULongLong(&ok);
            if (!ok) return std::nullopt;
            return static_cast<uint64_t>(v);
        }

        /**
         * Comparison grammar shared by size and len:
         *   N, =N, >N, >=N, <N, <=N, a..b, a.., ..b
         */
        std::optional<ValueRange> parseRange(const QString& text,
                                             const std::function<std::optional<uint64_t>(const QString&)>& parseValue) {
            if (text.isEmpty()) return std::nullopt;

            const qsizetype dots = text.indexOf(QStringLiteral(".."));
            if (dots >= 0) {
                const QString lo = text.left(dots);
                const QString hi = text.mid(dots + 2);
                if (lo.isEmpty() && hi.isEmpty()) return std::nullopt;

                ValueRange r;
                if (!lo.isEmpty()) {
                    const auto v = parseValue(lo);
                    if (!v) return std::nullopt;
                    r.min = *v;
                }
                if (!hi.isEmpty()) {
                    const auto v = parseValue(hi);
                    if (!v) return std::nullopt;
                    r.max = *v;
                }
                if (r.min > r.max) std::swap(r.min, r.max);
                return r;
            }

            auto withValue = [&](qsizetype skip, auto&& make) -> std::optional<ValueRange> {
                const auto v = parseValue(text.mid(skip));
                if (!v) return std::nullopt;
                return make(*v);
            };

            // A point still running at "now" (7d, today, week) compares as its start instant
            auto lastMoment = [](const DateRange& p) {
                return p.to.anchor == DateBound::Anchor::Unbounded ? p.from : p.to;
            };

            if (text.startsWith(QStringLiteral(">="))) {
                const auto p = parseDatePoint(text.mid(2));
                if (!p) return std::nullopt;
                return DateRange{p->from, {}};
            }
            if (text.startsWith(QStringLiteral("<="))) {
                const auto p = parseDatePoint(text.mid(2));
                if (!p) return std::nullopt;
                return DateRange{{}, lastMoment(*p)};
            }
            if (text.startsWith(QLatin1Char('>'))) {
                // Strictly after the whole point: ">2024-01-01" starts on the 2nd
                const auto p = parseDatePoint(text.mid(1));
                if (!p) return std::nullopt;
                DateBound from = lastMoment(*p);
                from.offset += 1;
                return DateRange{from, {}};
            }
            if (text.startsWith(QLatin1Char('<'))) {
                // "<7d" means older than seven days
                const auto p = parseDatePoint(text.mid(1));
                if (!p) return std::nullopt;
                DateBound to = p->from;
                to.offset -= 1;
                return DateRange{{}, to};
            }
            if (text.startsWith(QLatin1Char('='))) {
                return withValue(1, [](uint64_t v) { return ValueRange{v, v}; });
            }
            return withValue(0, [](uint64_t v) { return ValueRange{v, v}; });
        }

        // A single date expression as the range of moments it denotes.
        std::optional<DateRange> parseDatePoint(const QString& text) {
            using A = DateBound::Anchor;

            if (text == QStringLiteral("today")) {
                return DateRange{{A::DayStart, 0, 0}, {}};
            }
            if (text == QStringLiteral("yesterday")) {
                return DateRange{{A::DayStart, -1, 0}, {A::DayStart, 0, -1}};
            }
            if (text == QStringLiteral("week")) {
                return DateRange{{A::SecondsAgo, 7 * kSecondsPerDay, 0}, {}};
            }
            if (text == QStringLiteral("month")) {
                return DateRange{{A::SecondsAgo, 30 * kSecondsPerDay, 0}, {}};
            }
            if (text == QStringLiteral("year")) {
                return DateRange{{A::YearStart, 0, 0}, {}};
            }

            static const QRegularExpression relRe(QStringLiteral("^(\\d{1,9})([dhm])$"));
            const QRegularExpressionMatch rel = relRe.match(text);
            if (rel.hasMatch()) {
                const int64_t n = rel.captured(1).toLongLong();
                const QChar unit = rel.captured(2).at(0);
                const int64_t mult = unit == QLatin1Char('d') ? kSecondsPerDay
                                   : unit == QLatin1Char('h') ? kSecondsPerHour
                                                              : kSecondsPerMinute;
                return DateRange{{A::SecondsAgo, n * mult, 0}, {}};
            }

            const QDate day = QDate::fromString(text, QStringLiteral("yyyy-MM-dd"));
            if (day.isValid()) {
                const int64_t start = day.startOfDay().toSecsSinceEpoch();
                const int64_t next = day.addDays(1).startOfDay().toSecsSinceEpoch();
                return DateRange{{A::Absolute, start, 0}, {A::Absolute, next, -1}};
            }

            return std::nullopt;
        }

        std::optional<DateRange> parseDate(const QString& text) {
            if (text.isEmpty()) return std::nullopt;

            const qsizetype dots = text.indexOf(QStringLiteral(".."));
            if (dots >= 0) {
                const auto from = parseDatePoint(text.left(dots));
                const auto to = parseDatePoint(text.mid(dots + 2));
                if (!from || !to) return std::nullopt;
                return DateRange{from->from, to->to};
            }

            if (text.startsWith(QStringLiteral(">="))) {
                const auto p = parseDatePoint(text.mid(2));
                if (!p) return std::nullopt;
                return DateRange{p->from, {}};
            }
            if (text.startsWith(QStringLiteral("<="))) {
                const auto p = parseDatePoint(text.mid(2));
                if (!p) return std::nullopt;
                return DateRange{{}, p->to};
            }
            if (text.startsWith(QLatin1Char('>'))) {
                // Strictly after the whole point: ">2024-01-01" starts on the 2nd
                const auto p = parseDatePoint(text.mid(1));
                if (!p || p->to.anchor == DateBound::Anchor::Unbounded) return std::nullopt;
                DateBound from = p->to;
                from.offset += 1;
                return DateRange{from, {}};
            }
            if (text.startsWith(QLatin1Char('<'))) {
                // "<7d" means older than seven days
                const auto p = parseDatePoint(text.mid(1));
                if (!p || p->from.anchor == DateBound::Anchor::Unbounded) return std::nullopt;
                DateBound to = p->from;
                to.offset -= 1;
                return DateRange{{}, to};
            }
            if (text.startsWith(QLatin1Char('='))) {
                return parseDatePoint(text.mid(1));
            }
            return parseDatePoint(text);
        }

        std::optional<quint8> parseAttributes(const QString& text) {
            if (text.isEmpty()) return std::nullopt;

            quint8 mask = 0;
            for (const QChar c : text) {
                if (c == QLatin1Char('h')) {
                    mask |= IndexEngine::AttrHidden;
                } else if (c == QLatin1Char('r')) {
                    mask |= IndexEngine::AttrReadOnly;
                } else {
                    return std::nullopt;
                }
            }
            return mask;
        }

        /**
         * Parses one known filter into the query.
         *
         * @return false if the value is malformed; the query is left untouched.
         */
        bool applyFilter(const QString& key, const QString& rawValue, Query& q) {
            using K = FilterClause::Kind;

            if (key == QStringLiteral("file") || key == QStringLiteral("folder")) {
                FilterClause clause;
                clause.kind = key == QStringLiteral("file") ? K::FilesOnly : K::FoldersOnly;
                q.filters.clauses.push_back(std::move(clause));

                AtomGroup group = atomsOf(rawValue);
                if (!group.empty()) {
                    q.groups.push_back(std::move(group));
                }
                return true;
            }

            const QString value = rawValue.toLower();
            const QStringList alts = value.split(QLatin1Char('|'), Qt::SkipEmptyParts);
            if (alts.isEmpty()) return false;

            FilterClause clause;

            if (key == QStringLiteral("ext")) {
                clause.kind = K::Extension;
                for (QString alt : alts) {
                    while (alt.startsWith(QLatin1Char('.'))) alt.remove(0, 1);
                    if (alt.isEmpty()) return false;
                    clause.texts.push_back(lowerUtf8(alt));
                }
            } else if (key == QStringLiteral("size")) {
                clause.kind = K::Size;
                for (const QString& alt : alts) {
                    const auto r = parseRange(alt, parseSize);
                    if (!r) return false;
                    clause.ranges.push_back(*r);
                }
            } else if (key == QStringLiteral("len")) {
                clause.kind = K::PathLength;
                for (const QString& alt : alts) {
                    const auto r = parseRange(alt, parsePlainNumber);
                    if (!r) return false;
                    clause.ranges.push_back(*r);
                }
            } else if (key == QStringLiteral("dm") || key == QStringLiteral("datemodified")) {
                clause.kind = K::DateModified;
                for (const QString& alt : alts) {
                    const auto d = parseDate(alt);
                    if (!d) return false;
                    clause.dates.push_back(*d);
                }
            } else if (key == QStringLiteral("attrib")) {
                clause.kind = K::Attributes;
                for (const QString& alt : alts) {
                    const auto m = parseAttributes(alt);
                    if (!m) return false;
                    clause.masks.push_back(*m);
                }
            } else if (key == QStringLiteral("path")) {
                clause.kind = K::PathContains;
                for (const QString& alt : alts) {
                    clause.texts.push_back(lowerUtf8(alt));
                }
            } else {
                return false;
            }

            q.filters.clauses.push_back(std::move(clause));
            return true;
        }

        QString atomToString(const Atom& a) {
            const QString text = QString::fromUtf8(a.text.data(), static_cast<qsizetype>(a.text.size()));
            return a.kind == Atom::Kind::Wildcard ? QStringLiteral("~") + text : text;
        }
    }

    int64_t DateBound::resolve(int64_t now, bool upper) const {
        switch (anchor) {
            case Anchor::Unbounded:
                return upper ? std::numeric_limits<int64_t>::max() : std::numeric_limits<int64_t>::min();
            case Anchor::Absolute:
                return value + offset;
            case Anchor::SecondsAgo:
                return now - value + offset;
            case Anchor::DayStart: {
                const QDate today = QDateTime::fromSecsSinceEpoch(now).date();
                return today.addDays(value).startOfDay().toSecsSinceEpoch() + offset;
            }
            case Anchor::YearStart: {
                const QDate today = QDateTime::fromSecsSinceEpoch(now).date();
                return QDate(today.year(), 1, 1).startOfDay().toSecsSinceEpoch() + offset;
            }
        }
        return 0;
    }

    const FilterClause* FilterSet::first(FilterClause::Kind kind) const {
        for (const FilterClause& c : clauses) {
            if (c.kind == kind) return &c;
        }
        return nullptr;
    }

    QStringList tokenize(const QString& raw) {
        QStringList terms;
        QString current;
        bool inQuotes = false;

        for (const QChar c : raw) {
            if (c == QLatin1Char('"')) {
                inQuotes = !inQuotes;
                continue;
            }
            if (!inQuotes && c.isSpace()) {
                if (!current.isEmpty()) {
                    terms.push_back(current);
                    current.clear();
                }
                continue;
            }
            current.append(c);
        }

        // An unterminated quote simply runs to the end of the input
        if (!current.isEmpty()) {
            terms.push_back(current);
        }
        return terms;
    }

    bool isKnownFilterKey(const QString& lowerKey) {
        static const QStringList keys = {
            QStringLiteral("ext"), QStringLiteral("size"), QStringLiteral("dm"),
            QStringLiteral("datemodified"), QStringLiteral("len"), QStringLiteral("attrib"),
            QStringLiteral("path"), QStringLiteral("file"), QStringLiteral("folder"),
        };
        return keys.contains(lowerKey);
    }

    std::optional<uint64_t> parseSize(const QString& text) {
        static const QRegularExpression re(
            QStringLiteral("^(\\d{1,19})(?:\\.(\\d{1,9}))?(b|k|kb|m|mb|g|gb)?$"),
            QRegularExpression::CaseInsensitiveOption);

        const QRegularExpressionMatch m = re.match(text);
        if (!m.hasMatch()) return std::nullopt;

        bool ok = false;
        const uint64_t whole = m.captured(1).toULongLong(&ok);
        if (!ok) return std::nullopt;

        const QString unit = m.captured(3).toLower();
        uint64_t mult = 1;
        if (unit.startsWith(QLatin1Char('k'))) mult = 1024ULL;
        else if (unit.startsWith(QLatin1Char('m'))) mult = 1024ULL * 1024ULL;
        else if (unit.startsWith(QLatin1Char('g'))) mult = 1024ULL * 1024ULL * 1024ULL;

        if (whole > std::numeric_limits<uint64_t>::max() / mult) return std::nullopt;
        uint64_t bytes = whole * mult;

        const QString frac = m.captured(2);
        if (!frac.isEmpty()) {
            const double fraction = QStringLiteral("0.%1").arg(frac).toDouble();
            const auto extra = static_cast<uint64_t>(fraction * static_cast<double>(mult));
            if (bytes > std::numeric_limits<uint64_t>::max() - extra) return std::nullopt;
            bytes += extra;
        }
        return bytes;
    }

    Query compile(const QString& raw) {
        Query q;

        for (const QString& term : tokenize(raw)) {
            if (term.size() > 1 && term.startsWith(QLatin1Char('!'))) {
                // Filters are never negated; "!ext:jpg" excludes the literal text
                for (Atom& a : atomsOf(term.mid(1))) {
                    if (std::find(q.excluded.begin(), q.excluded.end(), a) == q.excluded.end()) {
                        q.excluded.push_back(std::move(a));
                    }
                }
                continue;
            }

            const qsizetype colon = term.indexOf(QLatin1Char(':'));
            if (colon > 0) {
                const QString key = term.left(colon).toLower();
                if (isKnownFilterKey(key)) {
                    if (applyFilter(key, term.mid(colon + 1), q)) {
                        continue;
                    }
                    qCDebug(lcQuery) << "Malformed filter, treating as keyword:" << term;
                }

                q.groups.push_back(AtomGroup{Atom{Atom::Kind::Literal, lowerUtf8(term)}});
                continue;
            }

            AtomGroup group = atomsOf(term);
            if (!group.empty()) {
                q.groups.push_back(std::move(group));
            }
        }

        return q;
    }

    QString describe(const Query& query) {
        QStringList parts;
        for (const AtomGroup& g : query.groups) {
            QStringList alts;
            for (const Atom& a : g) alts.push_back(atomToString(a));
            parts.push_back(alts.size() == 1 ? alts.first() : QStringLiteral("(%1)").arg(alts.join(QStringLiteral(" | "))));
        }
        for (const Atom& a : query.excluded) {
            parts.push_back(QStringLiteral("!") + atomToString(a));
        }
        if (!query.filters.empty()) {
            parts.push_back(QStringLiteral("[%1 filter(s)]").arg(query.filters.clauses.size()));
        }
        return parts.isEmpty() ? QStringLiteral("<all>") : parts.join(QLatin1Char(' '));
    }
}
