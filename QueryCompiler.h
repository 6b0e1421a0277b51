// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef FINDEX_QUERYCOMPILER_H
#define FINDEX_QUERYCOMPILER_H

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <QString>
#include <QStringList>

namespace QueryCompiler {
    /**
     * A single keyword. Literal atoms are matched by substring containment,
     * wildcard atoms (containing '*' or '?') by the WildcardMatcher.
     * The text is always lowercase UTF-8.
     */
    struct Atom {
        enum class Kind : quint8 { Literal, Wildcard };

        Kind kind = Kind::Literal;
        std::string text;

        bool operator==(const Atom& o) const = default;
    };

    // OR-list of atoms
    using AtomGroup = std::vector<Atom>;

    // Inclusive on both ends. min > max means "matches nothing".
    struct ValueRange {
        uint64_t min = 0;
        uint64_t max = std::numeric_limits<uint64_t>::max();

        [[nodiscard]] bool contains(uint64_t v) const { return v >= min && v <= max; }

        bool operator==(const ValueRange& o) const = default;
    };

    /**
     * One end of a modified-time range. Relative forms are kept symbolic so that
     * compiling the same text twice gives equal queries; they are resolved against
     * the search start time by resolve().
     */
    struct DateBound {
        enum class Anchor : quint8 {
            Unbounded,  // -inf for a lower bound, +inf for an upper bound
            Absolute,   // value = seconds since epoch
            SecondsAgo, // value = seconds before "now"
            DayStart,   // value = day offset from today's local midnight
            YearStart,  // January 1st of the current local year
        };

        Anchor anchor = Anchor::Unbounded;
        int64_t value = 0;
        int64_t offset = 0; // seconds added after anchoring

        [[nodiscard]] int64_t resolve(int64_t now, bool upper) const;

        bool operator==(const DateBound& o) const = default;
    };

    struct DateRange {
        DateBound from;
        DateBound to;

        [[nodiscard]] bool contains(int64_t t, int64_t now) const {
            return t >= from.resolve(now, false) && t <= to.resolve(now, true);
        }

        bool operator==(const DateRange& o) const = default;
    };

    /**
     * A closed set of filter kinds. Each clause lists accepted alternatives
     * (key:v1|v2); a record passes a clause when any alternative accepts it.
     * Only the vector matching the kind is populated.
     */
    struct FilterClause {
        enum class Kind : quint8 {
            Extension,    // texts
            Size,         // ranges
            DateModified, // dates
            PathLength,   // ranges
            Attributes,   // masks, all bits of one mask must be set
            PathContains, // texts
            FilesOnly,
            FoldersOnly,
        };

        Kind kind = Kind::Extension;
        std::vector<std::string> texts;
        std::vector<ValueRange> ranges;
        std::vector<DateRange> dates;
        std::vector<quint8> masks;

        bool operator==(const FilterClause& o) const = default;
    };

    struct FilterSet {
        std::vector<FilterClause> clauses; // all must pass

        [[nodiscard]] bool empty() const { return clauses.empty(); }
        [[nodiscard]] const FilterClause* first(FilterClause::Kind kind) const;

        bool operator==(const FilterSet& o) const = default;
    };

    /**
     * Normalized query: every group must match (AND), any atom of a group may
     * match (OR), no excluded atom may match, and the filters must pass.
     */
    struct Query {
        std::vector<AtomGroup> groups;
        std::vector<Atom> excluded;
        FilterSet filters;

        [[nodiscard]] bool hasKeywords() const { return !groups.empty(); }
        [[nodiscard]] bool isEmpty() const { return groups.empty() && excluded.empty() && filters.empty(); }

        bool operator==(const Query& o) const = default;
    };

    /**
     * Compiles free text into a Query. Total: any input produces a Query; filter
     * terms that cannot be understood become literal keywords.
     *
     * Examples:
     *  "project !backup"             -> groups [[project]], excluded [backup]
     *  "ext:jpg|png size:>5mb"       -> filters Extension{jpg,png}, Size{>5 MiB}
     *  "foo:bar"                     -> groups [["foo:bar"]] (unknown key)
     *
     * @param raw The text as typed by the user.
     * @return The compiled query. Compiling the same text twice yields equal queries.
     */
    [[nodiscard]] Query compile(const QString& raw);

    /**
     * Splits on whitespace; double quotes group a run of characters (including
     * spaces) into one term and are removed.
     */
    [[nodiscard]] QStringList tokenize(const QString& raw);

    [[nodiscard]] bool isKnownFilterKey(const QString& lowerKey);

    /**
     * Parses "512", "10kb", "1.5mb", "2gb" into bytes.
     */
    [[nodiscard]] std::optional<uint64_t> parseSize(const QString& text);

    // Human readable form for logs.
    [[nodiscard]] QString describe(const Query& query);
}

#endif //FINDEX_QUERYCOMPILER_H
