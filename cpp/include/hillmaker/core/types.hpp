#pragma once

/**
 * @file types.hpp
 * @brief Core data types for the hillmaker occupancy engine
 *
 * This file defines the fundamental value types shared by every stage of
 * the pipeline: timestamps, stop records, the analysis window, and the
 * enumerations used to classify records and select measures.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hillmaker {

// ============================================================================
// Time
// ============================================================================

/// Point in time with one-second resolution (UTC, no time zone handling)
using Timestamp = std::chrono::sys_seconds;

/// Build a timestamp from seconds since the Unix epoch
inline Timestamp timestamp_from_epoch(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

/// Seconds since the Unix epoch
inline int64_t epoch_seconds(Timestamp t) {
    return t.time_since_epoch().count();
}

// ============================================================================
// Enumerations
// ============================================================================

/// Occupancy contribution method for the arrival and departure bins
enum class EdgeBinsMode {
    FRACTIONAL = 1,   ///< Credit only the occupied fraction of the edge bin
    WHOLE_BIN = 2     ///< Credit the whole edge bin
};

/**
 * @brief Relationship of a stop interval to the analysis window
 */
enum class RecordRelationship {
    INNER,      ///< Entry and exit both inside the window
    LEFT,       ///< Entry before window start, exit inside
    RIGHT,      ///< Entry inside, exit at or after window end
    OUTER,      ///< Interval spans the whole window
    BACKWARDS,  ///< Exit before entry (bad record)
    NONE        ///< No overlap with the window
};

/// Flow measures produced for every bin
enum class Measure {
    ARRIVALS,
    DEPARTURES,
    OCCUPANCY
};

/// Lowercase name of a relationship ("inner", "left", ...)
const char* relationship_name(RecordRelationship rel);

/// Column name of a measure ("arrivals", "departures", "occupancy")
const char* measure_name(Measure measure);

/// Measures in output order
inline const std::vector<Measure>& all_measures() {
    static const std::vector<Measure> measures = {
        Measure::OCCUPANCY, Measure::ARRIVALS, Measure::DEPARTURES
    };
    return measures;
}

/// True for relationships whose occupancy is accumulated
inline bool contributes_occupancy(RecordRelationship rel) {
    return rel == RecordRelationship::INNER || rel == RecordRelationship::LEFT ||
           rel == RecordRelationship::RIGHT || rel == RecordRelationship::OUTER;
}

/// Record counts keyed by relationship type
using RelationshipCounts = std::map<RecordRelationship, size_t>;

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief One entity's stay: arrival, departure, optional category and weight
 *
 * No invariant is enforced at construction. A record with exit before
 * entry is legal input and is classified as BACKWARDS.
 */
struct StopRecord {
    Timestamp entry;                     ///< Arrival instant
    Timestamp exit;                      ///< Departure instant
    std::optional<std::string> category; ///< Category label (optional)
    double weight;                       ///< Occupancy weight

    StopRecord() : weight(1.0) {}

    StopRecord(Timestamp in, Timestamp out,
               std::optional<std::string> cat = std::nullopt, double w = 1.0)
        : entry(in), exit(out), category(std::move(cat)), weight(w) {}

    /// Length of stay in seconds (negative for backwards records)
    int64_t duration_seconds() const {
        return (exit - entry).count();
    }
};

/**
 * @brief Analysis time range
 *
 * Classification uses the half-open range [start, end); arrival and
 * departure counting uses the closed range [start, end].
 */
struct AnalysisWindow {
    Timestamp start;
    Timestamp end;

    AnalysisWindow() = default;
    AnalysisWindow(Timestamp s, Timestamp e) : start(s), end(e) {}

    /// Window length in seconds
    int64_t duration_seconds() const { return (end - start).count(); }

    /// start <= t < end
    bool contains(Timestamp t) const { return start <= t && t < end; }

    /// start <= t <= end
    bool contains_closed(Timestamp t) const { return start <= t && t <= end; }
};

// ============================================================================
// Errors
// ============================================================================

/// Fatal input validation failure, raised before any computation
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

/// Violated numeric invariant (edge fraction, bin count); indicates a bug
class NumericInvariantError : public std::logic_error {
public:
    explicit NumericInvariantError(const std::string& what) : std::logic_error(what) {}
};

/// Run aborted through a CancellationToken
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& what) : std::runtime_error(what) {}
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    /// Key of the cross-category pseudo-category
    constexpr const char* TOTAL_KEY = "total";

    /// Key for records without a category when other records have one
    constexpr const char* UNCATEGORIZED_KEY = "uncategorized";

    /// Relative tolerance of the occupancy conservation check
    constexpr double OCC_TOLERANCE = 0.02;

    /// Hours the window may start before the first arrival without a warning
    constexpr double EARLY_START_ANALYSIS_TOLERANCE_HOURS = 48.0;

    /// Hours the window may end after the last departure without a warning
    constexpr double LATE_END_ANALYSIS_TOLERANCE_HOURS = 48.0;

    /// Slack allowed on edge fractions before the invariant fails
    constexpr double FRACTION_EPSILON = 1e-9;

    constexpr int MINUTES_PER_DAY = 1440;
    constexpr int64_t SECONDS_PER_DAY = 86400;
}

} // namespace hillmaker
