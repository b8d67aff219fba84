#pragma once

/**
 * @file diagnostics.hpp
 * @brief Run report: log events, relationship counts, conservation results
 *
 * Every pipeline stage writes to an explicit Diagnostics object instead of a
 * process-wide logger, so correctness never depends on log configuration.
 * Worker tasks own their own instance and are merged at the reduction step.
 */

#include "hillmaker/core/types.hpp"
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace hillmaker {

/// Severity of a diagnostic event
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2
};

const char* log_level_name(LogLevel level);

/// Single logged event
struct DiagnosticEvent {
    LogLevel level;         ///< Severity
    std::string category;   ///< Category tag (empty for run-level events)
    std::string message;    ///< Human-readable message
};

/**
 * @brief Outcome of the conservation-of-flow checks for one category
 */
struct ConservationReport {
    std::string category;

    double arrivals_binned;         ///< sum(arrivals) over the fine grid
    size_t arrivals_expected;       ///< records with start <= entry <= end
    double departures_binned;       ///< sum(departures) over the fine grid
    size_t departures_expected;     ///< records with start <= exit <= end

    double occupancy_binned_minutes;    ///< sum(occupancy) * bin width
    double occupancy_expected_minutes;  ///< weighted stay minutes inside the grid
    double occupancy_raw_minutes;       ///< weighted stay minutes, unclipped
    double occupancy_relative_error;    ///< |binned - expected| / expected

    bool arrivals_ok;
    bool departures_ok;
    bool occupancy_ok;

    ConservationReport()
        : arrivals_binned(0.0), arrivals_expected(0)
        , departures_binned(0.0), departures_expected(0)
        , occupancy_binned_minutes(0.0), occupancy_expected_minutes(0.0)
        , occupancy_raw_minutes(0.0), occupancy_relative_error(0.0)
        , arrivals_ok(true), departures_ok(true), occupancy_ok(true) {}

    bool ok() const { return arrivals_ok && departures_ok && occupancy_ok; }
};

class Diagnostics {
public:
    Diagnostics() = default;

    void debug(const std::string& message, const std::string& category = "");
    void info(const std::string& message, const std::string& category = "");
    void warning(const std::string& message, const std::string& category = "");

    /// Add the relationship counts of one category
    void add_relationship_counts(const std::string& category, const RelationshipCounts& counts);

    /// Store a conservation report
    void add_conservation(ConservationReport report);

    /// Append all events, counts and reports of another instance
    void merge(const Diagnostics& other);

    const std::vector<DiagnosticEvent>& events() const { return events_; }

    /// Messages of all WARNING events
    std::vector<std::string> warnings() const;

    /// Number of events at the given level
    size_t count(LogLevel level) const;

    /// Relationship counts by category
    const std::map<std::string, RelationshipCounts>& relationship_counts() const {
        return relationship_counts_;
    }

    /// Relationship counts summed over all categories
    RelationshipCounts total_relationship_counts() const;

    const std::vector<ConservationReport>& conservation() const { return conservation_; }

    /// Write events at or above min_level as "[hillmaker] LEVEL cat=X message" lines
    void emit(std::ostream& os, LogLevel min_level) const;

    /// Map a verbosity setting (0, 1, 2) to the lowest emitted level
    static LogLevel level_for_verbosity(int verbosity);

private:
    void add(LogLevel level, const std::string& message, const std::string& category);

    std::vector<DiagnosticEvent> events_;
    std::map<std::string, RelationshipCounts> relationship_counts_;
    std::vector<ConservationReport> conservation_;
};

/// "inner=3 left=1 ..." in enum order, zero counts omitted
std::string format_relationship_counts(const RelationshipCounts& counts);

} // namespace hillmaker
