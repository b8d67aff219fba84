#pragma once

/**
 * @file summary_engine.hpp
 * @brief Grouped descriptive statistics over rollup tables
 *
 * Nonstationary summaries group by (category, day_of_week, bin_of_day);
 * stationary summaries group by category only. Every grouping produces
 * one SummaryTable per measure.
 */

#include "hillmaker/core/types.hpp"
#include "hillmaker/processing/rollup_aggregator.hpp"
#include "hillmaker/statistics/statistics_engine.hpp"
#include <map>
#include <string>
#include <vector>

namespace hillmaker {

/// Group key of a summary row; calendar fields are -1 / empty when stationary
struct SummaryKey {
    std::string category;
    int day_of_week = -1;
    std::string dow_name;
    int bin_of_day = -1;
    std::string bin_of_day_str;

    bool operator<(const SummaryKey& other) const {
        if (category != other.category) return category < other.category;
        if (day_of_week != other.day_of_week) return day_of_week < other.day_of_week;
        return bin_of_day < other.bin_of_day;
    }
};

struct SummaryRow {
    SummaryKey key;
    DescriptiveStatistics stats;
};

/// Statistics of one measure for every group, sorted by key
struct SummaryTable {
    Measure measure = Measure::OCCUPANCY;
    bool stationary = false;
    std::vector<double> percentiles;
    std::vector<SummaryRow> rows;

    /// Row of a group key (nullptr if absent)
    const SummaryRow* find(const SummaryKey& key) const;

    /// "p25", "p50", ... in request order
    std::vector<std::string> percentile_names() const;
};

/// Measure name -> table
using MeasureSummaries = std::map<std::string, SummaryTable>;

/// Grouping key ("{cat}_dow_binofday", "dow_binofday", "{cat}", "") -> summaries
struct HillsSummaries {
    std::map<std::string, MeasureSummaries> nonstationary;
    std::map<std::string, MeasureSummaries> stationary;
};

/// Length-of-stay statistics per category (and total)
struct LosSummary {
    std::string units;
    std::vector<double> percentiles;
    std::map<std::string, DescriptiveStatistics> by_category;
};

class SummaryEngine {
public:
    SummaryEngine() = delete;  // Static class, no instances

    /// Group rows of all tables by (category, day_of_week, bin_of_day)
    static MeasureSummaries summarize_nonstationary(
        const std::vector<const RollupTable*>& tables,
        const std::vector<double>& percentiles);

    /// Group rows of all tables by category
    static MeasureSummaries summarize_stationary(
        const std::vector<const RollupTable*>& tables,
        const std::vector<double>& percentiles);

    /**
     * @brief All requested summaries of a run
     *
     * @param bydatetime Rollup tables keyed by category, may contain TOTAL_KEY
     * @param cat_field Category column name; empty when records are uncategorised
     */
    static HillsSummaries summarize(const std::map<std::string, RollupTable>& bydatetime,
                                    const std::string& cat_field,
                                    bool nonstationary,
                                    bool stationary,
                                    const std::vector<double>& percentiles);

    /// Seconds per length-of-stay unit; throws ValidationError for unknown units
    static double los_unit_seconds(const std::string& units);

    /**
     * @brief Length-of-stay statistics of overlapping records
     *
     * Only INNER, LEFT, RIGHT and OUTER records contribute. When `with_total`
     * is set, a TOTAL_KEY entry pools every category.
     */
    static LosSummary summarize_los(
        const std::map<std::string, std::vector<StopRecord>>& records_by_category,
        const AnalysisWindow& window,
        const std::string& units,
        const std::vector<double>& percentiles,
        bool with_total);
};

} // namespace hillmaker
