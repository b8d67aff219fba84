#pragma once

/**
 * @file rollup_aggregator.hpp
 * @brief Calendar-aware aggregation of a fine grid to the reporting bin width
 */

#include "hillmaker/core/types.hpp"
#include "hillmaker/processing/bin_accumulator.hpp"
#include <string>
#include <vector>

namespace hillmaker {

/// One reporting bin of one category
struct RollupRow {
    Timestamp datetime;         ///< Start of the reporting bin
    double arrivals;            ///< Sum over fine bins
    double departures;          ///< Sum over fine bins
    double occupancy;           ///< Mean over fine bins
    int day_of_week;            ///< 0 = Monday
    std::string dow_name;       ///< "Mon" ... "Sun"
    int bin_of_day;             ///< Reporting bin within the day
    std::string bin_of_day_str; ///< "HH:MM" of the bin start
    int bin_of_week;            ///< Reporting bin within the week

    RollupRow()
        : arrivals(0.0), departures(0.0), occupancy(0.0)
        , day_of_week(0), bin_of_day(0), bin_of_week(0) {}

    double value(Measure measure) const;
};

/// Rows of one category, sorted by datetime
struct RollupTable {
    std::string category;
    int bin_minutes = 0;
    std::vector<RollupRow> rows;

    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }
};

class RollupAggregator {
public:
    RollupAggregator() = delete;  // Static class, no instances

    /**
     * @brief Aggregate a fine grid to `report_bin_minutes`
     *
     * Fine bins are grouped by (date, fine_bin_of_day / ratio) where ratio is
     * report_bin_minutes / highres_bin_minutes. Arrivals and departures are
     * summed, occupancy is averaged over the fine bins present in the group.
     *
     * @param category Category key stored in the table
     * @param matrix Fine grid whose bin 0 starts at `origin`
     * @param origin Analysis window start
     * @throws ValidationError if the report width is not a multiple of the fine width
     */
    static RollupTable rollup(const std::string& category,
                              const FineGridMatrix& matrix,
                              Timestamp origin,
                              int highres_bin_minutes,
                              int report_bin_minutes);

    /// Table of the fine grid itself, one row per fine bin
    static RollupTable highres(const std::string& category,
                               const FineGridMatrix& matrix,
                               Timestamp origin,
                               int highres_bin_minutes) {
        return rollup(category, matrix, origin, highres_bin_minutes, highres_bin_minutes);
    }

    /// Fill day_of_week, dow_name, bin_of_day, bin_of_day_str, bin_of_week from datetime
    static void attach_calendar(RollupRow& row, int bin_minutes);
};

} // namespace hillmaker
