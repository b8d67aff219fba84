#pragma once

/**
 * @file csv_writer.hpp
 * @brief CSV export of rollup tables and summary tables
 *
 * Floats are written with six decimals, NaN as an empty field.
 */

#include "hillmaker/processing/rollup_aggregator.hpp"
#include "hillmaker/statistics/summary_engine.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace hillmaker {

class CsvWriter {
public:
    CsvWriter() = delete;  // Static class, no instances

    /**
     * @brief Rows of several rollup tables, one after the other
     *
     * Columns: [category,]datetime,arrivals,departures,occupancy,day_of_week,
     * dow_name,bin_of_day,bin_of_day_str,bin_of_week
     */
    static void write_bydatetime(std::ostream& os,
                                 const std::vector<const RollupTable*>& tables,
                                 bool include_category);

    /// Summary rows with their group key columns and one column per statistic
    static void write_summary(std::ostream& os, const SummaryTable& table, bool include_category);

    /// One row per category: category and the statistics columns
    static void write_los(std::ostream& os, const LosSummary& los);

    /// File variants; throw std::runtime_error if the file cannot be written
    static void write_bydatetime_file(const std::string& path,
                                      const std::vector<const RollupTable*>& tables,
                                      bool include_category);
    static void write_summary_file(const std::string& path, const SummaryTable& table,
                                   bool include_category);
    static void write_los_file(const std::string& path, const LosSummary& los);

    /// "%.6f", or "" for NaN
    static std::string format_double(double value);

    /// Quote a field if it holds a comma, quote or newline
    static std::string escape(const std::string& field);
};

} // namespace hillmaker
