#pragma once

/**
 * @file scenario.hpp
 * @brief Run configuration and its validation
 */

#include "hillmaker/core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hillmaker {

/// Options of one analysis run
struct ScenarioOptions {
    std::string scenario_name = "scenario";         ///< Prefix of exported file names

    std::string in_field = "InRoomTS";              ///< Entry timestamp column
    std::string out_field = "OutRoomTS";            ///< Exit timestamp column
    std::optional<std::string> cat_field;           ///< Category column
    std::optional<std::string> occ_weight_field;    ///< Weight column

    Timestamp start_analysis_dt;                    ///< Window start (required)
    Timestamp end_analysis_dt;                      ///< Window end (required)

    int bin_size_minutes = 60;                      ///< Report bin width
    int highres_bin_size_minutes = 5;               ///< Fine bin width
    bool keep_highres_bydatetime = false;           ///< Also return fine-resolution tables
    EdgeBinsMode edge_bins = EdgeBinsMode::FRACTIONAL;

    std::vector<std::string> cats_to_exclude;       ///< Categories dropped before accumulation
    std::vector<double> percentiles = {0.25, 0.5, 0.75, 0.95, 0.99};
    std::string los_units = "hours";                ///< Length-of-stay unit

    bool totals = true;                             ///< Add the cross-category total
    bool nonstationary_stats = true;
    bool stationary_stats = true;

    bool export_bydatetime_csv = false;
    bool export_summaries_csv = false;
    std::string csv_export_path = ".";

    bool parallel_categories = true;                ///< One worker task per category
    int verbosity = 0;                              ///< 0 warnings, 1 info, 2 debug, < 0 silent
};

/**
 * @brief Validated, normalised scenario
 *
 * Construction validates the options and applies two normalisations: the
 * window end moves to the last second of its day, and in FRACTIONAL mode
 * without high-resolution output the fine grid equals the report grid.
 */
class Scenario {
public:
    /// @throws ValidationError on any invalid option
    explicit Scenario(ScenarioOptions options);

    const ScenarioOptions& options() const { return options_; }

    /// [start, end] after normalisation
    AnalysisWindow window() const {
        return AnalysisWindow(options_.start_analysis_dt, options_.end_analysis_dt);
    }

    int report_bin_minutes() const { return options_.bin_size_minutes; }
    int highres_bin_minutes() const { return options_.highres_bin_size_minutes; }

    /// Category column name, empty when records carry no category field
    std::string cat_field_name() const { return options_.cat_field.value_or(""); }

    bool is_excluded(const std::string& category) const;

    /// Throws ValidationError unless `minutes` is positive and divides 1440
    static void validate_bin_size(int minutes, const char* what);

private:
    ScenarioOptions options_;
};

} // namespace hillmaker
