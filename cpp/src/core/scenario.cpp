#include "hillmaker/core/scenario.hpp"
#include "hillmaker/core/time_bins.hpp"
#include "hillmaker/core/timestamp.hpp"
#include "hillmaker/statistics/summary_engine.hpp"
#include <algorithm>

namespace hillmaker {

Scenario::Scenario(ScenarioOptions options) : options_(std::move(options)) {
    auto& o = options_;

    if (o.scenario_name.empty()) {
        throw ValidationError("Scenario name must not be empty");
    }
    if (o.in_field.empty() || o.out_field.empty()) {
        throw ValidationError("Entry and exit field names must not be empty");
    }

    // End date covers its whole day
    o.end_analysis_dt = TimeBinIndexer::floor_day(o.end_analysis_dt) +
                        std::chrono::seconds(constants::SECONDS_PER_DAY - 1);
    if (o.end_analysis_dt <= o.start_analysis_dt) {
        throw ValidationError("End analysis date (" + format_timestamp(o.end_analysis_dt) +
                              ") must be after start analysis date (" +
                              format_timestamp(o.start_analysis_dt) + ")");
    }

    validate_bin_size(o.bin_size_minutes, "bin_size_minutes");
    validate_bin_size(o.highres_bin_size_minutes, "highres_bin_size_minutes");
    if (o.highres_bin_size_minutes > o.bin_size_minutes) {
        throw ValidationError("highres_bin_size_minutes (" +
                              std::to_string(o.highres_bin_size_minutes) +
                              ") must not exceed bin_size_minutes (" +
                              std::to_string(o.bin_size_minutes) + ")");
    }
    if (o.bin_size_minutes % o.highres_bin_size_minutes != 0) {
        throw ValidationError("highres_bin_size_minutes must divide bin_size_minutes");
    }

    if (o.edge_bins != EdgeBinsMode::FRACTIONAL && o.edge_bins != EdgeBinsMode::WHOLE_BIN) {
        throw ValidationError("edge_bins must be 1 (fractional) or 2 (whole bin)");
    }

    std::vector<std::string> percentile_names;
    for (double p : o.percentiles) {
        if (!(p >= 0.0 && p <= 1.0)) {
            throw ValidationError("Percentile " + std::to_string(p) + " outside [0, 1]");
        }
        const std::string name = StatisticsEngine::percentile_name(p);
        if (std::find(percentile_names.begin(), percentile_names.end(), name) !=
            percentile_names.end()) {
            throw ValidationError("Percentiles share the column name " + name);
        }
        percentile_names.push_back(name);
    }

    // Throws for unknown units
    SummaryEngine::los_unit_seconds(o.los_units);

    if (o.cat_field && o.cat_field->empty()) {
        o.cat_field.reset();
    }
    if (o.occ_weight_field && o.occ_weight_field->empty()) {
        o.occ_weight_field.reset();
    }

    // Fractional fine-then-mean equals the direct report-grid result
    if (o.edge_bins == EdgeBinsMode::FRACTIONAL && !o.keep_highres_bydatetime) {
        o.highres_bin_size_minutes = o.bin_size_minutes;
    }
}

bool Scenario::is_excluded(const std::string& category) const {
    const auto& ex = options_.cats_to_exclude;
    return std::find(ex.begin(), ex.end(), category) != ex.end();
}

void Scenario::validate_bin_size(int minutes, const char* what) {
    if (minutes <= 0 || constants::MINUTES_PER_DAY % minutes != 0) {
        throw ValidationError(std::string(what) + " (" + std::to_string(minutes) +
                              ") must be a positive divisor of 1440");
    }
}

} // namespace hillmaker
