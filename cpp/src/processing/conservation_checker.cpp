#include "hillmaker/processing/conservation_checker.hpp"
#include "hillmaker/core/time_bins.hpp"
#include "hillmaker/core/timestamp.hpp"
#include "hillmaker/processing/record_classifier.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace hillmaker {

namespace {

constexpr double COUNT_EPSILON = 1e-9;

double overlap_seconds(Timestamp a0, Timestamp a1, Timestamp b0, Timestamp b1) {
    const Timestamp lo = std::max(a0, b0);
    const Timestamp hi = std::min(a1, b1);
    return hi > lo ? static_cast<double>((hi - lo).count()) : 0.0;
}

} // namespace

ConservationReport ConservationChecker::check(const std::string& category,
                                              const FineGridMatrix& matrix,
                                              const std::vector<StopRecord>& records,
                                              const AnalysisWindow& window,
                                              int bin_minutes,
                                              EdgeBinsMode edge_mode,
                                              Diagnostics& diagnostics) {
    ConservationReport report;
    report.category = category;

    const int64_t num_bins = static_cast<int64_t>(matrix.size());
    const Timestamp grid_end = TimeBinIndexer::bin_start(window.start, num_bins, bin_minutes);

    double expected_seconds = 0.0;
    double raw_seconds = 0.0;

    for (const auto& rec : records) {
        const RecordRelationship rel = RecordClassifier::classify(rec, window);
        if (rel == RecordRelationship::BACKWARDS) {
            continue;
        }
        if (window.contains_closed(rec.entry)) ++report.arrivals_expected;
        if (window.contains_closed(rec.exit)) ++report.departures_expected;

        if (!contributes_occupancy(rel)) {
            continue;
        }
        expected_seconds += rec.weight * overlap_seconds(rec.entry, rec.exit,
                                                         window.start, grid_end);
        raw_seconds += rec.weight * static_cast<double>(rec.duration_seconds());
    }

    report.arrivals_binned = matrix.total(Measure::ARRIVALS);
    report.departures_binned = matrix.total(Measure::DEPARTURES);
    report.occupancy_binned_minutes = matrix.total(Measure::OCCUPANCY) * bin_minutes;
    report.occupancy_expected_minutes = expected_seconds / 60.0;
    report.occupancy_raw_minutes = raw_seconds / 60.0;

    report.arrivals_ok = std::fabs(report.arrivals_binned -
                                   static_cast<double>(report.arrivals_expected)) < COUNT_EPSILON;
    report.departures_ok = std::fabs(report.departures_binned -
                                     static_cast<double>(report.departures_expected)) < COUNT_EPSILON;

    const double diff = std::fabs(report.occupancy_binned_minutes -
                                  report.occupancy_expected_minutes);
    if (report.occupancy_expected_minutes > 0.0) {
        report.occupancy_relative_error = diff / report.occupancy_expected_minutes;
    } else {
        report.occupancy_relative_error = diff > COUNT_EPSILON ? 1.0 : 0.0;
    }

    if (edge_mode == EdgeBinsMode::FRACTIONAL) {
        report.occupancy_ok = report.occupancy_relative_error <= constants::OCC_TOLERANCE;
    } else {
        diagnostics.debug("Whole-bin edge mode, occupancy conservation not compared", category);
    }

    std::ostringstream oss;
    oss << "Conservation: arrivals " << report.arrivals_binned << "/" << report.arrivals_expected
        << ", departures " << report.departures_binned << "/" << report.departures_expected
        << ", occupancy minutes " << report.occupancy_binned_minutes << "/"
        << report.occupancy_expected_minutes << " (raw " << report.occupancy_raw_minutes << ")";
    diagnostics.info(oss.str(), category);

    if (!report.arrivals_ok) {
        std::ostringstream w;
        w << "Binned arrivals " << report.arrivals_binned << " != expected "
          << report.arrivals_expected;
        diagnostics.warning(w.str(), category);
    }
    if (!report.departures_ok) {
        std::ostringstream w;
        w << "Binned departures " << report.departures_binned << " != expected "
          << report.departures_expected;
        diagnostics.warning(w.str(), category);
    }
    if (!report.occupancy_ok) {
        std::ostringstream w;
        w << "Occupancy conservation off by " << report.occupancy_relative_error * 100.0
          << "% (binned " << report.occupancy_binned_minutes << " min, expected "
          << report.occupancy_expected_minutes << " min of stay time inside the grid, raw "
          << report.occupancy_raw_minutes << " min)";
        diagnostics.warning(w.str(), category);
    }

    diagnostics.add_conservation(report);
    return report;
}

void ConservationChecker::check_date_ranges(const std::vector<StopRecord>& records,
                                            const AnalysisWindow& window,
                                            Diagnostics& diagnostics) {
    if (records.empty()) {
        diagnostics.warning("No stop records to analyse");
        return;
    }

    Timestamp min_entry = records.front().entry;
    Timestamp max_entry = records.front().entry;
    Timestamp min_exit = records.front().exit;
    Timestamp max_exit = records.front().exit;
    for (const auto& rec : records) {
        min_entry = std::min(min_entry, rec.entry);
        max_entry = std::max(max_entry, rec.entry);
        min_exit = std::min(min_exit, rec.exit);
        max_exit = std::max(max_exit, rec.exit);
    }

    diagnostics.info("min of entry time: " + format_timestamp(min_entry));
    diagnostics.info("max of entry time: " + format_timestamp(max_entry));
    diagnostics.info("min of exit time: " + format_timestamp(min_exit));
    diagnostics.info("max of exit time: " + format_timestamp(max_exit));

    const double early_hours = static_cast<double>((min_entry - window.start).count()) / 3600.0;
    if (early_hours > constants::EARLY_START_ANALYSIS_TOLERANCE_HOURS) {
        std::ostringstream oss;
        oss << "Analysis starts " << early_hours << " hours before first arrival ("
            << format_timestamp(min_entry) << ")";
        diagnostics.warning(oss.str());
    }

    const double late_hours = static_cast<double>((window.end - max_exit).count()) / 3600.0;
    if (late_hours > constants::LATE_END_ANALYSIS_TOLERANCE_HOURS) {
        std::ostringstream oss;
        oss << "Analysis ends " << late_hours << " hours after last departure ("
            << format_timestamp(max_exit) << ")";
        diagnostics.warning(oss.str());
    }
}

} // namespace hillmaker
