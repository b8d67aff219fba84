#include "hillmaker/processing/occupancy_increments.hpp"
#include "hillmaker/core/time_bins.hpp"
#include <algorithm>
#include <sstream>

namespace hillmaker {

namespace {

// Accept fractions within FRACTION_EPSILON of [0, 1] and snap them inside
double checked_fraction(double frac, const char* which) {
    if (frac < -constants::FRACTION_EPSILON || frac > 1.0 + constants::FRACTION_EPSILON) {
        std::ostringstream oss;
        oss << which << " bin fraction " << frac << " outside [0, 1]";
        throw NumericInvariantError(oss.str());
    }
    return std::clamp(frac, 0.0, 1.0);
}

} // namespace

double OccupancyIncrementBuilder::entry_fraction(Timestamp entry, Timestamp exit,
                                                 int64_t entry_bin, Timestamp origin,
                                                 int bin_minutes) {
    const Timestamp right_edge = TimeBinIndexer::bin_start(origin, entry_bin + 1, bin_minutes);
    const double width = static_cast<double>(bin_minutes) * 60.0;
    const double occupied = static_cast<double>((std::min(exit, right_edge) - entry).count());
    return checked_fraction(occupied / width, "Entry");
}

double OccupancyIncrementBuilder::exit_fraction(Timestamp entry, Timestamp exit,
                                                int64_t exit_bin, Timestamp origin,
                                                int bin_minutes) {
    const Timestamp left_edge = TimeBinIndexer::bin_start(origin, exit_bin, bin_minutes);
    const double width = static_cast<double>(bin_minutes) * 60.0;
    const double occupied = static_cast<double>((exit - std::max(entry, left_edge)).count());
    return checked_fraction(occupied / width, "Exit");
}

std::vector<double> OccupancyIncrementBuilder::build(int64_t entry_bin, int64_t exit_bin,
                                                     double entry_frac, double exit_frac,
                                                     double weight) {
    const int64_t n = exit_bin - entry_bin + 1;
    if (n <= 0) {
        throw NumericInvariantError("Exit bin precedes entry bin");
    }

    std::vector<double> inc(static_cast<size_t>(n), weight);
    inc.front() = entry_frac * weight;
    if (n > 1) {
        inc.back() = exit_frac * weight;
    }
    return inc;
}

BinnedStop OccupancyIncrementBuilder::bin_record(const StopRecord& record,
                                                 RecordRelationship relationship,
                                                 const AnalysisWindow& window,
                                                 int bin_minutes, EdgeBinsMode edge_mode) {
    BinnedStop stop;
    stop.relationship = relationship;

    if (relationship == RecordRelationship::BACKWARDS) {
        return stop;
    }

    stop.raw_entry_bin = TimeBinIndexer::bin_index(record.entry, window.start, bin_minutes);
    stop.raw_exit_bin = TimeBinIndexer::bin_index(record.exit, window.start, bin_minutes);
    stop.entry_bin = stop.raw_entry_bin;
    stop.exit_bin = stop.raw_exit_bin;

    // A NONE record can still arrive exactly at window.end
    stop.counts_arrival = window.contains_closed(record.entry);
    stop.counts_departure = window.contains_closed(record.exit);

    if (!contributes_occupancy(relationship)) {
        return stop;
    }

    if (edge_mode == EdgeBinsMode::FRACTIONAL) {
        stop.entry_fraction = entry_fraction(record.entry, record.exit, stop.raw_entry_bin,
                                             window.start, bin_minutes);
        stop.exit_fraction = exit_fraction(record.entry, record.exit, stop.raw_exit_bin,
                                           window.start, bin_minutes);
    } else {
        stop.entry_fraction = 1.0;
        stop.exit_fraction = 1.0;
    }

    stop.increments = build(stop.raw_entry_bin, stop.raw_exit_bin,
                            stop.entry_fraction, stop.exit_fraction, record.weight);
    return stop;
}

void BoundaryAdjuster::clip(BinnedStop& stop, int64_t num_bins) {
    const bool clip_left = stop.relationship == RecordRelationship::LEFT ||
                           stop.relationship == RecordRelationship::OUTER;
    const bool clip_right = stop.relationship == RecordRelationship::RIGHT ||
                            stop.relationship == RecordRelationship::OUTER;
    if (!clip_left && !clip_right) {
        return;
    }

    if (clip_left) {
        const int64_t drop = std::max<int64_t>(0, -stop.entry_bin);
        if (drop > static_cast<int64_t>(stop.increments.size())) {
            throw NumericInvariantError("Left clip longer than increment vector");
        }
        stop.increments.erase(stop.increments.begin(), stop.increments.begin() + drop);
        stop.entry_bin = 0;
    }

    if (clip_right) {
        const int64_t drop = std::max<int64_t>(0, stop.exit_bin - (num_bins - 1));
        if (drop > static_cast<int64_t>(stop.increments.size())) {
            throw NumericInvariantError("Right clip longer than increment vector");
        }
        stop.increments.resize(stop.increments.size() - static_cast<size_t>(drop));
        stop.exit_bin = std::min(stop.exit_bin, num_bins - 1);
    }

    const int64_t expected = stop.exit_bin - stop.entry_bin + 1;
    if (expected != static_cast<int64_t>(stop.increments.size())) {
        std::ostringstream oss;
        oss << "Clipped increment length " << stop.increments.size()
            << " does not match bin range [" << stop.entry_bin << ", " << stop.exit_bin << "]";
        throw NumericInvariantError(oss.str());
    }
}

} // namespace hillmaker
