#include "hillmaker/processing/bin_accumulator.hpp"
#include "hillmaker/core/time_bins.hpp"
#include "hillmaker/processing/record_classifier.hpp"
#include <numeric>

namespace hillmaker {

const std::vector<double>& FineGridMatrix::series(Measure measure) const {
    switch (measure) {
        case Measure::ARRIVALS: return arrivals;
        case Measure::DEPARTURES: return departures;
        case Measure::OCCUPANCY: return occupancy;
    }
    throw std::invalid_argument("Unknown measure");
}

double FineGridMatrix::total(Measure measure) const {
    const auto& s = series(measure);
    return std::accumulate(s.begin(), s.end(), 0.0);
}

FineGridMatrix& FineGridMatrix::operator+=(const FineGridMatrix& other) {
    if (other.size() != size()) {
        throw NumericInvariantError("Cannot add fine grids of different length");
    }
    for (size_t i = 0; i < size(); ++i) {
        arrivals[i] += other.arrivals[i];
        departures[i] += other.departures[i];
        occupancy[i] += other.occupancy[i];
    }
    return *this;
}

BinScatterAccumulator::BinScatterAccumulator(const AnalysisWindow& window, int bin_minutes,
                                             EdgeBinsMode edge_mode)
    : window_(window)
    , bin_minutes_(bin_minutes)
    , edge_mode_(edge_mode)
    , num_bins_(TimeBinIndexer::num_bins(window, bin_minutes))
    , matrix_(static_cast<size_t>(num_bins_)) {}

void BinScatterAccumulator::add(const StopRecord& record) {
    const RecordRelationship rel = RecordClassifier::classify(record, window_);
    ++counts_[rel];

    if (rel == RecordRelationship::BACKWARDS) {
        return;
    }

    BinnedStop stop = OccupancyIncrementBuilder::bin_record(record, rel, window_,
                                                            bin_minutes_, edge_mode_);
    BoundaryAdjuster::clip(stop, num_bins_);
    scatter(stop, matrix_);
}

void BinScatterAccumulator::add_all(const std::vector<StopRecord>& records) {
    for (const auto& rec : records) {
        add(rec);
    }
}

void BinScatterAccumulator::scatter(const BinnedStop& stop, FineGridMatrix& matrix) {
    const auto n = static_cast<int64_t>(matrix.size());

    for (size_t i = 0; i < stop.increments.size(); ++i) {
        const int64_t bin = stop.entry_bin + static_cast<int64_t>(i);
        if (bin < 0 || bin >= n) {
            throw NumericInvariantError("Increment scattered outside the fine grid");
        }
        matrix.occupancy[static_cast<size_t>(bin)] += stop.increments[i];
    }

    // Counted at the raw bin; an instant in [start, end] always lands on the grid
    if (stop.counts_arrival) {
        if (stop.raw_entry_bin < 0 || stop.raw_entry_bin >= n) {
            throw NumericInvariantError("Arrival bin outside the fine grid");
        }
        matrix.arrivals[static_cast<size_t>(stop.raw_entry_bin)] += 1.0;
    }
    if (stop.counts_departure) {
        if (stop.raw_exit_bin < 0 || stop.raw_exit_bin >= n) {
            throw NumericInvariantError("Departure bin outside the fine grid");
        }
        matrix.departures[static_cast<size_t>(stop.raw_exit_bin)] += 1.0;
    }
}

} // namespace hillmaker
