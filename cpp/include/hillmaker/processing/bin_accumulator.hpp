#pragma once

/**
 * @file bin_accumulator.hpp
 * @brief Dense per-category arrival, departure and occupancy arrays
 */

#include "hillmaker/core/types.hpp"
#include "hillmaker/processing/occupancy_increments.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace hillmaker {

/**
 * @brief Three parallel arrays over the fine grid of one category
 */
struct FineGridMatrix {
    std::vector<double> arrivals;
    std::vector<double> departures;
    std::vector<double> occupancy;

    FineGridMatrix() = default;
    explicit FineGridMatrix(size_t num_bins)
        : arrivals(num_bins, 0.0), departures(num_bins, 0.0), occupancy(num_bins, 0.0) {}

    size_t size() const { return occupancy.size(); }

    const std::vector<double>& series(Measure measure) const;

    /// Sum of one measure over all bins
    double total(Measure measure) const;

    /// Element-wise sum; both matrices must have the same length
    FineGridMatrix& operator+=(const FineGridMatrix& other);
};

/**
 * @brief Single-pass scatter-add of stop records onto a fine grid
 *
 * Each instance owns its arrays; nothing is shared between instances, so
 * one accumulator per category can run on its own thread.
 */
class BinScatterAccumulator {
public:
    BinScatterAccumulator(const AnalysisWindow& window, int bin_minutes, EdgeBinsMode edge_mode);

    /// Classify, bin, clip and scatter one record
    void add(const StopRecord& record);

    void add_all(const std::vector<StopRecord>& records);

    int64_t num_bins() const { return num_bins_; }
    const FineGridMatrix& matrix() const { return matrix_; }
    const RelationshipCounts& relationship_counts() const { return counts_; }

    /// Move the accumulated matrix out
    FineGridMatrix release() { return std::move(matrix_); }

    /// Add a binned (already clipped) stop into the arrays
    static void scatter(const BinnedStop& stop, FineGridMatrix& matrix);

private:
    AnalysisWindow window_;
    int bin_minutes_;
    EdgeBinsMode edge_mode_;
    int64_t num_bins_;
    FineGridMatrix matrix_;
    RelationshipCounts counts_;
};

/// Accumulation result of one category
struct CategoryAccumulation {
    std::string category;
    FineGridMatrix matrix;
    RelationshipCounts counts;
};

} // namespace hillmaker
