#pragma once

/**
 * @file occupancy_increments.hpp
 * @brief Per-record occupancy increment vectors and window clipping
 *
 * A stop record touching bins [entry_bin, exit_bin] of the fine grid
 * contributes a fractional amount to its two edge bins and its full weight
 * to every bin in between. Bin indices are computed against the window
 * origin without clamping; BoundaryAdjuster cuts the vector back to the
 * grid for records censored by the window.
 */

#include "hillmaker/core/types.hpp"
#include <cstdint>
#include <vector>

namespace hillmaker {

/// One record placed on the fine grid
struct BinnedStop {
    RecordRelationship relationship;

    int64_t raw_entry_bin;      ///< Unclipped entry bin
    int64_t raw_exit_bin;       ///< Unclipped exit bin
    int64_t entry_bin;          ///< First bin of `increments` (clipped)
    int64_t exit_bin;           ///< Last bin of `increments` (clipped)

    double entry_fraction;      ///< Occupied share of the entry bin
    double exit_fraction;       ///< Occupied share of the exit bin

    bool counts_arrival;        ///< Entry instant lies in [start, end]
    bool counts_departure;      ///< Exit instant lies in [start, end]

    std::vector<double> increments;  ///< Occupancy added to bins entry_bin..exit_bin

    BinnedStop()
        : relationship(RecordRelationship::NONE)
        , raw_entry_bin(0), raw_exit_bin(0), entry_bin(0), exit_bin(0)
        , entry_fraction(0.0), exit_fraction(0.0)
        , counts_arrival(false), counts_departure(false) {}
};

class OccupancyIncrementBuilder {
public:
    OccupancyIncrementBuilder() = delete;  // Static class, no instances

    /**
     * @brief (min(exit, right edge of entry_bin) - entry) / bin width
     * @throws NumericInvariantError if the result leaves [0, 1]
     */
    static double entry_fraction(Timestamp entry, Timestamp exit, int64_t entry_bin,
                                 Timestamp origin, int bin_minutes);

    /**
     * @brief (exit - max(entry, left edge of exit_bin)) / bin width
     * @throws NumericInvariantError if the result leaves [0, 1]
     */
    static double exit_fraction(Timestamp entry, Timestamp exit, int64_t exit_bin,
                                Timestamp origin, int bin_minutes);

    /**
     * @brief Build the increment vector for bins entry_bin..exit_bin
     *
     * n == 1: [ef*w]; n == 2: [ef*w, xf*w]; n > 2: [ef*w, w, ..., w, xf*w]
     */
    static std::vector<double> build(int64_t entry_bin, int64_t exit_bin,
                                     double entry_frac, double exit_frac, double weight);

    /**
     * @brief Bin a classified record (raw bins, fractions, unclipped increments)
     *
     * Only INNER, LEFT, RIGHT and OUTER records get increments. NONE records
     * keep their raw bins and arrival/departure flags with an empty vector;
     * BACKWARDS records are returned empty.
     */
    static BinnedStop bin_record(const StopRecord& record, RecordRelationship relationship,
                                 const AnalysisWindow& window, int bin_minutes,
                                 EdgeBinsMode edge_mode);
};

class BoundaryAdjuster {
public:
    BoundaryAdjuster() = delete;  // Static class, no instances

    /**
     * @brief Clip a LEFT, RIGHT or OUTER record to bins [0, num_bins - 1]
     *
     * LEFT drops the first -entry_bin increments and re-bases entry_bin to 0,
     * RIGHT drops the last exit_bin - (num_bins - 1) increments and re-bases
     * exit_bin to num_bins - 1, OUTER does both. Other relationships are
     * left untouched.
     *
     * @throws NumericInvariantError if the clipped length does not match the bin range
     */
    static void clip(BinnedStop& stop, int64_t num_bins);
};

} // namespace hillmaker
