#pragma once

/**
 * @file time_bins.hpp
 * @brief Bin index arithmetic relative to an analysis window
 *
 * Pure functions, no state. Bins are closed on the left edge: a timestamp
 * that falls exactly on a boundary belongs to the bin starting there.
 * Weekday numbering uses Monday = 0.
 */

#include "hillmaker/core/types.hpp"
#include <cstdint>

namespace hillmaker {

class TimeBinIndexer {
public:
    TimeBinIndexer() = delete;  // Static class, no instances

    /// floor((t - origin) / bin width). Not clamped, may be negative.
    static int64_t bin_index(Timestamp t, Timestamp origin, int bin_minutes);

    /// Number of bins covering [window.start, window.end]
    static int64_t num_bins(const AnalysisWindow& window, int bin_minutes);

    /// Left edge of bin `bin` on the grid anchored at `origin`
    static Timestamp bin_start(Timestamp origin, int64_t bin, int bin_minutes);

    /// Minutes since midnight divided by bin width
    static int bin_of_day(Timestamp t, int bin_minutes);

    /// Minutes since Monday midnight divided by bin width
    static int bin_of_week(Timestamp t, int bin_minutes);

    /// 0 = Monday ... 6 = Sunday
    static int day_of_week(Timestamp t);

    /// Three-letter day name, "Mon" ... "Sun"
    static const char* day_name(int day_of_week);

    /// Midnight at the start of t's day
    static Timestamp floor_day(Timestamp t);

    /// Floor division that rounds toward negative infinity
    static int64_t floor_div(int64_t a, int64_t b) {
        int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) {
            --q;
        }
        return q;
    }
};

} // namespace hillmaker
