#pragma once

/**
 * @file conservation_checker.hpp
 * @brief Cross-checks of binned totals against totals computed from raw records
 *
 * All checks are soft: a failed check is a WARNING in the Diagnostics,
 * never an exception.
 */

#include "hillmaker/core/diagnostics.hpp"
#include "hillmaker/core/types.hpp"
#include "hillmaker/processing/bin_accumulator.hpp"
#include <string>
#include <vector>

namespace hillmaker {

class ConservationChecker {
public:
    ConservationChecker() = delete;  // Static class, no instances

    /**
     * @brief Check one category's fine grid against its raw records
     *
     * Arrival and departure sums must equal the number of non-backwards records whose
     * entry (exit) instant lies in [start, end]. In FRACTIONAL mode the
     * occupancy sum times the bin width must be within OCC_TOLERANCE of the
     * weighted stay time inside the grid; WHOLE_BIN mode overstates edge bins
     * by construction and skips that comparison.
     *
     * @return Report, also stored in `diagnostics`
     */
    static ConservationReport check(const std::string& category,
                                    const FineGridMatrix& matrix,
                                    const std::vector<StopRecord>& records,
                                    const AnalysisWindow& window,
                                    int bin_minutes,
                                    EdgeBinsMode edge_mode,
                                    Diagnostics& diagnostics);

    /**
     * @brief Warn when the window reaches far beyond the data
     *
     * Warns when the window starts more than EARLY_START_ANALYSIS_TOLERANCE_HOURS
     * before the first arrival or ends more than LATE_END_ANALYSIS_TOLERANCE_HOURS
     * after the last departure. Logs the timestamp ranges at INFO level.
     */
    static void check_date_ranges(const std::vector<StopRecord>& records,
                                  const AnalysisWindow& window,
                                  Diagnostics& diagnostics);
};

} // namespace hillmaker
