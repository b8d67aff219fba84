#pragma once

/**
 * @file hills.hpp
 * @brief Pipeline entry points: stop records in, occupancy tables and statistics out
 *
 * Per category: classify, bin, clip and scatter every record onto the fine
 * grid, check conservation, then roll up to the report grid. Categories are
 * independent until the total matrix is reduced, so they may run on worker
 * tasks. Summaries and length-of-stay statistics are computed last.
 */

#include "hillmaker/core/diagnostics.hpp"
#include "hillmaker/core/scenario.hpp"
#include "hillmaker/core/types.hpp"
#include "hillmaker/data/dataframe.hpp"
#include "hillmaker/processing/rollup_aggregator.hpp"
#include "hillmaker/statistics/summary_engine.hpp"
#include <atomic>
#include <map>
#include <string>
#include <vector>

namespace hillmaker {

/// Coarse-grained abort flag, checked before each category's work
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

    /// @throws OperationCancelled if cancel() was called
    void throw_if_cancelled(const std::string& where) const {
        if (is_cancelled()) {
            throw OperationCancelled("Run cancelled before " + where);
        }
    }

private:
    std::atomic<bool> cancelled_;
};

/// Everything a run produces
struct HillsResult {
    ScenarioOptions options;                                ///< Normalised options of the run
    std::string cat_field;                                  ///< Category grouping name ("" if none)
    std::map<std::string, RollupTable> bydatetime;          ///< Report grid, by category and TOTAL_KEY
    std::map<std::string, RollupTable> bydatetime_highres;  ///< Fine grid (keep_highres_bydatetime)
    HillsSummaries summaries;
    LosSummary los;
    Diagnostics diagnostics;
};

/**
 * @brief Run the engine over in-memory stop records
 *
 * @param records Stop records of every category
 * @param options Run options, validated here
 * @param cancel Optional abort flag
 * @throws ValidationError on invalid options or a category named TOTAL_KEY
 * @throws OperationCancelled if `cancel` is triggered
 */
HillsResult compute_hills(const std::vector<StopRecord>& records,
                          const ScenarioOptions& options,
                          const CancellationToken* cancel = nullptr);

/**
 * @brief Read stop records from a table, run the engine and export CSV files
 *
 * @throws ValidationError if a referenced column is absent
 * @throws std::runtime_error if an export file cannot be written
 */
HillsResult make_hills(const DataFrame& stops,
                       const ScenarioOptions& options,
                       const CancellationToken* cancel = nullptr);

/// Write the CSV files requested by the result's options
void export_hills_csv(const HillsResult& result);

} // namespace hillmaker
