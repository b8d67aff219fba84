#include "hillmaker/pipeline/hills.hpp"
#include "hillmaker/core/time_bins.hpp"
#include "hillmaker/data/csv_writer.hpp"
#include "hillmaker/data/stop_reader.hpp"
#include "hillmaker/processing/bin_accumulator.hpp"
#include "hillmaker/processing/conservation_checker.hpp"
#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>

namespace hillmaker {

namespace {

using RecordsByCategory = std::map<std::string, std::vector<StopRecord>>;

/// Output of one category's worker task
struct CategoryRun {
    CategoryAccumulation accumulation;
    Diagnostics diagnostics;
};

double elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - since).count();
}

/// Split records by category; uncategorised data becomes a single TOTAL_KEY partition
RecordsByCategory partition_records(const std::vector<StopRecord>& records,
                                    const Scenario& scenario,
                                    bool& categorized,
                                    Diagnostics& diagnostics) {
    categorized = false;
    for (const auto& rec : records) {
        if (rec.category) {
            categorized = true;
            break;
        }
    }

    RecordsByCategory parts;
    size_t excluded = 0;
    for (const auto& rec : records) {
        std::string key = categorized ? rec.category.value_or(constants::UNCATEGORIZED_KEY)
                                      : std::string(constants::TOTAL_KEY);
        if (categorized && scenario.is_excluded(key)) {
            ++excluded;
            continue;
        }
        if (categorized && scenario.options().totals && key == constants::TOTAL_KEY) {
            throw ValidationError("Category value 'total' collides with the totals key");
        }
        parts[key].push_back(rec);
    }

    if (excluded > 0) {
        diagnostics.info("Excluded " + std::to_string(excluded) + " records in cats_to_exclude");
    }
    return parts;
}

CategoryRun run_category(const std::string& category,
                         const std::vector<StopRecord>& records,
                         const Scenario& scenario,
                         const CancellationToken* cancel) {
    if (cancel) {
        cancel->throw_if_cancelled("category " + category);
    }

    const auto t0 = std::chrono::steady_clock::now();
    const AnalysisWindow window = scenario.window();
    const int bin_minutes = scenario.highres_bin_minutes();
    const EdgeBinsMode edge_mode = scenario.options().edge_bins;

    CategoryRun run;
    BinScatterAccumulator acc(window, bin_minutes, edge_mode);
    acc.add_all(records);

    run.accumulation.category = category;
    run.accumulation.counts = acc.relationship_counts();
    run.accumulation.matrix = acc.release();

    run.diagnostics.add_relationship_counts(category, run.accumulation.counts);
    run.diagnostics.info("Records by relationship: " +
                         format_relationship_counts(run.accumulation.counts), category);

    const auto backwards = run.accumulation.counts.find(RecordRelationship::BACKWARDS);
    if (backwards != run.accumulation.counts.end() && backwards->second > 0) {
        run.diagnostics.warning(std::to_string(backwards->second) +
                                " records with exit before entry ignored", category);
    }

    ConservationChecker::check(category, run.accumulation.matrix, records, window,
                               bin_minutes, edge_mode, run.diagnostics);

    run.diagnostics.debug("Accumulated " + std::to_string(records.size()) + " records in " +
                          std::to_string(elapsed_ms(t0)) + " ms", category);
    return run;
}

std::vector<CategoryRun> run_categories(const RecordsByCategory& parts,
                                        const Scenario& scenario,
                                        const CancellationToken* cancel) {
    std::vector<CategoryRun> runs;
    runs.reserve(parts.size());

    if (!scenario.options().parallel_categories || parts.size() < 2) {
        for (const auto& [category, records] : parts) {
            runs.push_back(run_category(category, records, scenario, cancel));
        }
        return runs;
    }

    std::vector<std::future<CategoryRun>> futures;
    futures.reserve(parts.size());
    for (const auto& [category, records] : parts) {
        futures.push_back(std::async(std::launch::async,
            [&scenario, cancel, &category = category, &records = records]() {
                return run_category(category, records, scenario, cancel);
            }));
    }

    // Collect in sorted category order
    for (auto& f : futures) {
        runs.push_back(f.get());
    }
    return runs;
}

HillsResult run_hills(const std::vector<StopRecord>& records,
                      const Scenario& scenario,
                      const CancellationToken* cancel,
                      Diagnostics diagnostics) {
    const auto t_start = std::chrono::steady_clock::now();
    const ScenarioOptions& opts = scenario.options();
    const AnalysisWindow window = scenario.window();

    HillsResult result;
    result.options = opts;

    bool categorized = false;
    const RecordsByCategory parts = partition_records(records, scenario, categorized, diagnostics);

    result.cat_field = scenario.cat_field_name();
    if (categorized && result.cat_field.empty()) {
        result.cat_field = "category";
    }
    if (!categorized) {
        result.cat_field.clear();
    }

    std::vector<StopRecord> kept;
    for (const auto& [category, recs] : parts) {
        kept.insert(kept.end(), recs.begin(), recs.end());
    }
    ConservationChecker::check_date_ranges(kept, window, diagnostics);

    // Per-category accumulation
    auto t0 = std::chrono::steady_clock::now();
    std::vector<CategoryRun> runs = run_categories(parts, scenario, cancel);
    diagnostics.info("Accumulated " + std::to_string(runs.size()) + " categories in " +
                     std::to_string(elapsed_ms(t0)) + " ms");

    if (cancel) {
        cancel->throw_if_cancelled("reduction");
    }

    // Reduction in sorted category order
    const int64_t num_bins = TimeBinIndexer::num_bins(window, scenario.highres_bin_minutes());
    FineGridMatrix total(static_cast<size_t>(num_bins));
    std::map<std::string, const FineGridMatrix*> matrices;
    for (const auto& run : runs) {
        diagnostics.merge(run.diagnostics);
        total += run.accumulation.matrix;
        matrices[run.accumulation.category] = &run.accumulation.matrix;
    }
    if ((categorized && opts.totals) || matrices.empty()) {
        matrices[constants::TOTAL_KEY] = &total;
    }

    // Rollup
    t0 = std::chrono::steady_clock::now();
    for (const auto& [category, matrix] : matrices) {
        result.bydatetime[category] = RollupAggregator::rollup(
            category, *matrix, window.start, scenario.highres_bin_minutes(),
            scenario.report_bin_minutes());
        if (opts.keep_highres_bydatetime) {
            result.bydatetime_highres[category] = RollupAggregator::highres(
                category, *matrix, window.start, scenario.highres_bin_minutes());
        }
    }
    diagnostics.info("Rolled up " + std::to_string(matrices.size()) + " tables in " +
                     std::to_string(elapsed_ms(t0)) + " ms");

    // Summaries
    if (cancel) {
        cancel->throw_if_cancelled("summaries");
    }
    t0 = std::chrono::steady_clock::now();
    result.summaries = SummaryEngine::summarize(result.bydatetime, result.cat_field,
                                                opts.nonstationary_stats, opts.stationary_stats,
                                                opts.percentiles);
    result.los = SummaryEngine::summarize_los(parts, window, opts.los_units, opts.percentiles,
                                              categorized && opts.totals);
    diagnostics.info("Computed summaries in " + std::to_string(elapsed_ms(t0)) + " ms");

    diagnostics.info("Run finished in " + std::to_string(elapsed_ms(t_start)) + " ms");
    result.diagnostics = std::move(diagnostics);
    return result;
}

void emit_diagnostics(const HillsResult& result) {
    if (result.options.verbosity < 0) {
        return;
    }
    result.diagnostics.emit(std::cerr,
                            Diagnostics::level_for_verbosity(result.options.verbosity));
}

std::string export_file(const ScenarioOptions& opts, const std::string& stem) {
    return (std::filesystem::path(opts.csv_export_path) /
            (opts.scenario_name + "_" + stem + ".csv")).string();
}

void export_bydatetime(const std::map<std::string, RollupTable>& tables,
                       const ScenarioOptions& opts,
                       const std::string& cat_field,
                       const std::string& prefix) {
    std::vector<const RollupTable*> categories;
    const RollupTable* total = nullptr;
    for (const auto& [key, table] : tables) {
        if (key == constants::TOTAL_KEY) {
            total = &table;
        } else {
            categories.push_back(&table);
        }
    }
    if (!cat_field.empty() && !categories.empty()) {
        CsvWriter::write_bydatetime_file(export_file(opts, prefix + "_" + cat_field + "_datetime"),
                                         categories, true);
    }
    if (total) {
        CsvWriter::write_bydatetime_file(export_file(opts, prefix + "_datetime"), {total}, false);
    }
}

void export_summaries(const std::map<std::string, MeasureSummaries>& groups,
                      const ScenarioOptions& opts,
                      const std::string& cat_field) {
    for (const auto& [key, measures] : groups) {
        const bool by_category = !cat_field.empty() &&
                                 (key == cat_field || key == cat_field + "_dow_binofday");
        for (const auto& [measure, table] : measures) {
            const std::string stem = key.empty() ? measure : measure + "_" + key;
            CsvWriter::write_summary_file(export_file(opts, stem), table, by_category);
        }
    }
}

} // namespace

HillsResult compute_hills(const std::vector<StopRecord>& records,
                          const ScenarioOptions& options,
                          const CancellationToken* cancel) {
    const Scenario scenario(options);
    HillsResult result = run_hills(records, scenario, cancel, Diagnostics());
    emit_diagnostics(result);
    return result;
}

HillsResult make_hills(const DataFrame& stops,
                       const ScenarioOptions& options,
                       const CancellationToken* cancel) {
    const Scenario scenario(options);
    const ScenarioOptions& opts = scenario.options();

    Diagnostics diagnostics;
    StopRecordFields fields{opts.in_field, opts.out_field, opts.cat_field, opts.occ_weight_field};
    const std::vector<StopRecord> records = StopRecordReader::read(stops, fields, diagnostics);

    HillsResult result = run_hills(records, scenario, cancel, std::move(diagnostics));
    export_hills_csv(result);
    emit_diagnostics(result);
    return result;
}

void export_hills_csv(const HillsResult& result) {
    const ScenarioOptions& opts = result.options;
    if (!opts.export_bydatetime_csv && !opts.export_summaries_csv) {
        return;
    }
    std::filesystem::create_directories(opts.csv_export_path);

    if (opts.export_bydatetime_csv) {
        export_bydatetime(result.bydatetime, opts, result.cat_field, "bydatetime");
        if (!result.bydatetime_highres.empty()) {
            export_bydatetime(result.bydatetime_highres, opts, result.cat_field,
                              "bydatetime_highres");
        }
    }
    if (opts.export_summaries_csv) {
        export_summaries(result.summaries.nonstationary, opts, result.cat_field);
        export_summaries(result.summaries.stationary, opts, result.cat_field);
        if (!result.los.by_category.empty()) {
            const std::string stem = result.cat_field.empty() ? "los" : "los_" + result.cat_field;
            CsvWriter::write_los_file(export_file(opts, stem), result.los);
        }
    }
}

} // namespace hillmaker
