#include "hillmaker/statistics/summary_engine.hpp"
#include "hillmaker/processing/record_classifier.hpp"
#include <algorithm>
#include <cctype>

namespace hillmaker {

const SummaryRow* SummaryTable::find(const SummaryKey& key) const {
    auto it = std::lower_bound(rows.begin(), rows.end(), key,
                               [](const SummaryRow& row, const SummaryKey& k) {
                                   return row.key < k;
                               });
    if (it == rows.end() || key < it->key) {
        return nullptr;
    }
    return &*it;
}

std::vector<std::string> SummaryTable::percentile_names() const {
    std::vector<std::string> names;
    names.reserve(percentiles.size());
    for (double p : percentiles) {
        names.push_back(StatisticsEngine::percentile_name(p));
    }
    return names;
}

namespace {

using GroupSamples = std::map<SummaryKey, std::vector<double>>;

MeasureSummaries build_tables(const std::map<Measure, GroupSamples>& samples,
                              bool stationary,
                              const std::vector<double>& percentiles) {
    MeasureSummaries out;
    for (Measure measure : all_measures()) {
        SummaryTable table;
        table.measure = measure;
        table.stationary = stationary;
        table.percentiles = percentiles;

        auto it = samples.find(measure);
        if (it != samples.end()) {
            table.rows.reserve(it->second.size());
            for (const auto& [key, values] : it->second) {
                table.rows.push_back(SummaryRow{key, StatisticsEngine::describe(values, percentiles)});
            }
        }
        out.emplace(measure_name(measure), std::move(table));
    }
    return out;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

MeasureSummaries SummaryEngine::summarize_nonstationary(
    const std::vector<const RollupTable*>& tables,
    const std::vector<double>& percentiles) {
    std::map<Measure, GroupSamples> samples;

    for (const RollupTable* table : tables) {
        for (const auto& row : table->rows) {
            SummaryKey key;
            key.category = table->category;
            key.day_of_week = row.day_of_week;
            key.dow_name = row.dow_name;
            key.bin_of_day = row.bin_of_day;
            key.bin_of_day_str = row.bin_of_day_str;
            for (Measure m : all_measures()) {
                samples[m][key].push_back(row.value(m));
            }
        }
    }
    return build_tables(samples, false, percentiles);
}

MeasureSummaries SummaryEngine::summarize_stationary(
    const std::vector<const RollupTable*>& tables,
    const std::vector<double>& percentiles) {
    std::map<Measure, GroupSamples> samples;

    for (const RollupTable* table : tables) {
        SummaryKey key;
        key.category = table->category;
        for (Measure m : all_measures()) {
            auto& values = samples[m][key];
            for (const auto& row : table->rows) {
                values.push_back(row.value(m));
            }
        }
    }
    return build_tables(samples, true, percentiles);
}

HillsSummaries SummaryEngine::summarize(const std::map<std::string, RollupTable>& bydatetime,
                                        const std::string& cat_field,
                                        bool nonstationary,
                                        bool stationary,
                                        const std::vector<double>& percentiles) {
    std::vector<const RollupTable*> categories;
    const RollupTable* total = nullptr;
    for (const auto& [key, table] : bydatetime) {
        if (key == constants::TOTAL_KEY) {
            total = &table;
        } else {
            categories.push_back(&table);
        }
    }

    HillsSummaries out;
    if (nonstationary) {
        if (!cat_field.empty() && !categories.empty()) {
            out.nonstationary[cat_field + "_dow_binofday"] =
                summarize_nonstationary(categories, percentiles);
        }
        if (total) {
            out.nonstationary["dow_binofday"] = summarize_nonstationary({total}, percentiles);
        }
    }
    if (stationary) {
        if (!cat_field.empty() && !categories.empty()) {
            out.stationary[cat_field] = summarize_stationary(categories, percentiles);
        }
        if (total) {
            out.stationary[""] = summarize_stationary({total}, percentiles);
        }
    }
    return out;
}

double SummaryEngine::los_unit_seconds(const std::string& units) {
    const std::string u = lowercase(units);
    if (u == "d" || u == "day" || u == "days") return 86400.0;
    if (u == "h" || u == "hr" || u == "hrs" || u == "hour" || u == "hours") return 3600.0;
    if (u == "m" || u == "min" || u == "mins" || u == "minute" || u == "minutes") return 60.0;
    if (u == "s" || u == "sec" || u == "secs" || u == "second" || u == "seconds") return 1.0;
    throw ValidationError("Unknown length of stay units: " + units);
}

LosSummary SummaryEngine::summarize_los(
    const std::map<std::string, std::vector<StopRecord>>& records_by_category,
    const AnalysisWindow& window,
    const std::string& units,
    const std::vector<double>& percentiles,
    bool with_total) {
    const double unit_seconds = los_unit_seconds(units);

    LosSummary los;
    los.units = units;
    los.percentiles = percentiles;

    std::vector<double> pooled;
    for (const auto& [category, records] : records_by_category) {
        std::vector<double> values;
        values.reserve(records.size());
        for (const auto& rec : records) {
            if (contributes_occupancy(RecordClassifier::classify(rec, window))) {
                values.push_back(static_cast<double>(rec.duration_seconds()) / unit_seconds);
            }
        }
        pooled.insert(pooled.end(), values.begin(), values.end());
        los.by_category[category] = StatisticsEngine::describe(values, percentiles);
    }

    if (with_total) {
        los.by_category[constants::TOTAL_KEY] = StatisticsEngine::describe(pooled, percentiles);
    }
    return los;
}

} // namespace hillmaker
