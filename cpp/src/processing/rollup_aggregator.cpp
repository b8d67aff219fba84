#include "hillmaker/processing/rollup_aggregator.hpp"
#include "hillmaker/core/time_bins.hpp"
#include "hillmaker/core/timestamp.hpp"
#include <map>
#include <utility>

namespace hillmaker {

double RollupRow::value(Measure measure) const {
    switch (measure) {
        case Measure::ARRIVALS: return arrivals;
        case Measure::DEPARTURES: return departures;
        case Measure::OCCUPANCY: return occupancy;
    }
    throw std::invalid_argument("Unknown measure");
}

namespace {

struct RollupGroup {
    double arrivals = 0.0;
    double departures = 0.0;
    double occupancy_sum = 0.0;
    size_t fine_bins = 0;
};

} // namespace

RollupTable RollupAggregator::rollup(const std::string& category,
                                     const FineGridMatrix& matrix,
                                     Timestamp origin,
                                     int highres_bin_minutes,
                                     int report_bin_minutes) {
    if (highres_bin_minutes <= 0 || report_bin_minutes % highres_bin_minutes != 0) {
        throw ValidationError("Report bin size must be a multiple of the high resolution bin size");
    }
    const int ratio = report_bin_minutes / highres_bin_minutes;

    // (midnight, coarse bin of day) orders groups chronologically
    std::map<std::pair<Timestamp, int>, RollupGroup> groups;

    for (size_t i = 0; i < matrix.size(); ++i) {
        const Timestamp t = TimeBinIndexer::bin_start(origin, static_cast<int64_t>(i),
                                                      highres_bin_minutes);
        const Timestamp day = TimeBinIndexer::floor_day(t);
        const int coarse = TimeBinIndexer::bin_of_day(t, highres_bin_minutes) / ratio;

        auto& g = groups[{day, coarse}];
        g.arrivals += matrix.arrivals[i];
        g.departures += matrix.departures[i];
        g.occupancy_sum += matrix.occupancy[i];
        ++g.fine_bins;
    }

    RollupTable table;
    table.category = category;
    table.bin_minutes = report_bin_minutes;
    table.rows.reserve(groups.size());

    for (const auto& [key, g] : groups) {
        RollupRow row;
        row.datetime = key.first + std::chrono::minutes(
            static_cast<int64_t>(key.second) * report_bin_minutes);
        row.arrivals = g.arrivals;
        row.departures = g.departures;
        row.occupancy = g.occupancy_sum / static_cast<double>(g.fine_bins);
        attach_calendar(row, report_bin_minutes);
        table.rows.push_back(std::move(row));
    }

    return table;
}

void RollupAggregator::attach_calendar(RollupRow& row, int bin_minutes) {
    row.day_of_week = TimeBinIndexer::day_of_week(row.datetime);
    row.dow_name = TimeBinIndexer::day_name(row.day_of_week);
    row.bin_of_day = TimeBinIndexer::bin_of_day(row.datetime, bin_minutes);
    row.bin_of_day_str = format_time_of_day(row.datetime);
    row.bin_of_week = TimeBinIndexer::bin_of_week(row.datetime, bin_minutes);
}

} // namespace hillmaker
