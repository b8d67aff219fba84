#include "hillmaker/processing/rollup_aggregator.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace hillmaker;
using hillmaker::testing::day_window;
using hillmaker::testing::stop;
using hillmaker::testing::ts;

namespace {

FineGridMatrix accumulate(const std::vector<StopRecord>& records, const AnalysisWindow& window,
                          int bin_minutes) {
    BinScatterAccumulator acc(window, bin_minutes, EdgeBinsMode::FRACTIONAL);
    acc.add_all(records);
    return acc.release();
}

} // namespace

TEST(RollupAggregator, SumsFlowsAndAveragesOccupancy) {
    const auto window = day_window("2024-01-01");
    const auto m = accumulate({stop("2024-01-01 07:20", "2024-01-01 08:50")}, window, 30);

    const RollupTable table = RollupAggregator::rollup("A", m, window.start, 30, 60);
    EXPECT_EQ(table.category, "A");
    EXPECT_EQ(table.bin_minutes, 60);
    ASSERT_EQ(table.size(), 24u);

    const RollupRow& h7 = table.rows[7];
    EXPECT_EQ(h7.datetime, ts("2024-01-01 07:00"));
    EXPECT_DOUBLE_EQ(h7.arrivals, 1.0);
    EXPECT_DOUBLE_EQ(h7.departures, 0.0);
    EXPECT_DOUBLE_EQ(h7.occupancy, (10.0 / 30.0 + 1.0) / 2.0);

    const RollupRow& h8 = table.rows[8];
    EXPECT_DOUBLE_EQ(h8.arrivals, 0.0);
    EXPECT_DOUBLE_EQ(h8.departures, 1.0);
    EXPECT_DOUBLE_EQ(h8.occupancy, (1.0 + 20.0 / 30.0) / 2.0);

    EXPECT_DOUBLE_EQ(table.rows[6].occupancy, 0.0);
    EXPECT_DOUBLE_EQ(table.rows[9].occupancy, 0.0);
}

TEST(RollupAggregator, CalendarColumns) {
    const AnalysisWindow window(ts("2024-01-01"), ts("2024-01-02 23:59:59"));
    const FineGridMatrix m(static_cast<size_t>(2 * 24 * 4));

    const RollupTable table = RollupAggregator::rollup("A", m, window.start, 15, 60);
    ASSERT_EQ(table.size(), 48u);

    const RollupRow& mon = table.rows[7];
    EXPECT_EQ(mon.day_of_week, 0);
    EXPECT_EQ(mon.dow_name, "Mon");
    EXPECT_EQ(mon.bin_of_day, 7);
    EXPECT_EQ(mon.bin_of_day_str, "07:00");
    EXPECT_EQ(mon.bin_of_week, 7);

    const RollupRow& tue = table.rows[24 + 13];
    EXPECT_EQ(tue.datetime, ts("2024-01-02 13:00"));
    EXPECT_EQ(tue.day_of_week, 1);
    EXPECT_EQ(tue.dow_name, "Tue");
    EXPECT_EQ(tue.bin_of_day, 13);
    EXPECT_EQ(tue.bin_of_day_str, "13:00");
    EXPECT_EQ(tue.bin_of_week, 24 + 13);
}

TEST(RollupAggregator, RowsInChronologicalOrder) {
    const AnalysisWindow window(ts("2024-01-01"), ts("2024-01-03 23:59:59"));
    const FineGridMatrix m(static_cast<size_t>(3 * 48));
    const RollupTable table = RollupAggregator::rollup("A", m, window.start, 30, 120);
    ASSERT_EQ(table.size(), 36u);
    for (size_t i = 1; i < table.size(); ++i) {
        EXPECT_LT(table.rows[i - 1].datetime, table.rows[i].datetime);
    }
}

TEST(RollupAggregator, HighresKeepsFineBins) {
    const auto window = day_window("2024-01-01");
    const auto m = accumulate({stop("2024-01-01 07:05", "2024-01-01 07:22")}, window, 30);
    const RollupTable table = RollupAggregator::highres("A", m, window.start, 30);
    ASSERT_EQ(table.size(), 48u);
    EXPECT_EQ(table.bin_minutes, 30);
    EXPECT_DOUBLE_EQ(table.rows[14].occupancy, 17.0 / 30.0);
    EXPECT_EQ(table.rows[14].bin_of_day_str, "07:00");
}

TEST(RollupAggregator, PreservesFlowTotals) {
    const auto window = day_window("2024-01-01");
    const std::vector<StopRecord> records = {
        stop("2024-01-01 01:03", "2024-01-01 05:47"),
        stop("2023-12-31 20:00", "2024-01-01 02:11"),
        stop("2024-01-01 23:00", "2024-01-02 04:00"),
    };
    const auto m = accumulate(records, window, 5);
    const RollupTable table = RollupAggregator::rollup("A", m, window.start, 5, 60);

    double arrivals = 0.0;
    double departures = 0.0;
    double occupancy_minutes = 0.0;
    for (const auto& row : table.rows) {
        arrivals += row.arrivals;
        departures += row.departures;
        occupancy_minutes += row.occupancy * 60.0;
    }
    EXPECT_DOUBLE_EQ(arrivals, m.total(Measure::ARRIVALS));
    EXPECT_DOUBLE_EQ(departures, m.total(Measure::DEPARTURES));
    EXPECT_NEAR(occupancy_minutes, m.total(Measure::OCCUPANCY) * 5.0, 1e-9);
}

TEST(RollupAggregator, RejectsIncompatibleWidths) {
    const FineGridMatrix m(48);
    EXPECT_THROW(RollupAggregator::rollup("A", m, ts("2024-01-01"), 40, 60), ValidationError);
}
