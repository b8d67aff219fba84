#include "hillmaker/statistics/summary_engine.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace hillmaker;
using hillmaker::testing::stop;
using hillmaker::testing::ts;

namespace {

RollupRow make_row(const std::string& when, double arrivals, double occupancy) {
    RollupRow row;
    row.datetime = ts(when);
    row.arrivals = arrivals;
    row.departures = arrivals;
    row.occupancy = occupancy;
    RollupAggregator::attach_calendar(row, 60);
    return row;
}

// Two Mondays and one Tuesday, 07:00
RollupTable make_table(const std::string& category, double scale) {
    RollupTable table;
    table.category = category;
    table.bin_minutes = 60;
    table.rows.push_back(make_row("2024-01-01 07:00", 1.0 * scale, 1.0 * scale));
    table.rows.push_back(make_row("2024-01-02 07:00", 2.0 * scale, 5.0 * scale));
    table.rows.push_back(make_row("2024-01-08 07:00", 3.0 * scale, 3.0 * scale));
    return table;
}

} // namespace

TEST(SummaryEngine, NonstationaryGroupsByDayAndBin) {
    const RollupTable a = make_table("A", 1.0);
    const MeasureSummaries out = SummaryEngine::summarize_nonstationary({&a}, {0.5});

    ASSERT_EQ(out.size(), 3u);
    const SummaryTable& occ = out.at("occupancy");
    EXPECT_FALSE(occ.stationary);
    ASSERT_EQ(occ.rows.size(), 2u);

    SummaryKey monday;
    monday.category = "A";
    monday.day_of_week = 0;
    monday.bin_of_day = 7;
    const SummaryRow* row = occ.find(monday);
    ASSERT_NE(row, nullptr);
    EXPECT_EQ(row->key.dow_name, "Mon");
    EXPECT_EQ(row->key.bin_of_day_str, "07:00");
    EXPECT_EQ(row->stats.count, 2u);
    EXPECT_DOUBLE_EQ(row->stats.mean, 2.0);
    EXPECT_DOUBLE_EQ(row->stats.var, 2.0);
    EXPECT_DOUBLE_EQ(row->stats.percentile_values[0], 2.0);

    SummaryKey tuesday = monday;
    tuesday.day_of_week = 1;
    const SummaryRow* tue = occ.find(tuesday);
    ASSERT_NE(tue, nullptr);
    EXPECT_EQ(tue->stats.count, 1u);
    EXPECT_DOUBLE_EQ(tue->stats.mean, 5.0);

    const SummaryRow* arr = out.at("arrivals").find(monday);
    ASSERT_NE(arr, nullptr);
    EXPECT_DOUBLE_EQ(arr->stats.mean, 2.0);
}

TEST(SummaryEngine, StationaryGroupsByCategory) {
    const RollupTable a = make_table("A", 1.0);
    const RollupTable b = make_table("B", 2.0);
    const MeasureSummaries out = SummaryEngine::summarize_stationary({&a, &b}, {});

    const SummaryTable& occ = out.at("occupancy");
    EXPECT_TRUE(occ.stationary);
    ASSERT_EQ(occ.rows.size(), 2u);
    EXPECT_EQ(occ.rows[0].key.category, "A");
    EXPECT_EQ(occ.rows[0].key.day_of_week, -1);
    EXPECT_EQ(occ.rows[0].stats.count, 3u);
    EXPECT_DOUBLE_EQ(occ.rows[0].stats.mean, 3.0);
    EXPECT_EQ(occ.rows[1].key.category, "B");
    EXPECT_DOUBLE_EQ(occ.rows[1].stats.mean, 6.0);
}

TEST(SummaryEngine, GroupingKeys) {
    std::map<std::string, RollupTable> bydatetime;
    bydatetime["A"] = make_table("A", 1.0);
    bydatetime["B"] = make_table("B", 1.0);
    bydatetime[constants::TOTAL_KEY] = make_table(constants::TOTAL_KEY, 2.0);

    const HillsSummaries s = SummaryEngine::summarize(bydatetime, "unit", true, true, {0.5});
    ASSERT_EQ(s.nonstationary.size(), 2u);
    EXPECT_TRUE(s.nonstationary.count("unit_dow_binofday"));
    EXPECT_TRUE(s.nonstationary.count("dow_binofday"));
    ASSERT_EQ(s.stationary.size(), 2u);
    EXPECT_TRUE(s.stationary.count("unit"));
    EXPECT_TRUE(s.stationary.count(""));

    // Category groupings never include the total
    for (const auto& row : s.stationary.at("unit").at("occupancy").rows) {
        EXPECT_NE(row.key.category, constants::TOTAL_KEY);
    }
    EXPECT_EQ(s.stationary.at("").at("occupancy").rows.size(), 1u);
}

TEST(SummaryEngine, UncategorisedRunHasOnlyTotalGroupings) {
    std::map<std::string, RollupTable> bydatetime;
    bydatetime[constants::TOTAL_KEY] = make_table(constants::TOTAL_KEY, 1.0);

    const HillsSummaries s = SummaryEngine::summarize(bydatetime, "", true, false, {});
    ASSERT_EQ(s.nonstationary.size(), 1u);
    EXPECT_TRUE(s.nonstationary.count("dow_binofday"));
    EXPECT_TRUE(s.stationary.empty());
}

TEST(SummaryEngine, PercentileNamesFollowRequest) {
    const RollupTable a = make_table("A", 1.0);
    const MeasureSummaries out = SummaryEngine::summarize_stationary({&a}, {0.95, 0.5});
    const auto names = out.at("occupancy").percentile_names();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "p95");
    EXPECT_EQ(names[1], "p50");
}

TEST(SummaryEngine, LosUnits) {
    EXPECT_DOUBLE_EQ(SummaryEngine::los_unit_seconds("hours"), 3600.0);
    EXPECT_DOUBLE_EQ(SummaryEngine::los_unit_seconds("H"), 3600.0);
    EXPECT_DOUBLE_EQ(SummaryEngine::los_unit_seconds("days"), 86400.0);
    EXPECT_DOUBLE_EQ(SummaryEngine::los_unit_seconds("min"), 60.0);
    EXPECT_DOUBLE_EQ(SummaryEngine::los_unit_seconds("s"), 1.0);
    EXPECT_THROW(SummaryEngine::los_unit_seconds("fortnights"), ValidationError);
}

TEST(SummaryEngine, LengthOfStayOverOverlappingRecords) {
    const AnalysisWindow window(ts("2024-01-01"), ts("2024-01-01 23:59:59"));
    std::map<std::string, std::vector<StopRecord>> records;
    records["A"] = {
        stop("2024-01-01 01:00", "2024-01-01 02:00"),
        stop("2024-01-01 03:00", "2024-01-01 06:00"),
        stop("2023-12-31 22:00", "2024-01-01 00:00"),     // left, 2 h
        stop("2023-12-20 01:00", "2023-12-20 09:00"),     // none
        stop("2024-01-01 09:00", "2024-01-01 08:00"),     // backwards
    };
    records["B"] = {stop("2024-01-01 10:00", "2024-01-01 14:00")};

    const LosSummary los = SummaryEngine::summarize_los(records, window, "hours", {0.5}, true);
    EXPECT_EQ(los.units, "hours");
    ASSERT_EQ(los.by_category.size(), 3u);

    const auto& a = los.by_category.at("A");
    EXPECT_EQ(a.count, 3u);
    EXPECT_DOUBLE_EQ(a.mean, 2.0);
    EXPECT_DOUBLE_EQ(a.percentile_values[0], 2.0);

    const auto& total = los.by_category.at(constants::TOTAL_KEY);
    EXPECT_EQ(total.count, 4u);
    EXPECT_DOUBLE_EQ(total.mean, 2.5);
    EXPECT_DOUBLE_EQ(total.max, 4.0);
}

TEST(SummaryEngine, LengthOfStayWithoutTotal) {
    const AnalysisWindow window(ts("2024-01-01"), ts("2024-01-01 23:59:59"));
    std::map<std::string, std::vector<StopRecord>> records;
    records[constants::TOTAL_KEY] = {stop("2024-01-01 01:00", "2024-01-01 01:30")};

    const LosSummary los = SummaryEngine::summarize_los(records, window, "minutes", {}, false);
    ASSERT_EQ(los.by_category.size(), 1u);
    EXPECT_DOUBLE_EQ(los.by_category.at(constants::TOTAL_KEY).mean, 30.0);
}
