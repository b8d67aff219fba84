#include "hillmaker/processing/bin_accumulator.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace hillmaker;
using hillmaker::testing::day_window;
using hillmaker::testing::stop;

namespace {

FineGridMatrix accumulate(const std::vector<StopRecord>& records,
                          EdgeBinsMode mode = EdgeBinsMode::FRACTIONAL) {
    BinScatterAccumulator acc(day_window("2024-01-01"), 30, mode);
    acc.add_all(records);
    return acc.release();
}

void expect_only_nonzero(const std::vector<double>& series, size_t bin, double value) {
    for (size_t i = 0; i < series.size(); ++i) {
        if (i == bin) {
            EXPECT_DOUBLE_EQ(series[i], value) << "bin " << i;
        } else {
            EXPECT_DOUBLE_EQ(series[i], 0.0) << "bin " << i;
        }
    }
}

} // namespace

TEST(BinScatterAccumulator, GridSize) {
    BinScatterAccumulator acc(day_window("2024-01-01"), 30, EdgeBinsMode::FRACTIONAL);
    EXPECT_EQ(acc.num_bins(), 48);
    EXPECT_EQ(acc.matrix().size(), 48u);
}

TEST(BinScatterAccumulator, StayInsideOneBin) {
    const auto m = accumulate({stop("2024-01-01 07:05", "2024-01-01 07:22")});
    expect_only_nonzero(m.arrivals, 14, 1.0);
    expect_only_nonzero(m.departures, 14, 1.0);
    expect_only_nonzero(m.occupancy, 14, 17.0 / 30.0);
}

TEST(BinScatterAccumulator, StaySpanningFourBins) {
    const auto m = accumulate({stop("2024-01-01 07:20", "2024-01-01 08:50")});
    expect_only_nonzero(m.arrivals, 14, 1.0);
    expect_only_nonzero(m.departures, 17, 1.0);

    EXPECT_DOUBLE_EQ(m.occupancy[14], 10.0 / 30.0);
    EXPECT_DOUBLE_EQ(m.occupancy[15], 1.0);
    EXPECT_DOUBLE_EQ(m.occupancy[16], 1.0);
    EXPECT_DOUBLE_EQ(m.occupancy[17], 20.0 / 30.0);
    EXPECT_DOUBLE_EQ(m.occupancy[13], 0.0);
    EXPECT_DOUBLE_EQ(m.occupancy[18], 0.0);
    EXPECT_NEAR(m.total(Measure::OCCUPANCY), 90.0 / 30.0, 1e-12);
}

TEST(BinScatterAccumulator, LeftCensoredStayEndingOnBinEdge) {
    const auto m = accumulate({stop("2023-12-31 10:20", "2024-01-01 08:30")});
    EXPECT_DOUBLE_EQ(m.total(Measure::ARRIVALS), 0.0);
    expect_only_nonzero(m.departures, 17, 1.0);

    for (size_t i = 0; i <= 16; ++i) {
        EXPECT_DOUBLE_EQ(m.occupancy[i], 1.0) << "bin " << i;
    }
    for (size_t i = 17; i < m.size(); ++i) {
        EXPECT_DOUBLE_EQ(m.occupancy[i], 0.0) << "bin " << i;
    }
}

TEST(BinScatterAccumulator, EntryOnBoundaryGoesToFollowingBin) {
    const auto m = accumulate({stop("2024-01-01 07:30", "2024-01-01 07:45")});
    expect_only_nonzero(m.arrivals, 15, 1.0);
    expect_only_nonzero(m.occupancy, 15, 0.5);
}

TEST(BinScatterAccumulator, Superposition) {
    const std::vector<StopRecord> records = {
        stop("2024-01-01 07:20", "2024-01-01 08:50"),     // inner
        stop("2023-12-31 10:20", "2024-01-01 08:30"),     // left
        stop("2024-01-01 22:10", "2024-01-02 03:00"),     // right
        stop("2023-12-31 10:00", "2024-01-03 10:00"),     // outer
    };

    const auto combined = accumulate(records);

    FineGridMatrix summed(combined.size());
    for (const auto& rec : records) {
        summed += accumulate({rec});
    }

    for (size_t i = 0; i < combined.size(); ++i) {
        EXPECT_NEAR(combined.occupancy[i], summed.occupancy[i], 1e-12) << "bin " << i;
        EXPECT_DOUBLE_EQ(combined.arrivals[i], summed.arrivals[i]) << "bin " << i;
        EXPECT_DOUBLE_EQ(combined.departures[i], summed.departures[i]) << "bin " << i;
    }
}

TEST(BinScatterAccumulator, Idempotent) {
    const std::vector<StopRecord> records = {
        stop("2024-01-01 07:05", "2024-01-01 07:22"),
        stop("2023-12-31 10:20", "2024-01-01 08:30"),
        stop("2024-01-01 22:10", "2024-01-02 03:00"),
    };
    const auto first = accumulate(records);
    const auto second = accumulate(records);
    EXPECT_EQ(first.arrivals, second.arrivals);
    EXPECT_EQ(first.departures, second.departures);
    EXPECT_EQ(first.occupancy, second.occupancy);
}

TEST(BinScatterAccumulator, InnerRecordsBalanceArrivalsAndDepartures) {
    const std::vector<StopRecord> records = {
        stop("2024-01-01 01:00", "2024-01-01 02:10"),
        stop("2024-01-01 03:15", "2024-01-01 09:00"),
        stop("2024-01-01 12:00", "2024-01-01 12:00"),
    };
    const auto m = accumulate(records);
    EXPECT_DOUBLE_EQ(m.total(Measure::ARRIVALS), 3.0);
    EXPECT_DOUBLE_EQ(m.total(Measure::DEPARTURES), 3.0);
}

TEST(BinScatterAccumulator, BackwardsAndNoneRecordsAddNoOccupancy) {
    BinScatterAccumulator acc(day_window("2024-01-01"), 30, EdgeBinsMode::FRACTIONAL);
    acc.add(stop("2024-01-01 09:00", "2024-01-01 08:00"));
    acc.add(stop("2023-12-30 09:00", "2023-12-31 08:00"));

    EXPECT_DOUBLE_EQ(acc.matrix().total(Measure::OCCUPANCY), 0.0);
    EXPECT_DOUBLE_EQ(acc.matrix().total(Measure::ARRIVALS), 0.0);
    EXPECT_EQ(acc.relationship_counts().at(RecordRelationship::BACKWARDS), 1u);
    EXPECT_EQ(acc.relationship_counts().at(RecordRelationship::NONE), 1u);
}

TEST(BinScatterAccumulator, WholeBinModeCreditsEdgeBins) {
    const auto m = accumulate({stop("2024-01-01 07:05", "2024-01-01 07:22")},
                              EdgeBinsMode::WHOLE_BIN);
    expect_only_nonzero(m.occupancy, 14, 1.0);
}

TEST(BinScatterAccumulator, ScatterOutsideGridIsInvariantViolation) {
    FineGridMatrix m(4);
    BinnedStop s;
    s.relationship = RecordRelationship::INNER;
    s.entry_bin = 3;
    s.exit_bin = 4;
    s.increments = {1.0, 1.0};
    EXPECT_THROW(BinScatterAccumulator::scatter(s, m), NumericInvariantError);
}

TEST(FineGridMatrix, AddRequiresEqualLength) {
    FineGridMatrix a(4);
    FineGridMatrix b(5);
    EXPECT_THROW(a += b, NumericInvariantError);
}
