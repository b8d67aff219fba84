#include "hillmaker/core/diagnostics.hpp"
#include "hillmaker/processing/record_classifier.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace hillmaker;
using hillmaker::testing::stop;
using hillmaker::testing::ts;

class RecordClassifierTest : public ::testing::Test {
protected:
    // Half-open [2024-01-01, 2024-01-02)
    AnalysisWindow window{ts("2024-01-01"), ts("2024-01-02")};

    RecordRelationship classify(const std::string& entry, const std::string& exit) const {
        return RecordClassifier::classify(ts(entry), ts(exit), window);
    }
};

TEST_F(RecordClassifierTest, SixRelationships) {
    EXPECT_EQ(classify("2024-01-01 07:05", "2024-01-01 07:22"), RecordRelationship::INNER);
    EXPECT_EQ(classify("2023-12-31 10:20", "2024-01-01 08:30"), RecordRelationship::LEFT);
    EXPECT_EQ(classify("2024-01-01 22:00", "2024-01-02 03:00"), RecordRelationship::RIGHT);
    EXPECT_EQ(classify("2023-12-31 10:00", "2024-01-03 10:00"), RecordRelationship::OUTER);
    EXPECT_EQ(classify("2024-01-01 09:00", "2024-01-01 08:00"), RecordRelationship::BACKWARDS);
    EXPECT_EQ(classify("2023-12-30 09:00", "2023-12-31 08:00"), RecordRelationship::NONE);
    EXPECT_EQ(classify("2024-01-05 09:00", "2024-01-05 10:00"), RecordRelationship::NONE);
}

TEST_F(RecordClassifierTest, EntryAtWindowStartIsInside) {
    EXPECT_EQ(classify("2024-01-01 00:00", "2024-01-01 01:00"), RecordRelationship::INNER);
}

TEST_F(RecordClassifierTest, EntryAtWindowEndIsOutside) {
    EXPECT_EQ(classify("2024-01-02 00:00", "2024-01-02 01:00"), RecordRelationship::NONE);
}

TEST_F(RecordClassifierTest, ExitAtWindowEndIsRight) {
    EXPECT_EQ(classify("2024-01-01 23:00", "2024-01-02 00:00"), RecordRelationship::RIGHT);
    EXPECT_EQ(classify("2023-12-31 23:00", "2024-01-02 00:00"), RecordRelationship::OUTER);
}

TEST_F(RecordClassifierTest, ExitAtWindowStartIsLeft) {
    EXPECT_EQ(classify("2023-12-31 23:00", "2024-01-01 00:00"), RecordRelationship::LEFT);
}

TEST_F(RecordClassifierTest, ZeroLengthStayIsInner) {
    EXPECT_EQ(classify("2024-01-01 05:00", "2024-01-01 05:00"), RecordRelationship::INNER);
}

TEST_F(RecordClassifierTest, BackwardsTakesPrecedence) {
    // Backwards and also entirely outside the window
    EXPECT_EQ(classify("2023-06-01 09:00", "2023-05-01 09:00"), RecordRelationship::BACKWARDS);
    // Backwards and straddling the window
    EXPECT_EQ(classify("2024-01-03 00:00", "2023-12-30 00:00"), RecordRelationship::BACKWARDS);
}

TEST_F(RecordClassifierTest, CountsByRelationship) {
    const std::vector<StopRecord> records = {
        stop("2024-01-01 07:05", "2024-01-01 07:22"),
        stop("2024-01-01 08:00", "2024-01-01 09:00"),
        stop("2023-12-31 10:20", "2024-01-01 08:30"),
        stop("2024-01-01 09:00", "2024-01-01 08:00"),
    };
    const RelationshipCounts counts = RecordClassifier::count(records, window);
    EXPECT_EQ(counts.at(RecordRelationship::INNER), 2u);
    EXPECT_EQ(counts.at(RecordRelationship::LEFT), 1u);
    EXPECT_EQ(counts.at(RecordRelationship::BACKWARDS), 1u);
    EXPECT_EQ(counts.count(RecordRelationship::OUTER), 0u);

    EXPECT_EQ(format_relationship_counts(counts), "inner=2 left=1 backwards=1");
}
