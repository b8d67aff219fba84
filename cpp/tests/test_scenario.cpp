#include "hillmaker/core/diagnostics.hpp"
#include "hillmaker/core/scenario.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace hillmaker;
using hillmaker::testing::ts;

namespace {

ScenarioOptions base_options() {
    ScenarioOptions opts;
    opts.start_analysis_dt = ts("2024-01-01");
    opts.end_analysis_dt = ts("2024-01-07");
    return opts;
}

} // namespace

TEST(Scenario, EndMovesToLastSecondOfDay) {
    const Scenario s(base_options());
    EXPECT_EQ(s.window().start, ts("2024-01-01"));
    EXPECT_EQ(s.window().end, ts("2024-01-07 23:59:59"));
}

TEST(Scenario, EndWithTimeOfDayAlsoNormalised) {
    auto opts = base_options();
    opts.end_analysis_dt = ts("2024-01-07 08:15");
    EXPECT_EQ(Scenario(opts).window().end, ts("2024-01-07 23:59:59"));
}

TEST(Scenario, RejectsEndBeforeStart) {
    auto opts = base_options();
    opts.start_analysis_dt = ts("2024-01-08");
    EXPECT_THROW(Scenario{opts}, ValidationError);
}

TEST(Scenario, SameStartAndEndDayIsOneDay) {
    auto opts = base_options();
    opts.end_analysis_dt = opts.start_analysis_dt;
    EXPECT_EQ(Scenario(opts).window().end, ts("2024-01-01 23:59:59"));
}

TEST(Scenario, BinSizeMustDivideDay) {
    auto opts = base_options();
    opts.bin_size_minutes = 7;
    EXPECT_THROW(Scenario{opts}, ValidationError);

    opts.bin_size_minutes = 0;
    EXPECT_THROW(Scenario{opts}, ValidationError);

    opts.bin_size_minutes = 90;
    opts.highres_bin_size_minutes = 30;
    EXPECT_NO_THROW(Scenario{opts});
}

TEST(Scenario, HighresMustNotExceedReport) {
    auto opts = base_options();
    opts.bin_size_minutes = 30;
    opts.highres_bin_size_minutes = 60;
    EXPECT_THROW(Scenario{opts}, ValidationError);
}

TEST(Scenario, HighresMustDivideReport) {
    auto opts = base_options();
    opts.bin_size_minutes = 60;
    opts.highres_bin_size_minutes = 40;
    EXPECT_THROW(Scenario{opts}, ValidationError);
}

TEST(Scenario, RejectsBadPercentileAndUnits) {
    auto opts = base_options();
    opts.percentiles = {0.5, 1.2};
    EXPECT_THROW(Scenario{opts}, ValidationError);

    opts = base_options();
    opts.los_units = "weeks";
    EXPECT_THROW(Scenario{opts}, ValidationError);
}

TEST(Scenario, RejectsPercentilesWithSameColumnName) {
    auto opts = base_options();
    opts.percentiles = {0.5, 0.99, 0.995};
    EXPECT_THROW(Scenario{opts}, ValidationError);

    opts.percentiles = {0.5, 0.99, 1.0};
    EXPECT_NO_THROW(Scenario{opts});
}

TEST(Scenario, FractionalWithoutHighresUsesReportGrid) {
    auto opts = base_options();
    opts.bin_size_minutes = 60;
    opts.highres_bin_size_minutes = 5;
    EXPECT_EQ(Scenario(opts).highres_bin_minutes(), 60);

    opts.keep_highres_bydatetime = true;
    EXPECT_EQ(Scenario(opts).highres_bin_minutes(), 5);

    opts.keep_highres_bydatetime = false;
    opts.edge_bins = EdgeBinsMode::WHOLE_BIN;
    EXPECT_EQ(Scenario(opts).highres_bin_minutes(), 5);
}

TEST(Scenario, EmptyOptionalFieldsAreUnset) {
    auto opts = base_options();
    opts.cat_field = "";
    opts.occ_weight_field = "";
    const Scenario s(opts);
    EXPECT_FALSE(s.options().cat_field.has_value());
    EXPECT_FALSE(s.options().occ_weight_field.has_value());
    EXPECT_EQ(s.cat_field_name(), "");
}

TEST(Scenario, Exclusions) {
    auto opts = base_options();
    opts.cats_to_exclude = {"ART", "IVT"};
    const Scenario s(opts);
    EXPECT_TRUE(s.is_excluded("ART"));
    EXPECT_FALSE(s.is_excluded("MYE"));
}

TEST(Diagnostics, EmitFiltersByLevel) {
    Diagnostics d;
    d.debug("fine detail");
    d.info("progress", "ART");
    d.warning("odd data", "ART");

    std::ostringstream warn_only;
    d.emit(warn_only, Diagnostics::level_for_verbosity(0));
    EXPECT_EQ(warn_only.str(), "[hillmaker] WARNING cat=ART odd data\n");

    std::ostringstream all;
    d.emit(all, Diagnostics::level_for_verbosity(2));
    EXPECT_NE(all.str().find("[hillmaker] DEBUG fine detail"), std::string::npos);
    EXPECT_NE(all.str().find("[hillmaker] INFO cat=ART progress"), std::string::npos);
}

TEST(Diagnostics, MergeCombinesCounts) {
    Diagnostics a;
    a.add_relationship_counts("A", {{RecordRelationship::INNER, 2}});
    a.warning("first");

    Diagnostics b;
    b.add_relationship_counts("A", {{RecordRelationship::INNER, 1}});
    b.add_relationship_counts("B", {{RecordRelationship::LEFT, 4}});
    b.warning("second");

    a.merge(b);
    EXPECT_EQ(a.warnings().size(), 2u);
    EXPECT_EQ(a.relationship_counts().at("A").at(RecordRelationship::INNER), 3u);

    const auto total = a.total_relationship_counts();
    EXPECT_EQ(total.at(RecordRelationship::INNER), 3u);
    EXPECT_EQ(total.at(RecordRelationship::LEFT), 4u);
}
