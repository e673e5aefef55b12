#include <gtest/gtest.h>
#include "impact/design_builder.hpp"

using namespace impactflow;

namespace {

/// OK composite with score = ts / 100 + offset at every step in [from, to].
CompositeOFISeries composite(const std::string& sym, int64_t from, int64_t to, double offset) {
    CompositeOFISeries c;
    c.symbol = sym;
    c.status = UnitStatus::OK;
    for (int64_t t = from; t <= to; t += 100) {
        c.records.push_back({sym, t, static_cast<double>(t) / 100.0 + offset, LevelVector{}, 1.0, false});
    }
    c.observations = c.records.size();
    return c;
}

PriceChangeSeries returns(const std::string& sym, int64_t from, int64_t to, int64_t horizon) {
    PriceChangeSeries r;
    r.symbol = sym;
    r.horizon_us = horizon;
    for (int64_t t = from; t <= to; t += 100) {
        r.records.push_back({sym, t, horizon, static_cast<double>(t) * 1e-6});
    }
    return r;
}

} // namespace

TEST(DesignBuilder, ContemporaneousRowsReadOfiInsideTheReturnWindow) {
    CrossImpactDesignBuilder builder({composite("A", 100, 500, 0.0), composite("B", 300, 700, 0.5)}, 100);
    const auto design = builder.build(returns("A", 100, 700, 100), ImpactMode::CONTEMPORANEOUS);

    EXPECT_EQ(design.target_symbol, "A");
    EXPECT_EQ(design.candidate_rows, 7u);
    ASSERT_EQ(design.rows.size(), 3u);
    EXPECT_EQ(design.dropped_rows, 4u);
    ASSERT_EQ(design.cross_symbols.size(), 1u);
    EXPECT_EQ(design.cross_symbols[0], "B");

    // Return over [200, 300] pairs with the bin (200, 300] stamped at 300
    EXPECT_EQ(design.rows[0].timestamp_us, 200);
    EXPECT_DOUBLE_EQ(design.rows[0].self_ofi, 3.0);
    EXPECT_DOUBLE_EQ(design.rows[0].cross_ofi.at("B"), 3.5);
    EXPECT_DOUBLE_EQ(design.rows[0].target_return, 200e-6);
    EXPECT_EQ(design.rows[2].timestamp_us, 400);
}

TEST(DesignBuilder, ContemporaneousSumsBinsOverLongerHorizons) {
    CrossImpactDesignBuilder builder({composite("A", 100, 900, 0.0)}, 100);
    const auto design = builder.build(returns("A", 100, 900, 300), ImpactMode::CONTEMPORANEOUS);
    ASSERT_EQ(design.rows.size(), 6u);
    EXPECT_EQ(design.rows[0].timestamp_us, 100);
    EXPECT_DOUBLE_EQ(design.rows[0].self_ofi, 2.0 + 3.0 + 4.0);
    EXPECT_EQ(design.rows[5].timestamp_us, 600);
    EXPECT_DOUBLE_EQ(design.rows[5].self_ofi, 7.0 + 8.0 + 9.0);
}

TEST(DesignBuilder, LaggedRowsReadTheWindowEndingAtTheReturnStart) {
    CrossImpactDesignBuilder builder({composite("A", 100, 500, 0.0), composite("B", 300, 700, 0.5)}, 100);
    const auto design = builder.build(returns("A", 100, 700, 100), ImpactMode::LAGGED);

    EXPECT_EQ(design.mode, ImpactMode::LAGGED);
    ASSERT_EQ(design.rows.size(), 3u);
    EXPECT_EQ(design.rows[0].timestamp_us, 300);
    EXPECT_DOUBLE_EQ(design.rows[0].self_ofi, 3.0);          // A bin (200, 300]
    EXPECT_DOUBLE_EQ(design.rows[0].cross_ofi.at("B"), 3.5); // B bin (200, 300]
    EXPECT_DOUBLE_EQ(design.rows[0].target_return, 300e-6);
    EXPECT_EQ(design.rows[2].timestamp_us, 500);
}

TEST(DesignBuilder, LaggedWindowSpansTheHorizon) {
    CrossImpactDesignBuilder builder({composite("A", 100, 900, 0.0)}, 100);
    const auto design = builder.build(returns("A", 100, 900, 300), ImpactMode::LAGGED);
    ASSERT_EQ(design.rows.size(), 7u);
    EXPECT_EQ(design.rows[0].timestamp_us, 300);
    EXPECT_DOUBLE_EQ(design.rows[0].self_ofi, 1.0 + 2.0 + 3.0);
    EXPECT_TRUE(design.cross_symbols.empty());
}

TEST(DesignBuilder, HorizonOffTheStepYieldsNoRows) {
    CrossImpactDesignBuilder builder({composite("A", 100, 900, 0.0)}, 100);
    const auto design = builder.build(returns("A", 100, 900, 150), ImpactMode::CONTEMPORANEOUS);
    EXPECT_TRUE(design.rows.empty());
    EXPECT_EQ(design.dropped_rows, design.candidate_rows);
}

TEST(DesignBuilder, FailedCompositesLeaveTheUniverse) {
    CompositeOFISeries failed;
    failed.symbol = "C";
    failed.status = UnitStatus::INSUFFICIENT_HISTORY;

    CrossImpactDesignBuilder builder({composite("B", 100, 500, 0.0), failed, composite("A", 100, 500, 0.0)}, 100);
    ASSERT_EQ(builder.universe().size(), 2u);
    EXPECT_EQ(builder.universe()[0], "A");
    EXPECT_EQ(builder.universe()[1], "B");
    EXPECT_FALSE(builder.contains("C"));

    // C's own design is empty but still describes the unit
    const auto c = builder.build(returns("C", 100, 500, 100), ImpactMode::CONTEMPORANEOUS);
    EXPECT_EQ(c.target_symbol, "C");
    EXPECT_EQ(c.horizon_us, 100);
    EXPECT_TRUE(c.rows.empty());
    EXPECT_EQ(c.dropped_rows, 5u);

    // and A's design never waits on C
    const auto a = builder.build(returns("A", 100, 500, 100), ImpactMode::CONTEMPORANEOUS);
    EXPECT_EQ(a.rows.size(), 4u);
    EXPECT_EQ(a.cross_symbols, std::vector<std::string>{"B"});
}

TEST(DesignBuilder, MissingCrossValueDropsTheRow) {
    auto b = composite("B", 100, 500, 0.0);
    b.records.erase(b.records.begin() + 2);   // no B at 300
    CrossImpactDesignBuilder builder({composite("A", 100, 500, 0.0), b}, 100);
    const auto design = builder.build(returns("A", 100, 400, 100), ImpactMode::CONTEMPORANEOUS);
    EXPECT_EQ(design.rows.size(), 3u);
    EXPECT_EQ(design.dropped_rows, 1u);
    for (const auto& row : design.rows) EXPECT_NE(row.timestamp_us, 200);
}
