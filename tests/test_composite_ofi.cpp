#include <gtest/gtest.h>
#include <cmath>
#include "ofi/composite_ofi.hpp"

using namespace impactflow;

namespace {

LevelOFISeries make_series(const std::string& symbol, const std::vector<LevelVector>& rows) {
    LevelOFISeries s;
    s.symbol = symbol;
    int64_t ts = 60'000'000;
    for (const auto& r : rows) {
        s.records.push_back({symbol, ts, r, 5});
        ts += 60'000'000;
    }
    return s;
}

std::vector<double> standardize(const std::vector<double>& v) {
    double mean = 0.0;
    for (double x : v) mean += x;
    mean /= static_cast<double>(v.size());
    double var = 0.0;
    for (double x : v) var += (x - mean) * (x - mean);
    const double sd = std::sqrt(var / static_cast<double>(v.size()));
    std::vector<double> out;
    for (double x : v) out.push_back((x - mean) / sd);
    return out;
}

} // namespace

TEST(CompositeOFI, SingleInformativeLevelEqualsStandardisedSeries) {
    const std::vector<double> l1 = {100, -50, 0, 20, -20};
    std::vector<LevelVector> rows;
    for (double v : l1) rows.push_back({v, 0.0, 0.0, 7.0, 0.0});

    CompositeOFIReducer reducer;
    const auto out = reducer.fit_transform(make_series("A", rows));
    ASSERT_EQ(out.status, UnitStatus::OK);
    EXPECT_NEAR(out.explained_variance, 1.0, 1e-9);
    EXPECT_FALSE(out.low_fidelity);
    EXPECT_NEAR(out.loadings[0], 1.0, 1e-9);
    for (size_t i = 1; i < kMaxLevels; ++i) EXPECT_NEAR(out.loadings[i], 0.0, 1e-9);
    EXPECT_NEAR(out.level_stddev[3], 0.0, 1e-12);

    const auto expected = standardize(l1);
    ASSERT_EQ(out.records.size(), l1.size());
    for (size_t i = 0; i < l1.size(); ++i) {
        EXPECT_NEAR(out.records[i].score, expected[i], 1e-9) << "row " << i;
        EXPECT_EQ(out.records[i].timestamp_us, static_cast<int64_t>(i + 1) * 60'000'000);
    }
}

TEST(CompositeOFI, SignFollowsLevelOne) {
    std::vector<LevelVector> rows = {
        {10, 8, 5, 1, 0}, {-4, -3, -1, 0, 2}, {6, 7, 2, 3, 1}, {-12, -9, -6, -2, -1}, {0, 1, 0, 1, -2},
    };
    std::vector<LevelVector> negated;
    for (auto r : rows) {
        for (auto& v : r) v = -v;
        negated.push_back(r);
    }

    CompositeOFIReducer reducer;
    const auto a = reducer.fit_transform(make_series("A", rows));
    const auto b = reducer.fit_transform(make_series("A", negated));
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());

    // score co-moves with level-1 OFI in both fits
    double cov_a = 0.0, cov_b = 0.0;
    for (size_t i = 0; i < rows.size(); ++i) {
        cov_a += a.records[i].score * rows[i][0];
        cov_b += b.records[i].score * negated[i][0];
        EXPECT_NEAR(a.records[i].score, -b.records[i].score, 1e-9);
    }
    EXPECT_GT(cov_a, 0.0);
    EXPECT_GT(cov_b, 0.0);

    // refitting gives the identical result
    const auto again = reducer.fit_transform(make_series("A", rows));
    for (size_t i = 0; i < kMaxLevels; ++i) EXPECT_DOUBLE_EQ(a.loadings[i], again.loadings[i]);
}

TEST(CompositeOFI, TieBreakMakesDominantLoadingPositive) {
    // level 1 is constant, so the covariance rule cannot decide
    std::vector<LevelVector> rows = {
        {5, -30, 0, 0, 0}, {5, 10, 0, 0, 0}, {5, 25, 0, 0, 0}, {5, -5, 0, 0, 0},
    };
    CompositeOFIReducer reducer;
    const auto out = reducer.fit_transform(make_series("A", rows));
    ASSERT_TRUE(out.ok());
    EXPECT_NEAR(out.loadings[1], 1.0, 1e-9);
    EXPECT_LT(out.records[0].score, 0.0);
}

TEST(CompositeOFI, PerfectlyCorrelatedLevelsShareLoadings) {
    std::vector<LevelVector> rows;
    for (double v : {3.0, -1.0, 4.0, -1.5, 0.5, -9.0}) {
        rows.push_back({v, 2 * v, 3 * v, 4 * v, 5 * v});
    }
    CompositeOFIReducer reducer;
    const auto out = reducer.fit_transform(make_series("A", rows));
    ASSERT_TRUE(out.ok());
    EXPECT_NEAR(out.explained_variance, 1.0, 1e-9);
    for (double w : out.loadings) EXPECT_NEAR(w, 1.0 / std::sqrt(5.0), 1e-9);
}

TEST(CompositeOFI, UncorrelatedLevelsAreLowFidelity) {
    // Columns 1..5 of an 8x8 Hadamard matrix: zero mean, unit variance, orthogonal
    const double h[8][5] = {
        { 1,  1,  1,  1,  1}, {-1,  1, -1,  1, -1}, { 1, -1, -1,  1,  1}, {-1, -1,  1,  1, -1},
        { 1,  1,  1, -1, -1}, {-1,  1, -1, -1,  1}, { 1, -1, -1, -1, -1}, {-1, -1,  1, -1,  1},
    };
    std::vector<LevelVector> rows;
    for (const auto& r : h) rows.push_back({r[0], r[1], r[2], r[3], r[4]});

    CompositeOFIReducer reducer(3, 0.5);
    const auto out = reducer.fit_transform(make_series("A", rows));
    ASSERT_TRUE(out.ok());
    EXPECT_NEAR(out.explained_variance, 0.2, 1e-9);
    EXPECT_TRUE(out.low_fidelity);
    ASSERT_FALSE(out.records.empty());
    EXPECT_TRUE(out.records[0].low_fidelity);
}

TEST(CompositeOFI, TooFewObservations) {
    CompositeOFIReducer reducer(3);
    const auto out = reducer.fit_transform(make_series("A", {{1, 0, 0, 0, 0}, {2, 0, 0, 0, 0}}));
    EXPECT_EQ(out.status, UnitStatus::INSUFFICIENT_HISTORY);
    EXPECT_EQ(out.observations, 2u);
    EXPECT_TRUE(out.records.empty());
}

TEST(CompositeOFI, AllLevelsConstant) {
    std::vector<LevelVector> rows(6, LevelVector{1, 2, 3, 4, 5});
    CompositeOFIReducer reducer;
    const auto out = reducer.fit_transform(make_series("A", rows));
    EXPECT_EQ(out.status, UnitStatus::ZERO_VARIANCE);
    EXPECT_TRUE(out.records.empty());
}
