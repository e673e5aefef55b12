#include <gtest/gtest.h>
#include "common/analysis_config.hpp"

using namespace impactflow;

TEST(AnalysisConfig, DefaultsAreValid) {
    AnalysisConfig cfg;
    std::string error;
    EXPECT_TRUE(cfg.validate(error)) << error;
    EXPECT_EQ(cfg.grid_step_us, 60 * kMicrosPerSecond);
    ASSERT_EQ(cfg.horizons_us.size(), 2u);
    EXPECT_EQ(cfg.horizons_us[1], 300 * kMicrosPerSecond);
    EXPECT_EQ(cfg.return_convention, ReturnConvention::LOG_RETURN);
}

TEST(AnalysisConfig, RejectsHorizonOffGrid) {
    AnalysisConfig cfg;
    cfg.horizons_us = {90 * kMicrosPerSecond};
    std::string error;
    EXPECT_FALSE(cfg.validate(error));
    EXPECT_NE(error.find("multiple"), std::string::npos);
}

TEST(AnalysisConfig, RejectsEmptyHorizons) {
    AnalysisConfig cfg;
    cfg.horizons_us.clear();
    std::string error;
    EXPECT_FALSE(cfg.validate(error));
}

TEST(AnalysisConfig, RejectsNonPositiveStep) {
    AnalysisConfig cfg;
    cfg.grid_step_us = 0;
    std::string error;
    EXPECT_FALSE(cfg.validate(error));
}

TEST(AnalysisConfig, RejectsThresholdOutsideUnitInterval) {
    AnalysisConfig cfg;
    cfg.low_fidelity_threshold = 1.5;
    std::string error;
    EXPECT_FALSE(cfg.validate(error));
}

TEST(AnalysisConfig, RejectsInvertedWindow) {
    AnalysisConfig cfg;
    cfg.window_start_us = 1000;
    cfg.window_end_us = 10;
    std::string error;
    EXPECT_FALSE(cfg.validate(error));
}

TEST(TimeGrid, CoveringFloorsOrigin) {
    const TimeGrid g = TimeGrid::covering(125, 430, 100);
    EXPECT_EQ(g.origin_us, 100);
    EXPECT_EQ(g.count, 5u);
    EXPECT_EQ(g.last_point(), 500);
    EXPECT_EQ(g.ceil_index(100), 0u);
    EXPECT_EQ(g.ceil_index(101), 1u);
    EXPECT_EQ(g.ceil_index(430), 4u);
    EXPECT_EQ(g.ceil_index(501), g.count);
}

TEST(TimeGrid, CoveringNegativeStart) {
    const TimeGrid g = TimeGrid::covering(-150, 0, 100);
    EXPECT_EQ(g.origin_us, -200);
    EXPECT_EQ(g.count, 3u);
}
