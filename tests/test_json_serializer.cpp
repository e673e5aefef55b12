#include <gtest/gtest.h>
#include <limits>
#include "io/json_serializer.hpp"

using namespace impactflow;

TEST(JsonSerializer, FailedRegressionWritesNulls) {
    RegressionResult r;
    r.target_symbol = "AAPL";
    r.horizon_us = 60'000'000;
    r.mode = ImpactMode::LAGGED;
    r.status = UnitStatus::SINGULAR_DESIGN;
    r.observations = 12;
    r.regressors = 4;

    const std::string json = serialize_regression(r);
    EXPECT_EQ(json.rfind("{\"type\":\"regression\",\"data\":{", 0), 0u);
    EXPECT_NE(json.find("\"target_symbol\":\"AAPL\""), std::string::npos);
    EXPECT_NE(json.find("\"mode\":\"LAGGED\""), std::string::npos);
    EXPECT_NE(json.find("\"status\":\"SINGULAR_DESIGN\""), std::string::npos);
    EXPECT_NE(json.find("\"r_squared\":null"), std::string::npos);
    EXPECT_NE(json.find("\"self_coefficient\":null"), std::string::npos);
    EXPECT_NE(json.find("\"dominance_ratio\":null"), std::string::npos);
    EXPECT_NE(json.find("\"observations\":12"), std::string::npos);
    EXPECT_EQ(json.back(), '}');
}

TEST(JsonSerializer, FittedRegressionWritesValues) {
    RegressionResult r;
    r.target_symbol = "MSFT";
    r.horizon_us = 300'000'000;
    r.status = UnitStatus::OK;
    r.intercept = 0.5;
    r.self_coefficient = 3;
    r.cross_coefficients = {{"AAPL", -0.25}, {"NVDA", 0.125}};
    r.r_squared = 0.75;
    r.adjusted_r_squared = 0.7;
    r.dominance_ratio = 0.0625;

    const std::string json = serialize_regression(r);
    EXPECT_NE(json.find("\"horizon_us\":300000000"), std::string::npos);
    EXPECT_NE(json.find("\"self_coefficient\":3"), std::string::npos);
    EXPECT_NE(json.find("\"cross_coefficients\":{\"AAPL\":-0.25,\"NVDA\":0.125}"), std::string::npos);
    EXPECT_NE(json.find("\"r_squared\":0.75"), std::string::npos);
    EXPECT_NE(json.find("\"dominance_ratio\":0.0625"), std::string::npos);
}

TEST(JsonSerializer, ImpactMatrixNanBecomesNull) {
    CrossImpactMatrix m;
    m.horizon_us = 60;
    m.symbols = {"A", "B"};
    const double nan = std::numeric_limits<double>::quiet_NaN();
    m.coefficients = {{1.5, 0.25}, {nan, nan}};
    m.r_squared = {0.5, std::nullopt};

    const std::string json = serialize_impact_matrix(m);
    EXPECT_NE(json.find("\"coefficients\":[[1.5,0.25],[null,null]]"), std::string::npos);
    EXPECT_NE(json.find("\"r_squared\":[0.5,null]"), std::string::npos);
    EXPECT_NE(json.find("\"symbols\":[\"A\",\"B\"]"), std::string::npos);
}

TEST(JsonSerializer, CompositeCarriesFitAndScores) {
    CompositeOFISeries c;
    c.symbol = "A\"B";
    c.status = UnitStatus::OK;
    c.loadings = {1, 0, 0, 0, 0};
    c.explained_variance = 1.0;
    c.records.push_back({"A\"B", -5, 0.5, c.loadings, 1.0, false});

    const std::string json = serialize_composite(c);
    EXPECT_EQ(json.rfind("{\"type\":\"composite_ofi\"", 0), 0u);
    EXPECT_NE(json.find("\"symbol\":\"A\\\"B\""), std::string::npos);
    EXPECT_NE(json.find("\"loadings\":[1,0,0,0,0]"), std::string::npos);
    EXPECT_NE(json.find("\"records\":[{\"timestamp_us\":-5,\"score\":0.5}]"), std::string::npos);
    EXPECT_NE(json.find("\"low_fidelity\":false"), std::string::npos);
}

TEST(JsonSerializer, PriceChangesAndProfile) {
    PriceChangeSeries s;
    s.symbol = "A";
    s.horizon_us = 60;
    s.convention = ReturnConvention::PRICE_DIFFERENCE;
    s.records.push_back({"A", 120, 60, -0.01});
    const std::string pc = serialize_price_changes(s);
    EXPECT_NE(pc.find("\"convention\":\"PRICE_DIFFERENCE\""), std::string::npos);
    EXPECT_NE(pc.find("{\"timestamp_us\":120,\"value\":-0.01}"), std::string::npos);

    StageStats st;
    st.name = "composite_ofi";
    st.record(2.0);
    st.record(4.0);
    const std::string prof = serialize_profile({st});
    EXPECT_NE(prof.find("\"name\":\"composite_ofi\""), std::string::npos);
    EXPECT_NE(prof.find("\"calls\":2"), std::string::npos);
    EXPECT_NE(prof.find("\"avg_ms\":3"), std::string::npos);
}
