/**
 * @file reservoir_tests.cpp
 * @brief Unit tests for the Echo State Network predictor
 */

#include <gtest/gtest.h>
#include "medstock/forecast/reservoir.h"
#include <algorithm>
#include <cmath>

using namespace medstock;
using namespace medstock::forecast;

namespace {

Real max_abs_row_sum(const std::vector<std::vector<Real>>& weights) {
    Real result = 0.0;
    for (const auto& row : weights) {
        Real sum = 0.0;
        for (Real w : row) sum += std::abs(w);
        result = std::max(result, sum);
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// Initialization Tests
// ============================================================================

class ReservoirInitTest : public ::testing::Test {
protected:
    ForecastConfig config = ForecastConfig::default_config();
};

TEST_F(ReservoirInitTest, Dimensions) {
    auto model = initialize_reservoir(config);

    ASSERT_EQ(model.size(), config.reservoir_size);
    for (const auto& row : model.weights) {
        EXPECT_EQ(row.size(), config.reservoir_size);
    }
    ASSERT_EQ(model.input_weights.size(), config.reservoir_size);
    for (const auto& row : model.input_weights) {
        EXPECT_EQ(row.size(), ReservoirModel::INPUT_FEATURES);
        for (Real w : row) {
            EXPECT_GE(w, -1.0);
            EXPECT_LE(w, 1.0);
        }
    }
    EXPECT_EQ(model.state, std::vector<Real>(config.reservoir_size, 0.0));
    EXPECT_EQ(model.readout_weights, std::vector<Real>(config.reservoir_size, 0.0));
    EXPECT_EQ(model.seed, 42u);
}

TEST_F(ReservoirInitTest, ScaledToSpectralRadius) {
    auto model = initialize_reservoir(config);
    EXPECT_NEAR(max_abs_row_sum(model.weights), config.spectral_radius, 1e-9);
}

TEST_F(ReservoirInitTest, SparseConnectivity) {
    config.reservoir_size = 100;
    auto model = initialize_reservoir(config);

    SizeT non_zero = 0;
    for (const auto& row : model.weights) {
        non_zero += static_cast<SizeT>(std::count_if(row.begin(), row.end(),
            [](Real w) { return w != 0.0; }));
    }
    const Real density = static_cast<Real>(non_zero) / 10000.0;
    EXPECT_GT(density, 0.05);
    EXPECT_LT(density, 0.15);
}

TEST_F(ReservoirInitTest, SameSeedSameModel) {
    auto a = initialize_reservoir(config);
    auto b = initialize_reservoir(config);
    EXPECT_EQ(a.weights, b.weights);
    EXPECT_EQ(a.input_weights, b.input_weights);

    config.seed = 7;
    auto c = initialize_reservoir(config);
    EXPECT_NE(a.weights, c.weights);
}

TEST_F(ReservoirInitTest, ZeroSeedDrawsFreshSeed) {
    config.seed = 0;
    auto model = initialize_reservoir(config);
    EXPECT_NE(model.seed, 0u);
}

TEST(SpectralRadiusTest, ScalesByMaxRowSum) {
    std::vector<std::vector<Real>> weights{{1.0, -1.0}, {0.5, 0.0}};
    auto scaled = normalize_spectral_radius(weights, 1.0);

    EXPECT_DOUBLE_EQ(scaled[0][0], 0.5);
    EXPECT_DOUBLE_EQ(scaled[0][1], -0.5);
    EXPECT_DOUBLE_EQ(scaled[1][0], 0.25);
}

TEST(SpectralRadiusTest, ZeroMatrixUnchanged) {
    std::vector<std::vector<Real>> weights(3, std::vector<Real>(3, 0.0));
    EXPECT_EQ(normalize_spectral_radius(weights, 0.95), weights);
}

// ============================================================================
// Dynamics & Readout Tests
// ============================================================================

TEST(ReservoirDynamicsTest, LeakyTanhUpdate) {
    ReservoirModel model;
    model.weights = {{0.0}};
    model.input_weights = {{1.0, 0.0}};

    ForecastConfig config;
    config.input_scaling = 0.3;
    config.leaking_rate = 0.3;

    auto state = update_reservoir_state(model, {0.0}, {1.0, 0.5}, config);
    ASSERT_EQ(state.size(), 1u);
    EXPECT_NEAR(state[0], 0.3 * std::tanh(0.3), 1e-12);

    auto next = update_reservoir_state(model, state, {0.0, 0.0}, config);
    EXPECT_NEAR(next[0], 0.7 * state[0], 1e-12);
}

TEST(ReservoirDynamicsTest, StateStaysBounded) {
    ForecastConfig config;
    auto model = initialize_reservoir(config);
    std::vector<Real> state(model.size(), 0.0);

    for (int i = 0; i < 200; ++i) {
        state = update_reservoir_state(model, state, {5.0, 1.0}, config);
    }
    for (Real s : state) {
        EXPECT_LE(std::abs(s), 1.0);
    }
}

TEST(ReadoutTest, PerDimensionRidgeFormula) {
    std::vector<std::vector<Real>> states{{1.0, 0.0}, {2.0, 1.0}};
    std::vector<Real> targets{1.0, 2.0};

    auto exact = train_readout(states, targets, 0.0);
    ASSERT_EQ(exact.size(), 2u);
    EXPECT_DOUBLE_EQ(exact[0], 1.0);
    EXPECT_DOUBLE_EQ(exact[1], 2.0);

    auto ridge = train_readout(states, targets, 0.01);
    EXPECT_NEAR(ridge[0], 5.0 / 5.01, 1e-12);
    EXPECT_NEAR(ridge[1], 2.0 / 1.01, 1e-12);
}

TEST(ReadoutTest, EmptyOrMismatchedGivesZeros) {
    auto empty = train_readout({}, {});
    EXPECT_EQ(empty, std::vector<Real>(DEFAULT_READOUT_SIZE, 0.0));

    auto mismatched = train_readout({{1.0, 2.0, 3.0}}, {1.0, 2.0});
    EXPECT_EQ(mismatched, std::vector<Real>(3, 0.0));
}

TEST(ReadoutTest, PredictionClampedAtZero) {
    EXPECT_DOUBLE_EQ(predict_from_state({1.0}, {-2.0}), 0.0);
    EXPECT_DOUBLE_EQ(predict_from_state({1.0, 2.0}, {0.5, 0.25}), 1.0);
}

// ============================================================================
// Series Helper Tests
// ============================================================================

TEST(SeriesHelperTest, NormalizeUsesPopulationStd) {
    auto normalized = normalize_time_series({2.0, 4.0, 6.0});
    const Real expected_std = std::sqrt(8.0 / 3.0);

    EXPECT_DOUBLE_EQ(normalized.mean, 4.0);
    EXPECT_DOUBLE_EQ(normalized.std_dev, expected_std);
    ASSERT_EQ(normalized.values.size(), 3u);
    EXPECT_DOUBLE_EQ(normalized.values[0], -2.0 / expected_std);
    EXPECT_DOUBLE_EQ(normalized.values[1], 0.0);
    EXPECT_DOUBLE_EQ(denormalize(normalized.values[2], normalized.mean, normalized.std_dev), 6.0);
}

TEST(SeriesHelperTest, ConstantSeriesHasUnitStd) {
    auto normalized = normalize_time_series({5.0, 5.0, 5.0});
    EXPECT_DOUBLE_EQ(normalized.std_dev, 1.0);
    for (Real v : normalized.values) {
        EXPECT_DOUBLE_EQ(v, 0.0);
    }
}

TEST(SeriesHelperTest, EmptySeries) {
    auto normalized = normalize_time_series({});
    EXPECT_TRUE(normalized.values.empty());
    EXPECT_DOUBLE_EQ(normalized.mean, 0.0);
    EXPECT_DOUBLE_EQ(normalized.std_dev, 1.0);
}

TEST(SeriesHelperTest, Rmse) {
    EXPECT_DOUBLE_EQ(calculate_rmse({1.0, 2.0}, {1.0, 4.0}), std::sqrt(2.0));
    EXPECT_DOUBLE_EQ(calculate_rmse({}, {}), 0.0);
    EXPECT_DOUBLE_EQ(calculate_rmse({1.0}, {1.0, 2.0}), 0.0);
}

TEST(SeriesHelperTest, ShouldRetrain) {
    // RMSE is 2.0
    EXPECT_TRUE(should_retrain({0.0, 0.0}, {2.0, 2.0}, 1.0));
    EXPECT_FALSE(should_retrain({0.0, 0.0}, {2.0, 2.0}, 1.6));
    EXPECT_FALSE(should_retrain({0.0, 0.0}, {2.0, 2.0}, 1.0, 1.5));
}

TEST(SeriesHelperTest, ShouldRetrainUsesConfigThreshold) {
    auto config = ForecastConfig::default_config();
    EXPECT_TRUE(should_retrain({0.0, 0.0}, {2.0, 2.0}, 1.0, config));

    config.retrain_threshold = 1.5;
    EXPECT_FALSE(should_retrain({0.0, 0.0}, {2.0, 2.0}, 1.0, config));

    config.retrain_threshold = 0.0;
    EXPECT_TRUE(should_retrain({0.0, 0.0}, {2.0, 2.0}, 1.6, config));
}
