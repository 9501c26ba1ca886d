/**
 * @file risk_calculator_tests.cpp
 * @brief Unit tests for replenishment and risk rules
 */

#include <gtest/gtest.h>
#include "medstock/forecast/risk_calculator.h"
#include <algorithm>
#include <cmath>

using namespace medstock;
using namespace medstock::forecast;
using namespace medstock::inventory;

// ============================================================================
// Test Fixtures
// ============================================================================

class RiskCalculatorTest : public ::testing::Test {
protected:
    CalendarDate as_of = CalendarDate::from_ymd(2025, 1, 1);
    DrugProfile insulin{"Insulin Glargine", "Lantus", "100IU/ml"};
    ForecastConfig config = ForecastConfig::default_config();

    /// Flat daily demand starting from @p stock
    std::vector<PredictionPoint> make_predictions(Real stock, Real demand, UInt32 days) {
        std::vector<PredictionPoint> predictions;
        for (UInt32 day = 0; day < days; ++day) {
            stock = std::max(0.0, stock - demand);
            PredictionPoint point;
            point.date = as_of.add_days(static_cast<Int32>(day));
            point.predicted_demand = demand;
            point.stock_level = stock;
            predictions.push_back(point);
        }
        return predictions;
    }

    ExpiryWarning make_warning(Int32 days) {
        ExpiryWarning warning;
        warning.batch_id = "W";
        warning.expiry_date = as_of.add_days(days);
        warning.quantity = 10;
        warning.days_until_expiry = days;
        return warning;
    }

    InventoryBatch make_batch(const std::string& id, std::optional<CalendarDate> expiry) {
        InventoryBatch batch;
        batch.id = id;
        batch.profile = insulin;
        batch.batch_number = "LOT-" + id;
        batch.quantity = 10;
        batch.expiry_date = expiry;
        return batch;
    }
};

TEST(RiskEnumTest, ToString) {
    EXPECT_STREQ(risk_level_to_string(RiskLevel::Low), "low");
    EXPECT_STREQ(risk_level_to_string(RiskLevel::Medium), "medium");
    EXPECT_STREQ(risk_level_to_string(RiskLevel::High), "high");
    EXPECT_STREQ(risk_level_to_string(RiskLevel::Critical), "critical");
}

// ============================================================================
// Replenishment Tests
// ============================================================================

TEST_F(RiskCalculatorTest, SafetyStockFromVariability) {
    // mean 1, population std 1
    std::vector<Real> demand{0.0, 2.0};

    const Real high_service = 1.65 * std::sqrt(7.0) * 1.5;
    EXPECT_EQ(calculate_safety_stock(demand, 7, 0.95, config),
              static_cast<Quantity>(std::ceil(high_service)));

    const Real low_service = 1.28 * std::sqrt(7.0) * 1.5;
    EXPECT_EQ(calculate_safety_stock(demand, 7, 0.90, config),
              static_cast<Quantity>(std::ceil(low_service)));
}

TEST_F(RiskCalculatorTest, SafetyStockZeroForFlatOrEmptyDemand) {
    EXPECT_EQ(calculate_safety_stock({4.0, 4.0, 4.0}, 7, 0.95, config), 0);
    EXPECT_EQ(calculate_safety_stock({}, 7, 0.95, config), 0);
}

TEST_F(RiskCalculatorTest, SafetyStockScalesWithMultiplier) {
    std::vector<Real> demand{0.0, 2.0};
    auto conservative = ForecastConfig::conservative();
    EXPECT_GT(calculate_safety_stock(demand, 7, 0.95, conservative),
              calculate_safety_stock(demand, 7, 0.95, config));
}

TEST_F(RiskCalculatorTest, ReorderPointIsWeekOfDemandPlusSafety) {
    auto predictions = make_predictions(100.0, 2.0, 30);
    EXPECT_EQ(calculate_reorder_point(predictions, 5), 19);
}

TEST_F(RiskCalculatorTest, ReorderPointShortHorizon) {
    auto predictions = make_predictions(100.0, 3.0, 3);
    EXPECT_EQ(calculate_reorder_point(predictions, 0), 21);
    EXPECT_EQ(calculate_reorder_point({}, 4), 4);
}

TEST_F(RiskCalculatorTest, NextRestockDate) {
    auto predictions = make_predictions(50.0, 5.0, 30);
    // Stock after day index 5 is 20
    auto date = find_next_restock_date(predictions, 20);
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(*date, as_of.add_days(5));

    EXPECT_FALSE(find_next_restock_date(make_predictions(1000.0, 1.0, 30), 20).has_value());
}

// ============================================================================
// Expiry Tests
// ============================================================================

TEST_F(RiskCalculatorTest, ExpiryWarningsWithinWindow) {
    std::vector<InventoryBatch> batches{
        make_batch("far", as_of.add_days(120)),
        make_batch("soon", as_of.add_days(10)),
        make_batch("expired", as_of.add_days(-5)),
        make_batch("today", as_of),
        make_batch("undated", std::nullopt),
        make_batch("edge", as_of.add_days(89)),
        make_batch("out", as_of.add_days(90)),
    };

    auto warnings = check_expiry_warnings(batches, insulin, as_of);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0].batch_id, "soon");
    EXPECT_EQ(warnings[0].days_until_expiry, 10);
    EXPECT_EQ(warnings[0].batch_number, "LOT-soon");
    EXPECT_EQ(warnings[1].batch_id, "edge");
}

TEST_F(RiskCalculatorTest, ExpiryWarningsIgnoreOtherProfiles) {
    auto other = make_batch("other", as_of.add_days(10));
    other.profile.strength = "300IU/3ml";

    EXPECT_TRUE(check_expiry_warnings({other}, insulin, as_of).empty());
}

// ============================================================================
// Risk Level Tests
// ============================================================================

TEST_F(RiskCalculatorTest, CriticalWhenBelowReorderPoint) {
    auto predictions = make_predictions(5.0, 1.0, 30);
    EXPECT_EQ(calculate_risk_level(5.0, 20, predictions, {}), RiskLevel::Critical);
}

TEST_F(RiskCalculatorTest, CriticalWhenExpiringWithinMonth) {
    auto predictions = make_predictions(1000.0, 1.0, 30);
    EXPECT_EQ(calculate_risk_level(1000.0, 20, predictions, {make_warning(20)}), RiskLevel::Critical);
}

TEST_F(RiskCalculatorTest, HighWhenReorderPointReachedThisWeek) {
    auto predictions = make_predictions(30.0, 3.0, 30);  // 21 on day index 2
    EXPECT_EQ(calculate_risk_level(30.0, 21, predictions, {}), RiskLevel::High);
}

TEST_F(RiskCalculatorTest, HighWhenExpiringWithinTwoMonths) {
    auto predictions = make_predictions(1000.0, 1.0, 30);
    EXPECT_EQ(calculate_risk_level(1000.0, 20, predictions, {make_warning(45)}), RiskLevel::High);
}

TEST_F(RiskCalculatorTest, MediumWhenReorderPointReachedInTwoWeeks) {
    auto predictions = make_predictions(40.0, 2.0, 30);  // 20 after day index 9
    EXPECT_EQ(calculate_risk_level(40.0, 20, predictions, {}), RiskLevel::Medium);
}

TEST_F(RiskCalculatorTest, LowOtherwise) {
    auto predictions = make_predictions(1000.0, 1.0, 30);
    EXPECT_EQ(calculate_risk_level(1000.0, 20, predictions, {make_warning(75)}), RiskLevel::Low);
}

// ============================================================================
// Confidence & Score Tests
// ============================================================================

TEST_F(RiskCalculatorTest, ModelConfidence) {
    EXPECT_DOUBLE_EQ(calculate_model_confidence(0), 0.0);
    EXPECT_DOUBLE_EQ(calculate_model_confidence(15), 50.0);
    EXPECT_DOUBLE_EQ(calculate_model_confidence(30), 100.0);
    EXPECT_DOUBLE_EQ(calculate_model_confidence(365), 100.0);
}

TEST_F(RiskCalculatorTest, DaysUntilBetterAccuracy) {
    EXPECT_EQ(days_until_better_accuracy(30.0), 14);
    EXPECT_EQ(days_until_better_accuracy(60.0), 7);
    EXPECT_FALSE(days_until_better_accuracy(80.0).has_value());
}

TEST_F(RiskCalculatorTest, RiskScoreComponents) {
    ForecastResult forecast;
    forecast.risk_level = RiskLevel::Critical;
    forecast.next_restock_date = as_of.add_days(3);

    auto batch = make_batch("B", as_of.add_days(25));
    EXPECT_EQ(calculate_risk_score(forecast, batch, as_of), 100);

    forecast.risk_level = RiskLevel::Medium;
    forecast.next_restock_date = as_of.add_days(20);
    batch.expiry_date = as_of.add_days(75);
    EXPECT_EQ(calculate_risk_score(forecast, batch, as_of), 40);

    forecast.risk_level = RiskLevel::Low;
    forecast.next_restock_date.reset();
    EXPECT_EQ(calculate_risk_score(forecast, std::nullopt, as_of), 10);
}
