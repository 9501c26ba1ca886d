#pragma once
/**
 * @file forecast_types.h
 * @brief Value types for demand forecasting and stock risk assessment
 *
 * This file provides the configuration, intermediate series and result types
 * shared by the demand aggregator, regime classifier, reservoir forecaster and
 * risk calculator.
 *
 * Key features:
 * - Immutable per-call forecast configuration with presets
 * - Daily demand series with shelf-life annotation
 * - Markov activity regime with transition counts
 * - Reservoir (Echo State Network) model state
 * - Forecast results with risk level and expiry warnings
 */

#include "medstock/core/types.h"
#include "medstock/core/date.h"
#include "medstock/inventory/inventory_types.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace medstock::forecast {

// ============================================================================
// Activity Regime Enum
// ============================================================================

/**
 * @brief Coarse classification of recent demand intensity
 */
enum class ActivityRegime : UInt8 {
    LowActivity,     ///< Mean daily demand < 3
    NormalActivity,  ///< Mean daily demand < 8
    HighActivity     ///< Mean daily demand >= 8
};

/**
 * @brief Convert ActivityRegime to string
 */
inline const char* activity_regime_to_string(ActivityRegime regime) {
    switch (regime) {
        case ActivityRegime::LowActivity: return "low_activity";
        case ActivityRegime::NormalActivity: return "normal_activity";
        case ActivityRegime::HighActivity: return "high_activity";
        default: return "unknown";
    }
}

// ============================================================================
// Risk Level Enum
// ============================================================================

/**
 * @brief Ordinal stock risk for a drug profile
 */
enum class RiskLevel : UInt8 {
    Low,
    Medium,
    High,
    Critical
};

/**
 * @brief Convert RiskLevel to string
 */
inline const char* risk_level_to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low: return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High: return "high";
        case RiskLevel::Critical: return "critical";
        default: return "unknown";
    }
}

// ============================================================================
// Forecast Method Enum
// ============================================================================

/**
 * @brief Which predictor produced a forecast
 */
enum class ForecastMethod : UInt8 {
    Reservoir,  ///< Echo State Network rollout
    Fallback    ///< Flat mean demand (fewer than 3 history days)
};

/**
 * @brief Convert ForecastMethod to string
 */
inline const char* forecast_method_to_string(ForecastMethod method) {
    switch (method) {
        case ForecastMethod::Reservoir: return "Reservoir";
        case ForecastMethod::Fallback: return "Fallback";
        default: return "Unknown";
    }
}

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Configuration for demand forecasting
 *
 * Passed by value into every call; the library never mutates a shared
 * default.
 */
struct ForecastConfig {
    SizeT reservoir_size{50};            ///< Reservoir neurons (N)
    Real spectral_radius{0.95};          ///< Target spectral radius of W
    Real input_scaling{0.3};             ///< Scale of the input projection
    Real leaking_rate{0.3};              ///< Leaky integrator rate (0-1]
    Real safety_stock_multiplier{1.5};   ///< Multiplier on safety stock
    UInt32 forecast_horizon{30};         ///< Days to forecast
    Real retrain_threshold{0.5};         ///< RMSE increase that triggers retraining
    Real ridge_regularization{0.01};     ///< Readout ridge term (lambda)
    UInt32 lead_time_days{7};            ///< Supplier lead time
    Real service_level{0.95};            ///< Target cycle service level
    UInt64 seed{42};                     ///< Reservoir RNG seed (0 = random)

    /**
     * @brief Create default configuration
     */
    static ForecastConfig default_config() noexcept {
        return ForecastConfig{};
    }

    /**
     * @brief Create configuration for new clinics with very little history
     */
    static ForecastConfig low_data() noexcept {
        ForecastConfig config;
        config.reservoir_size = 20;
        config.forecast_horizon = 14;
        return config;
    }

    /**
     * @brief Create configuration that holds more buffer stock
     */
    static ForecastConfig conservative() noexcept {
        ForecastConfig config;
        config.safety_stock_multiplier = 2.0;
        config.service_level = 0.99;
        config.lead_time_days = 14;
        return config;
    }

    /**
     * @brief Create configuration for quarterly planning
     */
    static ForecastConfig long_horizon() noexcept {
        ForecastConfig config;
        config.forecast_horizon = 90;
        config.reservoir_size = 100;
        return config;
    }
};

/**
 * @brief Check that configuration values are within usable ranges
 */
inline bool validate_forecast_config(const ForecastConfig& config) {
    if (config.reservoir_size == 0) return false;
    if (config.spectral_radius <= 0.0 || config.spectral_radius >= 1.5) return false;
    if (config.input_scaling < 0.0) return false;
    if (config.leaking_rate <= 0.0 || config.leaking_rate > 1.0) return false;
    if (config.safety_stock_multiplier < 0.0) return false;
    if (config.forecast_horizon == 0) return false;
    if (config.retrain_threshold < 0.0) return false;
    if (config.ridge_regularization < 0.0) return false;
    if (config.service_level <= 0.0 || config.service_level >= 1.0) return false;
    return true;
}

// ============================================================================
// Series & Model State
// ============================================================================

/**
 * @brief Outbound volume of one drug profile on one calendar day
 */
struct DemandPoint {
    CalendarDate date;
    Real stock_out_volume{0.0};     ///< Sum of OUT quantities that day
    Int32 remaining_shelf_life{0};  ///< Days to reference expiry (>= 0)
};

/**
 * @brief Activity regime with Markov transition bookkeeping
 */
struct MarkovState {
    ActivityRegime current{ActivityRegime::LowActivity};
    std::map<std::string, UInt32> transition_counts;  ///< "<from>_to_<to>" -> count
    UInt32 consecutive_days{0};                       ///< Streak length of current
};

/**
 * @brief Echo State Network weights and state
 *
 * The reservoir and input projection are fixed after initialization; only
 * the readout is trained.
 */
struct ReservoirModel {
    std::vector<std::vector<Real>> weights;        ///< N x N recurrent weights
    std::vector<std::vector<Real>> input_weights;  ///< N x INPUT_FEATURES projection
    std::vector<Real> state;                       ///< Current activation (N)
    std::vector<Real> readout_weights;             ///< Readout coefficients (N)
    Real mean{0.0};                                ///< Training series mean
    Real std_dev{1.0};                             ///< Training series std
    Real last_error{0.0};                          ///< Training RMSE (normalized units)
    SizeT training_samples{0};
    UInt64 seed{0};                                ///< Seed actually used

    /// Demand value and time position
    static constexpr SizeT INPUT_FEATURES = 2;

    SizeT size() const { return weights.size(); }
};

// ============================================================================
// Forecast Results
// ============================================================================

/**
 * @brief Forecast for one future day
 */
struct PredictionPoint {
    CalendarDate date;
    Real predicted_demand{0.0};
    Real confidence_lower{0.0};
    Real confidence_upper{0.0};
    Real stock_level{0.0};          ///< Projected stock after this day's demand
};

/**
 * @brief Batch approaching expiry
 */
struct ExpiryWarning {
    BatchId batch_id;
    std::string batch_number;
    CalendarDate expiry_date;
    Quantity quantity{0};
    Int32 days_until_expiry{0};
};

/**
 * @brief Demand forecast and stock risk for one drug profile
 */
struct ForecastResult {
    inventory::DrugProfile profile;
    BatchId drug_id;                               ///< Representative (first) batch
    Quantity current_stock{0};
    std::vector<PredictionPoint> predictions;
    Quantity safety_stock{0};
    Quantity reorder_point{0};
    std::vector<ExpiryWarning> expiry_warnings;    ///< Ascending by days_until_expiry
    std::optional<CalendarDate> next_restock_date;
    RiskLevel risk_level{RiskLevel::Low};
    Real model_confidence{0.0};                    ///< 0-100
    MarkovState markov_state;
    ForecastMethod method{ForecastMethod::Fallback};
    SizeT history_days{0};
    std::optional<ReservoirModel> model;           ///< Trained model (reservoir path)
};

/**
 * @brief Forecast ranked for attention
 */
struct RiskAssessment {
    ForecastResult forecast;
    std::optional<inventory::InventoryBatch> most_critical_batch;  ///< Earliest expiry
    Int32 risk_score{0};                                           ///< 0-100
};

} // namespace medstock::forecast
