#pragma once
/**
 * @file demand_forecaster.h
 * @brief Expiry-aware demand forecasting per drug profile
 *
 * Combines the demand aggregator, regime classifier, reservoir predictor and
 * risk rules into one forecast per drug profile. Profiles with fewer than
 * three days of recorded demand get a flat mean-demand forecast with reduced
 * confidence instead of a reservoir rollout.
 *
 * The forecaster holds only its immutable configuration. Every call is a pure
 * computation over the collections passed in, so forecasts for different
 * profiles may run concurrently.
 *
 * Example usage:
 * @code
 * DemandForecaster forecaster(ForecastConfig::default_config());
 * auto result = forecaster.forecast(profile, batches, movements, CalendarDate::today());
 * if (result && result->risk_level == RiskLevel::Critical) {
 *     // reorder now
 * }
 *
 * auto ranked = rank_at_risk(forecaster.forecast_all(batches, movements, today),
 *                            batches, today);
 * @endcode
 */

#include "medstock/forecast/forecast_types.h"
#include "medstock/inventory/inventory_types.h"
#include <optional>
#include <vector>

namespace medstock::forecast {

/// Minimum number of demand days for the reservoir path
constexpr SizeT MIN_RESERVOIR_HISTORY_DAYS = 3;

/// Default number of profiles returned by rank_at_risk
constexpr SizeT DEFAULT_AT_RISK_COUNT = 6;

/**
 * @brief Demand forecaster for drug profiles
 */
class DemandForecaster {
public:
    /**
     * @brief Construct forecaster with configuration
     * @param config Forecast configuration (copied)
     * @throws std::invalid_argument if validate_forecast_config() rejects @p config
     */
    explicit DemandForecaster(const ForecastConfig& config = ForecastConfig::default_config());

    /**
     * @brief Forecast demand and stock risk for one drug profile
     * @param profile Drug profile to forecast
     * @param batches Current inventory batches
     * @param movements Historical stock movements
     * @param as_of First forecast day; reference day for expiry
     * @param previous_state Regime state from the previous call, if any
     * @param stored_model Previously initialized reservoir to reuse, if any
     * @return Forecast, or nullopt when no batch matches the profile
     */
    std::optional<ForecastResult> forecast(
        const inventory::DrugProfile& profile,
        const std::vector<inventory::InventoryBatch>& batches,
        const std::vector<inventory::StockMovement>& movements,
        const CalendarDate& as_of,
        const std::optional<MarkovState>& previous_state = std::nullopt,
        const std::optional<ReservoirModel>& stored_model = std::nullopt) const;

    /**
     * @brief Forecast every drug profile present in @p batches
     * @return One forecast per drug group, in first-seen order
     */
    std::vector<ForecastResult> forecast_all(
        const std::vector<inventory::InventoryBatch>& batches,
        const std::vector<inventory::StockMovement>& movements,
        const CalendarDate& as_of) const;

    /**
     * @brief Get current configuration
     */
    const ForecastConfig& get_config() const { return config_; }

private:
    ForecastResult forecast_with_reservoir(
        const inventory::DrugProfile& profile,
        const std::vector<inventory::InventoryBatch>& batches,
        const std::vector<DemandPoint>& series,
        Quantity current_stock,
        const CalendarDate& as_of,
        const std::optional<MarkovState>& previous_state,
        const std::optional<ReservoirModel>& stored_model) const;

    ForecastResult forecast_with_fallback(
        const inventory::DrugProfile& profile,
        const std::vector<inventory::InventoryBatch>& batches,
        const std::vector<DemandPoint>& series,
        Quantity current_stock,
        const CalendarDate& as_of,
        const std::optional<MarkovState>& previous_state) const;

    ForecastConfig config_;
};

// ============================================================================
// Free Functions
// ============================================================================

/**
 * @brief Forecast one drug profile with the given configuration
 * @see DemandForecaster::forecast
 */
std::optional<ForecastResult> generate_forecast(
    const inventory::DrugProfile& profile,
    const std::vector<inventory::InventoryBatch>& batches,
    const std::vector<inventory::StockMovement>& movements,
    const ForecastConfig& config,
    const CalendarDate& as_of,
    const std::optional<ReservoirModel>& stored_model = std::nullopt);

/**
 * @brief Batch of a profile with the earliest expiry (undated last)
 */
std::optional<inventory::InventoryBatch> find_most_critical_batch(
    const std::vector<inventory::InventoryBatch>& batches,
    const inventory::DrugProfile& profile);

/**
 * @brief Rank forecasts by composite risk score
 * @param forecasts Forecasts to rank
 * @param batches Inventory used to find each profile's most critical batch
 * @param as_of Reference day
 * @param top_n Maximum number of assessments returned
 * @return Assessments with a positive score, highest first
 */
std::vector<RiskAssessment> rank_at_risk(const std::vector<ForecastResult>& forecasts,
                                         const std::vector<inventory::InventoryBatch>& batches,
                                         const CalendarDate& as_of,
                                         SizeT top_n = DEFAULT_AT_RISK_COUNT);

} // namespace medstock::forecast
