#pragma once
/**
 * @file risk_calculator.h
 * @brief Safety stock, reorder point and stock risk rules
 *
 * Turns a demand forecast and the expiry profile of current holdings into
 * replenishment figures and an ordinal risk level.
 */

#include "medstock/forecast/forecast_types.h"
#include "medstock/inventory/inventory_types.h"
#include <optional>
#include <vector>

namespace medstock::forecast {

/// Batches expiring within this many days raise a warning
constexpr Int32 EXPIRY_WARNING_DAYS = 90;

/// Days of demand covered by the reorder point
constexpr SizeT REORDER_WINDOW_DAYS = 7;

/// Confidence reported by the fallback forecast
constexpr Real FALLBACK_MODEL_CONFIDENCE = 30.0;

/// History length at which the reservoir reaches full confidence
constexpr Real FULL_CONFIDENCE_HISTORY_DAYS = 30.0;

// ============================================================================
// Replenishment
// ============================================================================

/**
 * @brief Safety stock from forecast variability
 *
 * ceil(z * stddev * sqrt(lead_time_days) * safety_stock_multiplier), with
 * z = 1.65 for service levels >= 0.95 and 1.28 below.
 *
 * @return 0 for an empty forecast
 */
Quantity calculate_safety_stock(const std::vector<Real>& predicted_demand,
                                UInt32 lead_time_days,
                                Real service_level,
                                const ForecastConfig& config);

/**
 * @brief Reorder point: a week of forecast demand plus safety stock
 *
 * Uses the mean of the first seven predicted days (fewer if the horizon is
 * shorter).
 */
Quantity calculate_reorder_point(const std::vector<PredictionPoint>& predictions,
                                 Quantity safety_stock);

/**
 * @brief First day whose projected stock is at or below the reorder point
 */
std::optional<CalendarDate> find_next_restock_date(const std::vector<PredictionPoint>& predictions,
                                                   Quantity reorder_point);

// ============================================================================
// Expiry & Risk
// ============================================================================

/**
 * @brief Batches of a profile expiring in 1-89 days, soonest first
 *
 * Undated and already expired batches raise no warning.
 */
std::vector<ExpiryWarning> check_expiry_warnings(const std::vector<inventory::InventoryBatch>& batches,
                                                 const inventory::DrugProfile& profile,
                                                 const CalendarDate& as_of);

/**
 * @brief Ordinal risk level
 *
 * Evaluated in order:
 * - Critical: stock below reorder point, or a batch expires within 30 days
 * - High: reorder point reached within 7 days, or a batch expires within 60 days
 * - Medium: reorder point reached within 14 days
 * - Low: otherwise
 */
RiskLevel calculate_risk_level(Real current_stock,
                               Quantity reorder_point,
                               const std::vector<PredictionPoint>& predictions,
                               const std::vector<ExpiryWarning>& expiry_warnings);

/**
 * @brief Confidence of the reservoir path from history length (0-100)
 */
inline Real calculate_model_confidence(SizeT history_days) {
    Real confidence = static_cast<Real>(history_days) / FULL_CONFIDENCE_HISTORY_DAYS * 100.0;
    return confidence < 100.0 ? confidence : 100.0;
}

/**
 * @brief Composite attention score (0-100)
 *
 * Risk level contributes 40/30/20/10, the earliest batch expiring within
 * 30/60/90 days adds 30/20/10 and a restock due within 7/14/21 days adds
 * 30/20/10.
 *
 * @param forecast Forecast to score
 * @param most_critical_batch Batch with the earliest expiry, if any
 * @param as_of Reference day
 */
Int32 calculate_risk_score(const ForecastResult& forecast,
                           const std::optional<inventory::InventoryBatch>& most_critical_batch,
                           const CalendarDate& as_of);

/**
 * @brief Days of additional history expected before accuracy improves
 * @return nullopt once confidence reaches 80
 */
inline std::optional<Int32> days_until_better_accuracy(Real model_confidence) {
    if (model_confidence >= 80.0) return std::nullopt;
    if (model_confidence >= 50.0) return 7;
    return 14;
}

} // namespace medstock::forecast
