#pragma once
/**
 * @file demand_history.h
 * @brief Daily outbound demand series per drug profile
 *
 * Stock movements are recorded per batch. Forecasting works per drug profile,
 * so OUT movements of every batch of the profile are summed per calendar day.
 *
 * Each day is annotated with the remaining shelf life of the latest-expiring
 * batch currently held. This is an optimistic reference: it assumes the
 * freshest stock is what will ultimately be consumed.
 */

#include "medstock/forecast/forecast_types.h"
#include "medstock/inventory/inventory_types.h"
#include <vector>

namespace medstock::forecast {

/**
 * @brief Build the daily demand series of a drug profile
 * @param movements Historical stock movements (any order)
 * @param batches Current inventory batches
 * @param profile Drug profile to aggregate
 * @return One point per day with OUT activity, ascending by date; empty when
 *         no batch matches the profile
 */
std::vector<DemandPoint> build_daily_series(const std::vector<inventory::StockMovement>& movements,
                                            const std::vector<inventory::InventoryBatch>& batches,
                                            const inventory::DrugProfile& profile);

/**
 * @brief Stock-out volumes of a series, in order
 */
std::vector<Real> demand_values(const std::vector<DemandPoint>& series);

/**
 * @brief Sum of stock-out volume over a series
 */
Real total_stock_out(const std::vector<DemandPoint>& series);

} // namespace medstock::forecast
