/**
 * @file demand_history.cpp
 * @brief Implementation of the daily demand aggregator
 */

#include "medstock/forecast/demand_history.h"
#include <algorithm>
#include <map>
#include <optional>
#include <unordered_set>

namespace medstock::forecast {

std::vector<DemandPoint> build_daily_series(const std::vector<inventory::StockMovement>& movements,
                                            const std::vector<inventory::InventoryBatch>& batches,
                                            const inventory::DrugProfile& profile) {
    std::unordered_set<BatchId> batch_ids;
    std::optional<CalendarDate> reference_expiry;

    for (const auto& batch : batches) {
        if (!batch.matches(profile)) {
            continue;
        }
        batch_ids.insert(batch.id);
        if (batch.expiry_date && (!reference_expiry || *batch.expiry_date > *reference_expiry)) {
            reference_expiry = batch.expiry_date;
        }
    }

    if (batch_ids.empty()) {
        return {};
    }

    // std::map keeps days in ascending order
    std::map<CalendarDate, Real> volume_by_day;
    for (const auto& movement : movements) {
        if (movement.type != inventory::MovementType::Out) {
            continue;
        }
        if (batch_ids.count(movement.inventory_item_id) == 0) {
            continue;
        }
        volume_by_day[movement.date] += static_cast<Real>(movement.quantity);
    }

    std::vector<DemandPoint> series;
    series.reserve(volume_by_day.size());
    for (const auto& [date, volume] : volume_by_day) {
        DemandPoint point;
        point.date = date;
        point.stock_out_volume = volume;
        point.remaining_shelf_life = reference_expiry
            ? std::max<Int32>(0, date.days_until(*reference_expiry))
            : DEFAULT_SHELF_LIFE_DAYS;
        series.push_back(point);
    }

    return series;
}

std::vector<Real> demand_values(const std::vector<DemandPoint>& series) {
    std::vector<Real> values;
    values.reserve(series.size());
    for (const auto& point : series) {
        values.push_back(point.stock_out_volume);
    }
    return values;
}

Real total_stock_out(const std::vector<DemandPoint>& series) {
    Real total = 0.0;
    for (const auto& point : series) {
        total += point.stock_out_volume;
    }
    return total;
}

} // namespace medstock::forecast
