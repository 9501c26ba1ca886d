/**
 * @file risk_calculator.cpp
 * @brief Implementation of replenishment and risk rules
 */

#include "medstock/forecast/risk_calculator.h"
#include <algorithm>
#include <cmath>

namespace medstock::forecast {

namespace {

bool reaches_reorder_point_within(const std::vector<PredictionPoint>& predictions,
                                  Quantity reorder_point,
                                  SizeT days) {
    const SizeT n = std::min(days, predictions.size());
    for (SizeT i = 0; i < n; ++i) {
        if (predictions[i].stock_level <= static_cast<Real>(reorder_point)) {
            return true;
        }
    }
    return false;
}

bool any_expiry_within(const std::vector<ExpiryWarning>& warnings, Int32 days) {
    return std::any_of(warnings.begin(), warnings.end(),
        [days](const ExpiryWarning& w) { return w.days_until_expiry < days; });
}

} // anonymous namespace

// ============================================================================
// Replenishment
// ============================================================================

Quantity calculate_safety_stock(const std::vector<Real>& predicted_demand,
                                UInt32 lead_time_days,
                                Real service_level,
                                const ForecastConfig& config) {
    if (predicted_demand.empty()) {
        return 0;
    }

    const Real count = static_cast<Real>(predicted_demand.size());
    Real sum = 0.0;
    for (Real p : predicted_demand) {
        sum += p;
    }
    const Real mean = sum / count;

    Real variance = 0.0;
    for (Real p : predicted_demand) {
        variance += (p - mean) * (p - mean);
    }
    const Real std_dev = std::sqrt(variance / count);

    const Real z_score = service_level >= 0.95 ? 1.65 : 1.28;
    const Real safety_stock = z_score * std_dev * std::sqrt(static_cast<Real>(lead_time_days)) *
                              config.safety_stock_multiplier;

    return static_cast<Quantity>(std::ceil(safety_stock));
}

Quantity calculate_reorder_point(const std::vector<PredictionPoint>& predictions,
                                 Quantity safety_stock) {
    const SizeT window = std::min(REORDER_WINDOW_DAYS, predictions.size());
    Real average_daily_demand = 0.0;
    if (window > 0) {
        for (SizeT i = 0; i < window; ++i) {
            average_daily_demand += predictions[i].predicted_demand;
        }
        average_daily_demand /= static_cast<Real>(window);
    }

    return static_cast<Quantity>(std::ceil(
        average_daily_demand * static_cast<Real>(REORDER_WINDOW_DAYS) +
        static_cast<Real>(safety_stock)));
}

std::optional<CalendarDate> find_next_restock_date(const std::vector<PredictionPoint>& predictions,
                                                   Quantity reorder_point) {
    for (const auto& point : predictions) {
        if (point.stock_level <= static_cast<Real>(reorder_point)) {
            return point.date;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Expiry & Risk
// ============================================================================

std::vector<ExpiryWarning> check_expiry_warnings(const std::vector<inventory::InventoryBatch>& batches,
                                                 const inventory::DrugProfile& profile,
                                                 const CalendarDate& as_of) {
    std::vector<ExpiryWarning> warnings;

    for (const auto& batch : batches) {
        if (!batch.matches(profile) || !batch.expiry_date) {
            continue;
        }
        const Int32 days = as_of.days_until(*batch.expiry_date);
        if (days > 0 && days < EXPIRY_WARNING_DAYS) {
            warnings.push_back(ExpiryWarning{
                batch.id,
                batch.batch_number,
                *batch.expiry_date,
                batch.quantity,
                days
            });
        }
    }

    std::stable_sort(warnings.begin(), warnings.end(),
        [](const ExpiryWarning& a, const ExpiryWarning& b) {
            return a.days_until_expiry < b.days_until_expiry;
        });
    return warnings;
}

RiskLevel calculate_risk_level(Real current_stock,
                               Quantity reorder_point,
                               const std::vector<PredictionPoint>& predictions,
                               const std::vector<ExpiryWarning>& expiry_warnings) {
    if (current_stock < static_cast<Real>(reorder_point) || any_expiry_within(expiry_warnings, 30)) {
        return RiskLevel::Critical;
    }

    if (reaches_reorder_point_within(predictions, reorder_point, 7) ||
        any_expiry_within(expiry_warnings, 60)) {
        return RiskLevel::High;
    }

    if (reaches_reorder_point_within(predictions, reorder_point, 14)) {
        return RiskLevel::Medium;
    }

    return RiskLevel::Low;
}

Int32 calculate_risk_score(const ForecastResult& forecast,
                           const std::optional<inventory::InventoryBatch>& most_critical_batch,
                           const CalendarDate& as_of) {
    Int32 score = 0;

    switch (forecast.risk_level) {
        case RiskLevel::Critical: score += 40; break;
        case RiskLevel::High: score += 30; break;
        case RiskLevel::Medium: score += 20; break;
        case RiskLevel::Low: score += 10; break;
    }

    if (most_critical_batch && most_critical_batch->expiry_date) {
        const Int32 days = as_of.days_until(*most_critical_batch->expiry_date);
        if (days <= 30) {
            score += 30;
        } else if (days <= 60) {
            score += 20;
        } else if (days <= 90) {
            score += 10;
        }
    }

    if (forecast.next_restock_date) {
        const Int32 days = as_of.days_until(*forecast.next_restock_date);
        if (days <= 7) {
            score += 30;
        } else if (days <= 14) {
            score += 20;
        } else if (days <= 21) {
            score += 10;
        }
    }

    return score;
}

} // namespace medstock::forecast
