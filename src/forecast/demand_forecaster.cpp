/**
 * @file demand_forecaster.cpp
 * @brief Implementation of expiry-aware demand forecasting
 */

#include "medstock/forecast/demand_forecaster.h"
#include "medstock/forecast/demand_history.h"
#include "medstock/forecast/regime_classifier.h"
#include "medstock/forecast/reservoir.h"
#include "medstock/forecast/risk_calculator.h"
#include "medstock/inventory/drug_grouping.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace medstock::forecast {

namespace {

/// Half-width of the reservoir confidence band, in training std units
constexpr Real RESERVOIR_BAND_WIDTH = 0.2;

/// Half-width of the fallback confidence band, relative to demand
constexpr Real FALLBACK_BAND_WIDTH = 0.5;

Real round_to_tenth(Real value) {
    return std::round(value * 10.0) / 10.0;
}

bool is_usable_model(const ReservoirModel& model) {
    if (model.size() == 0 || model.input_weights.size() != model.size()) {
        return false;
    }
    return std::all_of(model.weights.begin(), model.weights.end(),
        [&](const std::vector<Real>& row) { return row.size() == model.size(); });
}

std::vector<Real> predicted_demands(const std::vector<PredictionPoint>& predictions) {
    std::vector<Real> values;
    values.reserve(predictions.size());
    for (const auto& point : predictions) {
        values.push_back(point.predicted_demand);
    }
    return values;
}

} // anonymous namespace

// ============================================================================
// DemandForecaster Implementation
// ============================================================================

DemandForecaster::DemandForecaster(const ForecastConfig& config)
    : config_(config) {
    if (!validate_forecast_config(config_)) {
        throw std::invalid_argument("Invalid forecast configuration");
    }
}

std::optional<ForecastResult> DemandForecaster::forecast(
    const inventory::DrugProfile& profile,
    const std::vector<inventory::InventoryBatch>& batches,
    const std::vector<inventory::StockMovement>& movements,
    const CalendarDate& as_of,
    const std::optional<MarkovState>& previous_state,
    const std::optional<ReservoirModel>& stored_model) const {

    auto matching = inventory::batches_for_profile(batches, profile);
    if (matching.empty()) {
        return std::nullopt;
    }

    Quantity current_stock = 0;
    for (const auto& batch : matching) {
        current_stock += batch.quantity;
    }

    auto series = build_daily_series(movements, matching, profile);

    ForecastResult result = series.size() < MIN_RESERVOIR_HISTORY_DAYS
        ? forecast_with_fallback(profile, matching, series, current_stock, as_of, previous_state)
        : forecast_with_reservoir(profile, matching, series, current_stock, as_of,
                                  previous_state, stored_model);

    result.profile = profile;
    result.drug_id = matching.front().id;
    result.current_stock = current_stock;
    result.history_days = series.size();
    return result;
}

std::vector<ForecastResult> DemandForecaster::forecast_all(
    const std::vector<inventory::InventoryBatch>& batches,
    const std::vector<inventory::StockMovement>& movements,
    const CalendarDate& as_of) const {

    std::vector<ForecastResult> forecasts;
    for (const auto& group : inventory::group_inventory_by_drug(batches)) {
        auto result = forecast(group.profile, batches, movements, as_of);
        if (result) {
            forecasts.push_back(std::move(*result));
        }
    }
    return forecasts;
}

ForecastResult DemandForecaster::forecast_with_reservoir(
    const inventory::DrugProfile& profile,
    const std::vector<inventory::InventoryBatch>& batches,
    const std::vector<DemandPoint>& series,
    Quantity current_stock,
    const CalendarDate& as_of,
    const std::optional<MarkovState>& previous_state,
    const std::optional<ReservoirModel>& stored_model) const {

    ForecastResult result;
    result.method = ForecastMethod::Reservoir;
    result.markov_state = detect_markov_state(series, previous_state);

    const NormalizedSeries normalized = normalize_time_series(demand_values(series));
    const SizeT n = normalized.values.size();

    ReservoirModel model = (stored_model && is_usable_model(*stored_model))
        ? *stored_model
        : initialize_reservoir(config_);
    model.mean = normalized.mean;
    model.std_dev = normalized.std_dev;

    // Drive the reservoir with observed history: state after day i predicts day i + 1
    std::vector<Real> state(model.size(), 0.0);
    std::vector<std::vector<Real>> state_history;
    std::vector<Real> target_history;
    state_history.reserve(n - 1);
    target_history.reserve(n - 1);

    for (SizeT i = 0; i + 1 < n; ++i) {
        const std::vector<Real> input{
            normalized.values[i],
            static_cast<Real>(i) / static_cast<Real>(n)
        };
        state = update_reservoir_state(model, state, input, config_);
        state_history.push_back(state);
        target_history.push_back(normalized.values[i + 1]);
    }

    model.readout_weights = train_readout(state_history, target_history, config_.ridge_regularization);
    model.state = state;
    model.training_samples = state_history.size();

    std::vector<Real> fitted;
    fitted.reserve(state_history.size());
    for (const auto& s : state_history) {
        fitted.push_back(predict_from_state(s, model.readout_weights));
    }
    model.last_error = calculate_rmse(fitted, target_history);

    // Roll the forecast forward, feeding each prediction back in
    const Real band = normalized.std_dev * RESERVOIR_BAND_WIDTH;
    const Real horizon = static_cast<Real>(config_.forecast_horizon);
    Real stock = static_cast<Real>(current_stock);

    result.predictions.reserve(config_.forecast_horizon);
    for (UInt32 day = 0; day < config_.forecast_horizon; ++day) {
        const Real normalized_prediction = predict_from_state(state, model.readout_weights);
        const Real demand = std::max(0.0, denormalize(normalized_prediction,
                                                      normalized.mean, normalized.std_dev));
        stock = std::max(0.0, stock - demand);

        PredictionPoint point;
        point.date = as_of.add_days(static_cast<Int32>(day));
        point.predicted_demand = round_to_tenth(demand);
        point.confidence_lower = std::max(0.0, demand - band);
        point.confidence_upper = demand + band;
        point.stock_level = round_to_tenth(stock);
        result.predictions.push_back(point);

        const std::vector<Real> next_input{
            normalized_prediction,
            (static_cast<Real>(n) + static_cast<Real>(day)) / (static_cast<Real>(n) + horizon)
        };
        state = update_reservoir_state(model, state, next_input, config_);
    }

    result.safety_stock = calculate_safety_stock(predicted_demands(result.predictions),
                                                 config_.lead_time_days,
                                                 config_.service_level,
                                                 config_);
    result.reorder_point = calculate_reorder_point(result.predictions, result.safety_stock);
    result.expiry_warnings = check_expiry_warnings(batches, profile, as_of);
    result.next_restock_date = find_next_restock_date(result.predictions, result.reorder_point);
    result.risk_level = calculate_risk_level(static_cast<Real>(current_stock),
                                             result.reorder_point,
                                             result.predictions,
                                             result.expiry_warnings);
    result.model_confidence = calculate_model_confidence(series.size());
    result.model = std::move(model);
    return result;
}

ForecastResult DemandForecaster::forecast_with_fallback(
    const inventory::DrugProfile& profile,
    const std::vector<inventory::InventoryBatch>& batches,
    const std::vector<DemandPoint>& series,
    Quantity current_stock,
    const CalendarDate& as_of,
    const std::optional<MarkovState>& previous_state) const {

    ForecastResult result;
    result.method = ForecastMethod::Fallback;
    // No model ran, so no regime is observed and no transition is counted
    result.markov_state = MarkovState{};
    if (previous_state) {
        result.markov_state.transition_counts = previous_state->transition_counts;
    }

    // New items are assumed to move at least one unit a day
    const Real average_demand = series.empty()
        ? 1.0
        : total_stock_out(series) / static_cast<Real>(series.size());

    Real stock = static_cast<Real>(current_stock);
    result.predictions.reserve(config_.forecast_horizon);
    for (UInt32 day = 0; day < config_.forecast_horizon; ++day) {
        stock = std::max(0.0, stock - average_demand);

        PredictionPoint point;
        point.date = as_of.add_days(static_cast<Int32>(day));
        point.predicted_demand = average_demand;
        point.confidence_lower = average_demand * (1.0 - FALLBACK_BAND_WIDTH);
        point.confidence_upper = average_demand * (1.0 + FALLBACK_BAND_WIDTH);
        point.stock_level = stock;
        result.predictions.push_back(point);
    }

    result.safety_stock = static_cast<Quantity>(std::ceil(
        average_demand * static_cast<Real>(config_.lead_time_days) * config_.safety_stock_multiplier));
    result.reorder_point = static_cast<Quantity>(std::ceil(
        average_demand * static_cast<Real>(REORDER_WINDOW_DAYS) + static_cast<Real>(result.safety_stock)));
    result.expiry_warnings = check_expiry_warnings(batches, profile, as_of);
    result.next_restock_date = find_next_restock_date(result.predictions, result.reorder_point);
    result.risk_level = calculate_risk_level(static_cast<Real>(current_stock),
                                             result.reorder_point,
                                             result.predictions,
                                             result.expiry_warnings);
    result.model_confidence = FALLBACK_MODEL_CONFIDENCE;
    return result;
}

// ============================================================================
// Free Functions
// ============================================================================

std::optional<ForecastResult> generate_forecast(
    const inventory::DrugProfile& profile,
    const std::vector<inventory::InventoryBatch>& batches,
    const std::vector<inventory::StockMovement>& movements,
    const ForecastConfig& config,
    const CalendarDate& as_of,
    const std::optional<ReservoirModel>& stored_model) {
    return DemandForecaster(config).forecast(profile, batches, movements, as_of,
                                             std::nullopt, stored_model);
}

std::optional<inventory::InventoryBatch> find_most_critical_batch(
    const std::vector<inventory::InventoryBatch>& batches,
    const inventory::DrugProfile& profile) {
    auto matching = inventory::batches_for_profile(batches, profile);
    if (matching.empty()) {
        return std::nullopt;
    }
    inventory::sort_batches_fefo(matching);
    return matching.front();
}

std::vector<RiskAssessment> rank_at_risk(const std::vector<ForecastResult>& forecasts,
                                         const std::vector<inventory::InventoryBatch>& batches,
                                         const CalendarDate& as_of,
                                         SizeT top_n) {
    std::vector<RiskAssessment> assessments;
    assessments.reserve(forecasts.size());

    for (const auto& forecast : forecasts) {
        RiskAssessment assessment;
        assessment.forecast = forecast;
        assessment.most_critical_batch = find_most_critical_batch(batches, forecast.profile);
        assessment.risk_score = calculate_risk_score(forecast, assessment.most_critical_batch, as_of);
        if (assessment.risk_score > 0) {
            assessments.push_back(std::move(assessment));
        }
    }

    std::stable_sort(assessments.begin(), assessments.end(),
        [](const RiskAssessment& a, const RiskAssessment& b) {
            return a.risk_score > b.risk_score;
        });

    if (assessments.size() > top_n) {
        assessments.resize(top_n);
    }
    return assessments;
}

} // namespace medstock::forecast
