#pragma once
/**
 * @file reservoir.h
 * @brief Echo State Network for daily demand prediction
 *
 * A small recurrent predictor with fixed random internal dynamics where only
 * the linear readout is trained. Suited to the short, sparse demand histories
 * of newly opened clinics.
 *
 * Key features:
 * - Sparse reservoir (~10% density) scaled to a target spectral radius
 * - Stored input projection, so a model is deterministic once initialized
 * - Leaky-integrator tanh neurons
 * - Per-dimension ridge readout
 * - Normalization, RMSE and retrain decision helpers
 *
 * Example usage:
 * @code
 * ForecastConfig config = ForecastConfig::default_config();
 * ReservoirModel model = initialize_reservoir(config);
 *
 * std::vector<Real> state(model.size(), 0.0);
 * state = update_reservoir_state(model, state, {z_today, 0.5}, config);
 * Real z_tomorrow = predict_from_state(state, model.readout_weights);
 * @endcode
 */

#include "medstock/forecast/forecast_types.h"
#include <vector>

namespace medstock::forecast {

/// Probability that a reservoir connection is non-zero
constexpr Real RESERVOIR_DENSITY = 0.1;

/// Readout dimension used when training data is empty
constexpr SizeT DEFAULT_READOUT_SIZE = 50;

/**
 * @brief Series normalized to zero mean and unit variance
 */
struct NormalizedSeries {
    std::vector<Real> values;
    Real mean{0.0};
    Real std_dev{1.0};  ///< Population std, 1 when the series is constant
};

// ============================================================================
// Reservoir Construction & Dynamics
// ============================================================================

/**
 * @brief Create a reservoir with sparse random weights and zero state
 *
 * Draws come from a generator seeded with config.seed (a fresh seed from
 * std::random_device when it is 0). The seed used is stored in the model.
 */
ReservoirModel initialize_reservoir(const ForecastConfig& config);

/**
 * @brief Scale weights so the max absolute row sum equals @p target_radius
 *
 * The max row sum bounds the spectral radius from above; this is an
 * approximation, not an eigenvalue computation. An all-zero matrix is
 * returned unchanged.
 */
std::vector<std::vector<Real>> normalize_spectral_radius(const std::vector<std::vector<Real>>& weights,
                                                         Real target_radius);

/**
 * @brief Advance the reservoir by one step
 * @param model Reservoir (weights and input projection)
 * @param current_state Activation before the step (size N)
 * @param input Input features (demand, time position)
 * @param config Supplies input_scaling and leaking_rate
 * @return Activation after the step
 */
std::vector<Real> update_reservoir_state(const ReservoirModel& model,
                                         const std::vector<Real>& current_state,
                                         const std::vector<Real>& input,
                                         const ForecastConfig& config);

// ============================================================================
// Readout
// ============================================================================

/**
 * @brief Train readout weights, one ridge coefficient per state dimension
 *
 * w_i = sum_t(s_t[i] * y_t) / (sum_t(s_t[i]^2) + lambda)
 *
 * Each dimension is fitted independently of the others.
 *
 * @return Readout weights; zeros when the inputs are empty or mismatched
 */
std::vector<Real> train_readout(const std::vector<std::vector<Real>>& state_history,
                                const std::vector<Real>& target_history,
                                Real regularization = 0.01);

/**
 * @brief Readout output, clamped to >= 0
 */
Real predict_from_state(const std::vector<Real>& state, const std::vector<Real>& readout_weights);

// ============================================================================
// Series Helpers
// ============================================================================

/**
 * @brief Normalize to zero mean and unit std (std floored to 1 when 0)
 */
NormalizedSeries normalize_time_series(const std::vector<Real>& data);

/**
 * @brief Undo normalization
 */
inline Real denormalize(Real normalized, Real mean, Real std_dev) {
    return normalized * std_dev + mean;
}

/**
 * @brief Root mean squared error; 0 for empty or mismatched inputs
 */
Real calculate_rmse(const std::vector<Real>& predictions, const std::vector<Real>& actuals);

/**
 * @brief Whether prediction error grew by more than @p threshold
 */
bool should_retrain(const std::vector<Real>& predictions,
                    const std::vector<Real>& actuals,
                    Real previous_error,
                    Real threshold = 0.5);

/**
 * @brief Retrain rule using ForecastConfig::retrain_threshold
 */
bool should_retrain(const std::vector<Real>& predictions,
                    const std::vector<Real>& actuals,
                    Real previous_error,
                    const ForecastConfig& config);

} // namespace medstock::forecast
