/**
 * @file reservoir.cpp
 * @brief Implementation of the Echo State Network demand predictor
 */

#include "medstock/forecast/reservoir.h"
#include <algorithm>
#include <cmath>
#include <random>

namespace medstock::forecast {

namespace {

UInt64 resolve_seed(UInt64 seed) {
    if (seed != 0) {
        return seed;
    }
    std::random_device rd;
    UInt64 fresh = (static_cast<UInt64>(rd()) << 32) | static_cast<UInt64>(rd());
    return fresh != 0 ? fresh : 1;
}

} // anonymous namespace

// ============================================================================
// Reservoir Construction & Dynamics
// ============================================================================

ReservoirModel initialize_reservoir(const ForecastConfig& config) {
    ReservoirModel model;
    model.seed = resolve_seed(config.seed);

    std::mt19937_64 rng(model.seed);
    std::uniform_real_distribution<Real> unit(0.0, 1.0);
    std::uniform_real_distribution<Real> symmetric(-1.0, 1.0);

    const SizeT n = config.reservoir_size;
    std::vector<std::vector<Real>> weights(n, std::vector<Real>(n, 0.0));
    for (auto& row : weights) {
        for (auto& w : row) {
            if (unit(rng) < RESERVOIR_DENSITY) {
                w = symmetric(rng);
            }
        }
    }
    model.weights = normalize_spectral_radius(weights, config.spectral_radius);

    model.input_weights.assign(n, std::vector<Real>(ReservoirModel::INPUT_FEATURES, 0.0));
    for (auto& row : model.input_weights) {
        for (auto& w : row) {
            w = symmetric(rng);
        }
    }

    model.state.assign(n, 0.0);
    model.readout_weights.assign(n, 0.0);
    return model;
}

std::vector<std::vector<Real>> normalize_spectral_radius(const std::vector<std::vector<Real>>& weights,
                                                         Real target_radius) {
    Real max_row_sum = 0.0;
    for (const auto& row : weights) {
        Real row_sum = 0.0;
        for (Real w : row) {
            row_sum += std::abs(w);
        }
        max_row_sum = std::max(max_row_sum, row_sum);
    }

    if (max_row_sum == 0.0) {
        return weights;
    }

    const Real scale = target_radius / max_row_sum;
    std::vector<std::vector<Real>> scaled = weights;
    for (auto& row : scaled) {
        for (auto& w : row) {
            w *= scale;
        }
    }
    return scaled;
}

std::vector<Real> update_reservoir_state(const ReservoirModel& model,
                                         const std::vector<Real>& current_state,
                                         const std::vector<Real>& input,
                                         const ForecastConfig& config) {
    const SizeT n = model.size();
    std::vector<Real> new_state(n, 0.0);

    for (SizeT i = 0; i < n; ++i) {
        Real activation = 0.0;

        // Input projection
        if (i < model.input_weights.size()) {
            const auto& projection = model.input_weights[i];
            const SizeT features = std::min(input.size(), projection.size());
            for (SizeT j = 0; j < features; ++j) {
                activation += input[j] * config.input_scaling * projection[j];
            }
        }

        // Recurrent connections
        const auto& row = model.weights[i];
        const SizeT fan_in = std::min(row.size(), current_state.size());
        for (SizeT j = 0; j < fan_in; ++j) {
            activation += row[j] * current_state[j];
        }

        const Real previous = i < current_state.size() ? current_state[i] : 0.0;
        new_state[i] = (1.0 - config.leaking_rate) * previous +
                       config.leaking_rate * std::tanh(activation);
    }

    return new_state;
}

// ============================================================================
// Readout
// ============================================================================

std::vector<Real> train_readout(const std::vector<std::vector<Real>>& state_history,
                                const std::vector<Real>& target_history,
                                Real regularization) {
    if (state_history.empty() || state_history.size() != target_history.size()) {
        const SizeT size = state_history.empty() ? DEFAULT_READOUT_SIZE : state_history.front().size();
        return std::vector<Real>(size, 0.0);
    }

    const SizeT samples = state_history.size();
    const SizeT dims = state_history.front().size();
    std::vector<Real> weights(dims, 0.0);

    for (SizeT i = 0; i < dims; ++i) {
        Real numerator = 0.0;
        Real denominator = regularization;
        for (SizeT t = 0; t < samples; ++t) {
            const Real s = i < state_history[t].size() ? state_history[t][i] : 0.0;
            numerator += s * target_history[t];
            denominator += s * s;
        }
        weights[i] = denominator != 0.0 ? numerator / denominator : 0.0;
    }

    return weights;
}

Real predict_from_state(const std::vector<Real>& state, const std::vector<Real>& readout_weights) {
    Real output = 0.0;
    const SizeT n = std::min(state.size(), readout_weights.size());
    for (SizeT i = 0; i < n; ++i) {
        output += state[i] * readout_weights[i];
    }
    return std::max(0.0, output);
}

// ============================================================================
// Series Helpers
// ============================================================================

NormalizedSeries normalize_time_series(const std::vector<Real>& data) {
    NormalizedSeries result;
    if (data.empty()) {
        return result;
    }

    const Real count = static_cast<Real>(data.size());
    Real sum = 0.0;
    for (Real v : data) {
        sum += v;
    }
    result.mean = sum / count;

    Real variance = 0.0;
    for (Real v : data) {
        variance += (v - result.mean) * (v - result.mean);
    }
    variance /= count;

    result.std_dev = std::sqrt(variance);
    if (result.std_dev == 0.0) {
        result.std_dev = 1.0;
    }

    result.values.reserve(data.size());
    for (Real v : data) {
        result.values.push_back((v - result.mean) / result.std_dev);
    }
    return result;
}

Real calculate_rmse(const std::vector<Real>& predictions, const std::vector<Real>& actuals) {
    if (predictions.empty() || predictions.size() != actuals.size()) {
        return 0.0;
    }

    Real sum_squared = 0.0;
    for (SizeT i = 0; i < predictions.size(); ++i) {
        const Real error = predictions[i] - actuals[i];
        sum_squared += error * error;
    }
    return std::sqrt(sum_squared / static_cast<Real>(predictions.size()));
}

bool should_retrain(const std::vector<Real>& predictions,
                    const std::vector<Real>& actuals,
                    Real previous_error,
                    Real threshold) {
    return calculate_rmse(predictions, actuals) - previous_error > threshold;
}

bool should_retrain(const std::vector<Real>& predictions,
                    const std::vector<Real>& actuals,
                    Real previous_error,
                    const ForecastConfig& config) {
    return should_retrain(predictions, actuals, previous_error, config.retrain_threshold);
}

} // namespace medstock::forecast
