/**
 * @file regime_classifier.cpp
 * @brief Implementation of the Markov activity regime classifier
 */

#include "medstock/forecast/regime_classifier.h"
#include <algorithm>
#include <array>

namespace medstock::forecast {

MarkovState detect_markov_state(const std::vector<DemandPoint>& series,
                                const std::optional<MarkovState>& previous) {
    MarkovState state;
    if (previous) {
        state.transition_counts = previous->transition_counts;
    }

    if (series.empty()) {
        state.current = ActivityRegime::LowActivity;
        state.consecutive_days = 0;
        return state;
    }

    SizeT window = std::min(series.size(), REGIME_WINDOW_DAYS);
    Real sum = 0.0;
    for (SizeT i = series.size() - window; i < series.size(); ++i) {
        sum += series[i].stock_out_volume;
    }
    state.current = classify_activity(sum / static_cast<Real>(window));

    if (previous) {
        state.transition_counts[transition_key(previous->current, state.current)] += 1;
        state.consecutive_days = previous->current == state.current
            ? previous->consecutive_days + 1
            : 1;
    } else {
        state.consecutive_days = 1;
    }

    return state;
}

Real transition_probability(const MarkovState& state, ActivityRegime from, ActivityRegime to) {
    static constexpr std::array<ActivityRegime, 3> regimes{
        ActivityRegime::LowActivity,
        ActivityRegime::NormalActivity,
        ActivityRegime::HighActivity
    };

    UInt64 outgoing = 0;
    for (auto target : regimes) {
        auto it = state.transition_counts.find(transition_key(from, target));
        if (it != state.transition_counts.end()) {
            outgoing += it->second;
        }
    }
    if (outgoing == 0) {
        return 0.0;
    }

    auto it = state.transition_counts.find(transition_key(from, to));
    UInt64 count = it != state.transition_counts.end() ? it->second : 0;
    return static_cast<Real>(count) / static_cast<Real>(outgoing);
}

} // namespace medstock::forecast
