#pragma once
/**
 * @file regime_classifier.h
 * @brief Markov activity regime of recent demand
 *
 * The trailing week of demand is classified into a low, normal or high
 * activity regime. Regime memory is explicit: the caller passes the previous
 * state in and receives the next state back.
 */

#include "medstock/forecast/forecast_types.h"
#include <optional>
#include <string>
#include <vector>

namespace medstock::forecast {

/// Number of trailing days used for classification
constexpr SizeT REGIME_WINDOW_DAYS = 7;

/// Mean daily demand below which activity is low
constexpr Real LOW_ACTIVITY_THRESHOLD = 3.0;

/// Mean daily demand below which activity is normal
constexpr Real NORMAL_ACTIVITY_THRESHOLD = 8.0;

/**
 * @brief Classify a mean daily demand
 */
inline ActivityRegime classify_activity(Real mean_daily_demand) {
    if (mean_daily_demand < LOW_ACTIVITY_THRESHOLD) return ActivityRegime::LowActivity;
    if (mean_daily_demand < NORMAL_ACTIVITY_THRESHOLD) return ActivityRegime::NormalActivity;
    return ActivityRegime::HighActivity;
}

/**
 * @brief Transition counter key, e.g. "low_activity_to_high_activity"
 */
inline std::string transition_key(ActivityRegime from, ActivityRegime to) {
    return std::string(activity_regime_to_string(from)) + "_to_" + activity_regime_to_string(to);
}

/**
 * @brief Detect the activity regime of a demand series
 *
 * With zero history the regime is LowActivity with a zero streak. When a
 * previous state is supplied its transition counts are carried forward, the
 * observed transition is counted and the streak is extended if the regime is
 * unchanged (reset to 1 otherwise).
 *
 * @param series Daily demand series, ascending by date
 * @param previous State returned by the previous call, if any
 * @return Freshly computed state
 */
MarkovState detect_markov_state(const std::vector<DemandPoint>& series,
                                const std::optional<MarkovState>& previous = std::nullopt);

/**
 * @brief Empirical probability of moving from one regime to another
 * @return Share of counted transitions out of @p from that went to @p to
 *         (0 when none were observed)
 */
Real transition_probability(const MarkovState& state, ActivityRegime from, ActivityRegime to);

} // namespace medstock::forecast
