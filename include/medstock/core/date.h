#pragma once
/**
 * @file date.h
 * @brief Day-granularity calendar dates
 *
 * Inventory records carry dates as ISO-8601 strings. Forecasting only needs
 * whole days, so timestamps are truncated to their calendar day and held as a
 * count of days since 1970-01-01.
 */

#include "medstock/core/types.h"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace medstock {

/**
 * @brief Calendar date with exact day arithmetic
 */
class CalendarDate {
public:
    constexpr CalendarDate() noexcept = default;

    /**
     * @brief Construct from a day count relative to 1970-01-01
     */
    constexpr explicit CalendarDate(Int32 days_since_epoch) noexcept
        : days_(days_since_epoch) {}

    /**
     * @brief Construct from year/month/day
     *
     * Out-of-range components produce an unspecified (but valid) day count;
     * use parse() for untrusted input.
     */
    static CalendarDate from_ymd(Int32 year, UInt32 month, UInt32 day);

    /**
     * @brief Parse "YYYY-MM-DD", ignoring anything after a 'T' separator
     * @return Parsed date, or nullopt if the text is not a valid date
     */
    static std::optional<CalendarDate> parse(std::string_view text);

    /**
     * @brief Current UTC calendar day
     */
    static CalendarDate today();

    /**
     * @brief Sentinel used to order undated stock after every dated batch
     */
    static CalendarDate far_future() { return from_ymd(9999, 12, 31); }

    /**
     * @brief Format as "YYYY-MM-DD"
     */
    std::string to_iso_string() const;

    Int32 days_since_epoch() const noexcept { return days_; }

    CalendarDate add_days(Int32 days) const noexcept { return CalendarDate(days_ + days); }

    /**
     * @brief Signed number of days from this date to @p other
     */
    Int32 days_until(const CalendarDate& other) const noexcept { return other.days_ - days_; }

    Int32 year() const;
    UInt32 month() const;
    UInt32 day() const;

    auto operator<=>(const CalendarDate&) const = default;

private:
    std::chrono::year_month_day to_ymd() const;

    Int32 days_{0};
};

/**
 * @brief Order optional expiry dates with missing values treated as far future
 */
inline bool expires_before(const std::optional<CalendarDate>& a,
                           const std::optional<CalendarDate>& b) {
    return a.value_or(CalendarDate::far_future()) < b.value_or(CalendarDate::far_future());
}

/**
 * @brief ISO string for an optional date (empty when absent)
 */
inline std::string to_iso_string(const std::optional<CalendarDate>& date) {
    return date ? date->to_iso_string() : std::string{};
}

} // namespace medstock
