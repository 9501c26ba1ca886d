/**
 * @file date.cpp
 * @brief Calendar date parsing, formatting and conversion
 */

#include "medstock/core/date.h"
#include <charconv>
#include <cstdio>

namespace medstock {

namespace {

bool parse_number(std::string_view text, int& out) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

} // anonymous namespace

CalendarDate CalendarDate::from_ymd(Int32 year, UInt32 month, UInt32 day) {
    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{month},
                                    std::chrono::day{day}};
    std::chrono::sys_days days{ymd};
    return CalendarDate(static_cast<Int32>(days.time_since_epoch().count()));
}

std::optional<CalendarDate> CalendarDate::parse(std::string_view text) {
    // Timestamps such as 2025-01-31T10:15:00Z keep only their day
    auto t_pos = text.find('T');
    if (t_pos != std::string_view::npos) {
        text = text.substr(0, t_pos);
    }

    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (!parse_number(text.substr(0, 4), year) ||
        !parse_number(text.substr(5, 2), month) ||
        !parse_number(text.substr(8, 2), day)) {
        return std::nullopt;
    }

    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{static_cast<unsigned>(month)},
                                    std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    std::chrono::sys_days days{ymd};
    return CalendarDate(static_cast<Int32>(days.time_since_epoch().count()));
}

CalendarDate CalendarDate::today() {
    auto now = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
    return CalendarDate(static_cast<Int32>(now.time_since_epoch().count()));
}

std::chrono::year_month_day CalendarDate::to_ymd() const {
    return std::chrono::year_month_day{std::chrono::sys_days{std::chrono::days{days_}}};
}

Int32 CalendarDate::year() const {
    return static_cast<Int32>(to_ymd().year());
}

UInt32 CalendarDate::month() const {
    return static_cast<unsigned>(to_ymd().month());
}

UInt32 CalendarDate::day() const {
    return static_cast<unsigned>(to_ymd().day());
}

std::string CalendarDate::to_iso_string() const {
    auto ymd = to_ymd();
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()));
    return buffer;
}

} // namespace medstock
