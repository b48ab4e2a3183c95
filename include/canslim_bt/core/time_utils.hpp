// include/canslim_bt/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include "canslim_bt/core/error.hpp"
#include "canslim_bt/core/types.hpp"

namespace canslim_bt {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Current wall-clock time formatted with strftime
 * @param format strftime format string
 * @param use_local_time If true, uses local time, otherwise UTC
 */
std::string get_formatted_time(const char* format, bool use_local_time = true);

/**
 * @brief Proleptic Gregorian calendar date
 */
struct CivilDate {
    int year{1970};
    unsigned month{1};  // 1..12
    unsigned day{1};    // 1..31
};

/**
 * @brief Days since 1970-01-01 for a civil date
 */
int64_t days_from_civil(int year, unsigned month, unsigned day);

/**
 * @brief Civil date for a day number relative to 1970-01-01
 */
CivilDate civil_from_days(int64_t days);

/**
 * @brief Midnight UTC of the given calendar date
 */
Timestamp make_date(int year, unsigned month, unsigned day);

/**
 * @brief Day number (days since epoch, floored) of a timestamp
 */
int64_t to_day_number(const Timestamp& ts);

/**
 * @brief Truncate a timestamp to midnight UTC of its day
 */
Timestamp floor_to_day(const Timestamp& ts);

/**
 * @brief Timestamp for a day number
 */
Timestamp from_day_number(int64_t days);

CivilDate to_civil(const Timestamp& ts);

Timestamp add_days(const Timestamp& ts, int64_t days);

/**
 * @brief Whole calendar days from `from` to `to` (negative when to < from)
 */
int64_t days_between(const Timestamp& from, const Timestamp& to);

/**
 * @brief ISO-8601 weekday, Monday = 1 .. Sunday = 7
 */
int iso_weekday(const Timestamp& ts);

/**
 * @brief ISO-8601 (week-based year, week number) of a date
 */
std::pair<int, int> iso_year_week(const Timestamp& ts);

/**
 * @brief Parse "YYYY-MM-DD" (a trailing time part is ignored)
 */
Result<Timestamp> parse_date(const std::string& text);

/**
 * @brief Format as "YYYY-MM-DD"
 */
std::string format_date(const Timestamp& ts);

}  // namespace core
}  // namespace canslim_bt
