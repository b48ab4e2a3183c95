// src/core/time_utils.cpp

#include "canslim_bt/core/time_utils.hpp"
#include <iomanip>
#include <sstream>

namespace canslim_bt {
namespace core {

namespace {
constexpr int64_t kSecondsPerDay = 86400;

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned last_day_of_month(int year, unsigned month) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return days[month - 1];
}
}  // namespace

std::string get_formatted_time(const char* format, bool use_local_time) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result{};

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

// Howard Hinnant's days_from_civil / civil_from_days
int64_t days_from_civil(int year, unsigned month, unsigned day) {
    int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = (static_cast<int64_t>(month) + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + static_cast<int64_t>(day) - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;
    const int64_t m = mp < 10 ? mp + 3 : mp - 9;
    const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);

    CivilDate date;
    date.year = static_cast<int>(y);
    date.month = static_cast<unsigned>(m);
    date.day = static_cast<unsigned>(d);
    return date;
}

Timestamp make_date(int year, unsigned month, unsigned day) {
    return from_day_number(days_from_civil(year, month, day));
}

int64_t to_day_number(const Timestamp& ts) {
    auto secs =
        std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    return floor_div(static_cast<int64_t>(secs), kSecondsPerDay);
}

Timestamp floor_to_day(const Timestamp& ts) {
    return from_day_number(to_day_number(ts));
}

Timestamp from_day_number(int64_t days) {
    return Timestamp(std::chrono::seconds(days * kSecondsPerDay));
}

CivilDate to_civil(const Timestamp& ts) {
    return civil_from_days(to_day_number(ts));
}

Timestamp add_days(const Timestamp& ts, int64_t days) {
    return ts + std::chrono::seconds(days * kSecondsPerDay);
}

int64_t days_between(const Timestamp& from, const Timestamp& to) {
    return to_day_number(to) - to_day_number(from);
}

int iso_weekday(const Timestamp& ts) {
    // 1970-01-01 was a Thursday (ISO weekday 4)
    int64_t days = to_day_number(ts);
    int64_t wd = (days + 3) % 7;
    if (wd < 0) {
        wd += 7;
    }
    return static_cast<int>(wd) + 1;
}

std::pair<int, int> iso_year_week(const Timestamp& ts) {
    // The ISO week belongs to the year that contains its Thursday
    int64_t days = to_day_number(ts);
    int64_t thursday = days + (4 - iso_weekday(ts));
    CivilDate thu = civil_from_days(thursday);
    int64_t jan1 = days_from_civil(thu.year, 1, 1);
    int week = static_cast<int>((thursday - jan1) / 7) + 1;
    return {thu.year, week};
}

Result<Timestamp> parse_date(const std::string& text) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    char sep1 = 0;
    char sep2 = 0;

    std::istringstream ss(text);
    ss >> year >> sep1 >> month >> sep2 >> day;
    if (ss.fail() || sep1 != '-' || sep2 != '-') {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Unparseable date (expected YYYY-MM-DD): '" + text + "'",
                                     "TimeUtils");
    }
    if (month < 1 || month > 12 || day < 1 || day > last_day_of_month(year, month)) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Date out of range: '" + text + "'", "TimeUtils");
    }
    return make_date(year, month, day);
}

std::string format_date(const Timestamp& ts) {
    CivilDate date = to_civil(ts);
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << date.year << "-" << std::setw(2) << date.month
       << "-" << std::setw(2) << date.day;
    return ss.str();
}

}  // namespace core
}  // namespace canslim_bt
