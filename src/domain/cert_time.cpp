#include "cw/cert_time.hpp"

#include <chrono>
#include <cstdio>

namespace cw {

// Calendar fields straight from the day count, so years the C library's
// time_t/gmtime cannot represent still print as themselves.
static std::string format_utc(TimePoint tp, char date_time_sep, const char* suffix)
{
    using namespace std::chrono;

    const sys_days day_point = floor<days>(tp);
    const year_month_day ymd{day_point};
    const hh_mm_ss<seconds> hms{tp - day_point};

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u%c%02d:%02d:%02d%s",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  date_time_sep,
                  static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()),
                  suffix);
    return buf;
}

std::string format_timestamp(TimePoint tp)
{
    return format_utc(tp, ' ', "");
}

std::string format_iso8601(TimePoint tp)
{
    return format_utc(tp, 'T', "Z");
}

int days_between(TimePoint expiry, TimePoint now)
{
    const auto d = std::chrono::floor<std::chrono::days>(expiry - now);
    return static_cast<int>(d.count());
}

} // namespace cw
