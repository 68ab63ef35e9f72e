#include "DateTimeConverter.h"

#include <array>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace DateTimeConverter {

namespace {

std::time_t whole_seconds(Timestamp ts)
{
    return static_cast<std::time_t>(std::floor(ts.count()));
}

std::string format(Timestamp ts, const char * fmt)
{
    const std::tm tm = local_tm(ts);
    std::array<char, 30> s{};
    std::strftime(s.data(), s.size(), fmt, &tm);
    return s.data();
}

} // namespace

std::tm local_tm(Timestamp ts)
{
    const std::time_t t = whole_seconds(ts);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

std::string date_time(Timestamp ts)
{
    return format(ts, "%Y-%m-%d %H:%M:%S");
}

std::string date(Timestamp ts)
{
    return format(ts, "%Y-%m-%d");
}

std::optional<Timestamp> from_date_time(std::string_view str)
{
    std::tm tm{};
    std::istringstream ss{std::string{str}};
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Timestamp{static_cast<double>(t)};
}

double seconds_of_day(Timestamp ts)
{
    const std::tm tm = local_tm(ts);
    const double fraction = ts.count() - std::floor(ts.count());
    return tm.tm_hour * 3600. + tm.tm_min * 60. + tm.tm_sec + fraction;
}

Timestamp at_time_of_day(Timestamp ts, int day_offset, std::chrono::seconds time_of_day)
{
    std::tm tm = local_tm(ts);
    const auto total = static_cast<int>(time_of_day.count());
    tm.tm_mday += day_offset;
    tm.tm_hour = total / 3600;
    tm.tm_min = total % 3600 / 60;
    tm.tm_sec = total % 60;
    tm.tm_isdst = -1;
    return Timestamp{static_cast<double>(std::mktime(&tm))};
}

} // namespace DateTimeConverter
