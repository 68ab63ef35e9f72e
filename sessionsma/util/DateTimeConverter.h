#pragma once

#include "Timestamp.h"

#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

// All conversions use the process local time zone.
namespace DateTimeConverter {

std::string date_time(Timestamp ts);
std::string date(Timestamp ts);

// "YYYY-MM-DD HH:MM:SS"
std::optional<Timestamp> from_date_time(std::string_view str);

std::tm local_tm(Timestamp ts);

// includes the fractional part of ts
double seconds_of_day(Timestamp ts);

// local calendar date of ts moved by day_offset days, at time_of_day
Timestamp at_time_of_day(Timestamp ts, int day_offset, std::chrono::seconds time_of_day);

} // namespace DateTimeConverter
