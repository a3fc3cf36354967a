#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace TimeUtils {

// Time conversion constants
constexpr long long MILLISECONDS_PER_SECOND = 1000;
constexpr long long SECONDS_PER_MINUTE = 60;
constexpr long long MINUTES_PER_HOUR = 60;
constexpr long long HOURS_PER_DAY = 24;
constexpr long long DAYS_PER_WEEK = 7;
constexpr long long DAYS_PER_MONTH = 30;     // Interval approximation, not calendar exact
constexpr long long DAYS_PER_YEAR = 365;     // Interval approximation, not calendar exact
constexpr long long SECONDS_PER_HOUR = SECONDS_PER_MINUTE * MINUTES_PER_HOUR;
constexpr long long SECONDS_PER_DAY = SECONDS_PER_HOUR * HOURS_PER_DAY;
constexpr long long SECONDS_PER_WEEK = SECONDS_PER_DAY * DAYS_PER_WEEK;
constexpr long long SECONDS_PER_MONTH = SECONDS_PER_DAY * DAYS_PER_MONTH;
constexpr long long SECONDS_PER_YEAR = SECONDS_PER_DAY * DAYS_PER_YEAR;

// Time format constants
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

// Common time utility functions
std::string get_current_iso_time_with_z();
std::string get_current_human_readable_time();

// UTC instants
std::chrono::system_clock::time_point make_utc_time_point(int year, int month, int day, int hour, int minute, int second);
std::chrono::system_clock::time_point from_unix_seconds(long long unix_seconds);
std::tm to_utc_tm(std::chrono::system_clock::time_point time_point);
std::string format_utc_time(std::chrono::system_clock::time_point time_point);
// Accepts "YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)", throws std::invalid_argument otherwise
std::chrono::system_clock::time_point parse_iso8601_utc(const std::string& iso_text);
double seconds_between(std::chrono::system_clock::time_point earlier, std::chrono::system_clock::time_point later);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
