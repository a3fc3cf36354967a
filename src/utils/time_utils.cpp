#include "time_utils.hpp"
#include <ctime>
#include <cctype>
#include <stdexcept>

namespace TimeUtils {

std::string get_current_iso_time_with_z() {
    return format_utc_time(std::chrono::system_clock::now());
}

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

std::chrono::system_clock::time_point make_utc_time_point(int year, int month, int day, int hour, int minute, int second) {
    std::tm utc_tm = {};
    utc_tm.tm_year = year - 1900;
    utc_tm.tm_mon = month - 1;
    utc_tm.tm_mday = day;
    utc_tm.tm_hour = hour;
    utc_tm.tm_min = minute;
    utc_tm.tm_sec = second;
    return std::chrono::system_clock::from_time_t(timegm(&utc_tm));
}

std::chrono::system_clock::time_point from_unix_seconds(long long unix_seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(unix_seconds));
}

std::tm to_utc_tm(std::chrono::system_clock::time_point time_point) {
    auto in_time_t = std::chrono::system_clock::to_time_t(time_point);

    // Use thread-safe gmtime_r instead of gmtime
    struct tm timeinfo;
    gmtime_r(&in_time_t, &timeinfo);
    return timeinfo;
}

std::string format_utc_time(std::chrono::system_clock::time_point time_point) {
    std::tm timeinfo = to_utc_tm(time_point);
    std::stringstream ss;
    ss << std::put_time(&timeinfo, ISO_8601_WITH_Z);
    return ss.str();
}

std::chrono::system_clock::time_point parse_iso8601_utc(const std::string& iso_text) {
    std::tm parsed_tm = {};
    std::istringstream iso_stream(iso_text);
    iso_stream >> std::get_time(&parsed_tm, "%Y-%m-%dT%H:%M:%S");
    if (iso_stream.fail()) {
        throw std::invalid_argument("Invalid ISO 8601 time: " + iso_text);
    }

    // Fractional seconds are dropped
    if (iso_stream.peek() == '.') {
        iso_stream.get();
        while (std::isdigit(iso_stream.peek())) {
            iso_stream.get();
        }
    }

    long long offset_seconds = 0;
    int zone_marker = iso_stream.get();
    if (zone_marker == '+' || zone_marker == '-') {
        int offset_hours = 0;
        int offset_minutes = 0;
        char separator = ':';
        iso_stream >> offset_hours >> separator >> offset_minutes;
        if (iso_stream.fail() || separator != ':') {
            throw std::invalid_argument("Invalid ISO 8601 offset: " + iso_text);
        }
        offset_seconds = offset_hours * SECONDS_PER_HOUR + offset_minutes * SECONDS_PER_MINUTE;
        if (zone_marker == '-') {
            offset_seconds = -offset_seconds;
        }
    } else if (zone_marker != 'Z') {
        throw std::invalid_argument("ISO 8601 time has no zone designator: " + iso_text);
    }

    std::time_t utc_seconds = timegm(&parsed_tm) - static_cast<std::time_t>(offset_seconds);
    return std::chrono::system_clock::from_time_t(utc_seconds);
}

double seconds_between(std::chrono::system_clock::time_point earlier, std::chrono::system_clock::time_point later) {
    return std::chrono::duration<double>(later - earlier).count();
}

} // namespace TimeUtils
