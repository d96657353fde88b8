#ifndef TOOLGATE_TIME_FORMAT_HPP
#define TOOLGATE_TIME_FORMAT_HPP

// Calendar time helpers shared by the time tools, the health endpoint and the
// request log. Every conversion that depends on the process time zone goes
// through this module, which serializes it against zone switching.

#include <chrono>
#include <ctime>
#include <string>

namespace time_format {

// "YYYY-MM-DDTHH:MM:SS.ffffff+00:00"
std::string iso8601_utc(std::chrono::system_clock::time_point when);
std::string iso8601_utc_now();

// strftime into a std::string.
std::string format_tm(const std::tm &broken_down, const char *pattern);

// Broken-down UTC time.
std::tm utc_tm(std::time_t seconds);

// Broken-down time in the server's local time zone.
std::tm local_tm(std::time_t seconds);

// Zone database directory: TZDIR, default /usr/share/zoneinfo. Read from the
// environment on the first call, which main makes at startup.
const std::string &zoneinfo_directory();

// True if zone_name names a time zone in the system zoneinfo database
// (zoneinfo_directory). "UTC" and "GMT" are always known.
bool is_known_zone(const std::string &zone_name);

// Wall-clock reading in a named zone.
struct ZoneTime {
    std::string current_time;  // "YYYY-MM-DD HH:MM:SS <abbreviation>"
    std::string utc_offset;    // "+HHMM"
    bool is_dst = false;
};

// Current time in the named IANA zone. Returns false for unknown zones.
bool zone_time(std::time_t seconds, const std::string &zone_name, ZoneTime &reading);

} // namespace time_format

#endif // TOOLGATE_TIME_FORMAT_HPP
