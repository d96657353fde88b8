#include "utils/time_format.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>

namespace time_format {

// localtime_r consults the process-wide TZ; zone_time swaps it temporarily.
// Both hold this mutex. Nothing else reads the environment once serving starts:
// children get a startup copy (platform::capture_environment) and the debug
// flag and zoneinfo directory are read once.
static std::mutex zone_mutex;

const std::string &zoneinfo_directory() {
    static const std::string directory = [] {
        const char *configured = std::getenv("TZDIR");
        if (configured != nullptr && configured[0] != '\0') {
            return std::string(configured);
        }
        return std::string("/usr/share/zoneinfo");
    }();
    return directory;
}

static bool is_safe_zone_name(const std::string &zone_name) {
    if (zone_name.empty() || zone_name.size() > 128 || zone_name[0] == '/' ||
        zone_name.find("..") != std::string::npos) {
        return false;
    }
    for (char character : zone_name) {
        bool allowed = (character >= 'A' && character <= 'Z') || (character >= 'a' && character <= 'z') ||
                       (character >= '0' && character <= '9') || character == '/' || character == '_' ||
                       character == '-' || character == '+';
        if (!allowed) {
            return false;
        }
    }
    return true;
}

static bool is_fixed_utc_name(const std::string &zone_name) {
    return zone_name == "UTC" || zone_name == "GMT";
}

std::string iso8601_utc(std::chrono::system_clock::time_point when) {
    auto since_epoch = when.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - seconds);

    std::tm broken_down = utc_tm(static_cast<std::time_t>(seconds.count()));
    char fraction[16];
    std::snprintf(fraction, sizeof(fraction), ".%06lld", static_cast<long long>(microseconds.count()));
    return format_tm(broken_down, "%Y-%m-%dT%H:%M:%S") + fraction + "+00:00";
}

std::string iso8601_utc_now() {
    return iso8601_utc(std::chrono::system_clock::now());
}

std::string format_tm(const std::tm &broken_down, const char *pattern) {
    char buffer[128];
    size_t written = std::strftime(buffer, sizeof(buffer), pattern, &broken_down);
    return std::string(buffer, written);
}

std::tm utc_tm(std::time_t seconds) {
    std::tm broken_down{};
    gmtime_r(&seconds, &broken_down);
    return broken_down;
}

std::tm local_tm(std::time_t seconds) {
    std::lock_guard<std::mutex> lock(zone_mutex);
    std::tm broken_down{};
    localtime_r(&seconds, &broken_down);
    return broken_down;
}

bool is_known_zone(const std::string &zone_name) {
    if (is_fixed_utc_name(zone_name)) {
        return true;
    }
    if (!is_safe_zone_name(zone_name)) {
        return false;
    }
    std::string zone_path = zoneinfo_directory() + "/" + zone_name;
    std::error_code filesystem_error;
    if (!std::filesystem::is_regular_file(zone_path, filesystem_error)) {
        return false;
    }
    // Compiled zone files start with the "TZif" magic.
    std::ifstream zone_file(zone_path, std::ios::binary);
    char magic[4] = {0, 0, 0, 0};
    zone_file.read(magic, sizeof(magic));
    return zone_file.gcount() == 4 && magic[0] == 'T' && magic[1] == 'Z' && magic[2] == 'i' && magic[3] == 'f';
}

bool zone_time(std::time_t seconds, const std::string &zone_name, ZoneTime &reading) {
    if (!is_known_zone(zone_name)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(zone_mutex);

    const char *previous = std::getenv("TZ");
    bool had_previous = (previous != nullptr);
    std::string previous_value = had_previous ? previous : "";

    std::string zone_setting = is_fixed_utc_name(zone_name) ? zone_name + "0" : ":" + zone_name;
    setenv("TZ", zone_setting.c_str(), 1);
    tzset();
    std::tm broken_down{};
    localtime_r(&seconds, &broken_down);
    // tm_zone points into tzset() state, so format before restoring TZ.
    reading.current_time = format_tm(broken_down, "%Y-%m-%d %H:%M:%S %Z");
    reading.utc_offset = format_tm(broken_down, "%z");
    reading.is_dst = broken_down.tm_isdst > 0;

    if (had_previous) {
        setenv("TZ", previous_value.c_str(), 1);
    } else {
        unsetenv("TZ");
    }
    tzset();
    return true;
}

} // namespace time_format
