#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace spreadarb {
namespace time_utils {

namespace {

std::tm to_utc_tm(WallClock t) {
    auto tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    return tm;
}

} // namespace

std::string to_iso8601(WallClock t) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;

    std::tm tm = to_utc_tm(t);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

WallClock from_iso8601(const std::string& s) {
    std::tm tm = {};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

    // Milliseconds are optional
    size_t dot_pos = s.find('.');
    if (dot_pos != std::string::npos && dot_pos + 1 < s.length()) {
        std::string ms_str = s.substr(dot_pos + 1, 3);
        tp += std::chrono::milliseconds(std::stoi(ms_str));
    }

    return tp;
}

std::string now_iso8601() {
    return to_iso8601(wall_now());
}

int64_t to_epoch_ms(WallClock t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()).count();
}

WallClock from_epoch_ms(int64_t ms) {
    return WallClock(std::chrono::milliseconds(ms));
}

std::string format_duration(Duration d) {
    auto ns = d.count();

    if (ns < 1000) {
        return std::to_string(ns) + "ns";
    } else if (ns < 1000000) {
        return std::to_string(ns / 1000) + "us";
    } else if (ns < 1000000000) {
        return std::to_string(ns / 1000000) + "ms";
    }
    return format_duration_ms(ns / 1000000);
}

std::string format_duration_ms(int64_t ms) {
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << (ms / 1000.0) << "s";
        return ss.str();
    } else if (ms < 3600000) {
        int64_t min = ms / 60000;
        int64_t sec = (ms % 60000) / 1000;
        return std::to_string(min) + "m" + std::to_string(sec) + "s";
    }
    int64_t hours = ms / 3600000;
    int64_t min = (ms % 3600000) / 60000;
    return std::to_string(hours) + "h" + std::to_string(min) + "m";
}

WallClock next_utc_midnight(WallClock t) {
    std::tm tm = to_utc_tm(t);
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    auto midnight = std::chrono::system_clock::from_time_t(timegm(&tm));
    return midnight + std::chrono::hours(24);
}

std::string utc_date(WallClock t) {
    std::tm tm = to_utc_tm(t);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d");
    return ss.str();
}

} // namespace time_utils
} // namespace spreadarb
