#include "TimeUtils.h"
#include <ctime>
#include <iomanip>
#include <sstream>

std::string toIso8601(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count();
    if (millis < 0) {
        // Pre-epoch instants round towards the earlier second
        seconds -= std::chrono::seconds(1);
        millis += 1000;
    }

    time_t raw = std::chrono::system_clock::to_time_t(seconds);
    struct tm utc {};
    gmtime_r(&raw, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

std::string getCurrentTimestamp() {
    time_t now = time(nullptr);
    struct tm local {};
    if (!localtime_r(&now, &local)) {
        return "TIME_ERROR";
    }
    char buffer[20];
    strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}
