#include "core/TimeUtil.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace weft {

TimePoint nowMillis() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

std::string formatIsoTimestamp(TimePoint tp) {
    auto time = Clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        --time;
    }

    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

TimePoint parseIsoTimestamp(const std::string& text) {
    // yyyy-mm-ddTHH:MM:SS[.fff][Z]
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != ' ') || text[13] != ':' || text[16] != ':') {
        throw std::runtime_error("Unable to parse timestamp: " + text);
    }

    struct tm timeinfo = {};
    try {
        timeinfo.tm_year = std::stoi(text.substr(0, 4)) - 1900;
        timeinfo.tm_mon = std::stoi(text.substr(5, 2)) - 1;
        timeinfo.tm_mday = std::stoi(text.substr(8, 2));
        timeinfo.tm_hour = std::stoi(text.substr(11, 2));
        timeinfo.tm_min = std::stoi(text.substr(14, 2));
        timeinfo.tm_sec = std::stoi(text.substr(17, 2));
    } catch (const std::logic_error&) {
        throw std::runtime_error("Unable to parse timestamp: " + text);
    }

    int64_t millis = 0;
    size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) {
        throw std::runtime_error("Unable to parse timestamp: " + text);
    }

    time_t seconds = timegm(&timeinfo);
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::seconds(seconds) + std::chrono::milliseconds(millis)));
}

int64_t toUnixMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace weft
