#include "utils/time_utils.hpp"
#include "common/errors.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>

namespace lumen {
namespace time_utils {

std::string to_iso8601(WallClock t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;

    std::tm tm = *std::gmtime(&time_t);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

std::string to_iso8601(int64_t epoch_ms) {
    auto tp = WallClock(std::chrono::milliseconds(epoch_ms));
    return to_iso8601(tp);
}

int64_t parse_iso8601_ms(const std::string& s) {
    std::tm tm = {};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw ValidationError("Malformed ISO 8601 timestamp: " + s);
    }

    int64_t ms = static_cast<int64_t>(timegm(&tm)) * 1000;

    // Parse milliseconds if present
    size_t dot_pos = s.find('.');
    if (dot_pos != std::string::npos && dot_pos + 1 < s.length()) {
        std::string frac;
        for (size_t i = dot_pos + 1; i < s.length() && frac.size() < 3; ++i) {
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) break;
            frac += s[i];
        }
        while (!frac.empty() && frac.size() < 3) frac += '0';
        if (!frac.empty()) ms += std::stoi(frac);
    }

    return ms;
}

int64_t interval_to_ms(const std::string& interval) {
    if (interval.size() < 2) return 0;

    char unit = interval.back();
    int64_t n = 0;
    for (size_t i = 0; i + 1 < interval.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(interval[i]))) return 0;
        n = n * 10 + (interval[i] - '0');
    }

    switch (unit) {
        case 'm': return n * 60 * 1000;
        case 'h': return n * 60 * 60 * 1000;
        case 'd': return n * 24 * 60 * 60 * 1000;
        default: return 0;
    }
}

std::string format_duration_ms(int64_t ms) {
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        double sec = ms / 1000.0;
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << sec << "s";
        return ss.str();
    } else if (ms < 3600000) {
        int64_t min = ms / 60000;
        int64_t sec = (ms % 60000) / 1000;
        return std::to_string(min) + "m" + std::to_string(sec) + "s";
    } else {
        int64_t hours = ms / 3600000;
        int64_t min = (ms % 3600000) / 60000;
        return std::to_string(hours) + "h" + std::to_string(min) + "m";
    }
}

} // namespace time_utils
} // namespace lumen
