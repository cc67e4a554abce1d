#include "IClock.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace rtsae {

int64_t IClock::epochMillis() const {
    return toEpochMillis(now());
}

std::string IClock::iso8601() const {
    return formatIso8601(now());
}

int64_t IClock::toEpochMillis(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp IClock::fromEpochMillis(int64_t millis) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::milliseconds(millis)));
}

std::string IClock::formatIso8601(Timestamp ts) {
    int64_t millis = toEpochMillis(ts);
    int64_t seconds = millis / 1000;
    int64_t ms = millis % 1000;
    if (ms < 0) {
        ms += 1000;
        seconds -= 1;
    }
    auto time_t = static_cast<std::time_t>(seconds);

    std::stringstream ss;

    // Use thread-safe gmtime_s on Windows, gmtime_r on other platforms
#ifdef _WIN32
    std::tm tm_buf{};
    if (gmtime_s(&tm_buf, &time_t) == 0) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#else
    std::tm tm_buf{};
    if (gmtime_r(&time_t, &tm_buf)) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#endif

    ss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return ss.str();
}

std::optional<Timestamp> IClock::parseIso8601(const std::string& text) {
    std::tm tm_buf{};
    std::istringstream in(text);
    in >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }

    int64_t millis = 0;
    if (in.peek() == '.') {
        in.get();
        int digits = 0;
        while (std::isdigit(in.peek())) {
            char c = static_cast<char>(in.get());
            if (digits < 3) {
                millis = millis * 10 + (c - '0');
            }
            ++digits;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }

    int64_t offsetSeconds = 0;
    int next = in.peek();
    if (next == 'Z' || next == 'z') {
        in.get();
    } else if (next == '+' || next == '-') {
        int sign = in.get() == '-' ? -1 : 1;
        int hours = 0;
        int minutes = 0;
        char colon = 0;
        in >> hours >> colon >> minutes;
        if (in.fail() || colon != ':') {
            return std::nullopt;
        }
        offsetSeconds = sign * (hours * 3600 + minutes * 60);
    }

    if (in.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

#ifdef _WIN32
    std::time_t seconds = _mkgmtime(&tm_buf);
#else
    std::time_t seconds = timegm(&tm_buf);
#endif
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return fromEpochMillis((static_cast<int64_t>(seconds) - offsetSeconds) * 1000 + millis);
}

} // namespace rtsae
