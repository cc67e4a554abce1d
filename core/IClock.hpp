#pragma once

#include "Model.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace rtsae {

class IClock {
public:
    virtual ~IClock() = default;

    virtual Timestamp now() const = 0;

    int64_t epochMillis() const;
    std::string iso8601() const;

    static int64_t toEpochMillis(Timestamp ts);
    static Timestamp fromEpochMillis(int64_t millis);

    // UTC with millisecond precision, e.g. 2024-05-01T10:15:30.250Z
    static std::string formatIso8601(Timestamp ts);

    // Accepts a trailing 'Z' or a +hh:mm / -hh:mm offset; fractional seconds optional.
    static std::optional<Timestamp> parseIso8601(const std::string& text);
};

class SystemClock : public IClock {
public:
    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace rtsae
