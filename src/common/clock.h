#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace darwin::client {

// ---------------------------------------------------------------------------
// Wire timestamp
//
// The daemon writes three shapes: "HH:MM:SS" (time of day, trading replies),
// "YYYY-MM-DD HH:MM:SS" (historical candles and ticks) and "YYYYMMDD"
// (historical date parameters). The shape is kept so re-encoding reproduces
// the original text.
// ---------------------------------------------------------------------------
struct Timestamp {
    enum class Format : uint8_t {
        TimeOfDay = 0,
        DateTime  = 1,
        Date      = 2
    };

    // Seconds since midnight for TimeOfDay, seconds since the Unix epoch
    // (UTC calendar, no zone conversion) otherwise.
    int64_t seconds = 0;
    Format  format  = Format::DateTime;

    static bool tryParse(std::string_view text, Timestamp& out);
    static Timestamp fromDate(int year, unsigned month, unsigned day);
    static Timestamp fromDateTime(int year, unsigned month, unsigned day,
                                  unsigned hour, unsigned minute, unsigned second);
    static Timestamp fromTimeOfDay(unsigned hour, unsigned minute, unsigned second);

    std::string toString() const;

    bool operator==(const Timestamp& o) const {
        return seconds == o.seconds && format == o.format;
    }
    bool operator!=(const Timestamp& o) const { return !(*this == o); }
    bool operator<(const Timestamp& o) const { return seconds < o.seconds; }
};

// ---------------------------------------------------------------------------
// Clock utilities
// ---------------------------------------------------------------------------
class Clock {
public:
    using SteadyClock = std::chrono::steady_clock;
    using SystemClock = std::chrono::system_clock;

    // Milliseconds since epoch (wall-clock)
    static uint64_t epochMillis() {
        auto now = SystemClock::now();
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count());
    }

    // Monotonic millisecond timestamp
    static uint64_t steadyMillis() {
        auto now = SteadyClock::now();
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count());
    }

    // Current local time of day, the way the daemon stamps its replies.
    static Timestamp localTimeOfDay();

    // "YYYY-MM-DD HH:MM:SS" local time, for metrics and logs.
    static std::string formatLocal(SystemClock::time_point tp);

    // Proleptic Gregorian conversions (days since 1970-01-01).
    static int64_t daysFromCivil(int year, unsigned month, unsigned day);
    static void civilFromDays(int64_t days, int& year, unsigned& month, unsigned& day);
};

} // namespace darwin::client
