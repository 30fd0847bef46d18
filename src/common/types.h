#pragma once

#include <chrono>
#include <cstdint>
#include <climits>
#include <optional>
#include <string>
#include <string_view>

namespace darwin::client {

// ---------------------------------------------------------------------------
// Scalar type aliases
// ---------------------------------------------------------------------------
using OrderId  = std::string;
using Symbol   = std::string;
using Quantity = int64_t;

// Deadline of one synchronous call; empty means the session's
// request_timeout_ms.
using CallTimeout = std::optional<std::chrono::milliseconds>;

// ---------------------------------------------------------------------------
// Fixed-point decimal (mantissa * 10^-6)
//
// Prices, cash amounts and average costs are carried as Decimal so that
// repeated fills never accumulate floating-point drift. Parsing goes from
// text straight to the mantissa.
// ---------------------------------------------------------------------------
struct Decimal {
    int64_t mantissa = 0;
    static constexpr int     kDigits = 6;
    static constexpr int64_t kScale  = 1'000'000;

    static Decimal fromUnits(int64_t units) { return {units * kScale}; }
    static Decimal fromMantissa(int64_t m)  { return {m}; }

    // Accepts "[-]digits[.digits]". Fractional digits beyond 6 are rounded
    // half away from zero. Returns false on malformed text.
    static bool tryParse(std::string_view text, Decimal& out);

    // Throws std::invalid_argument on malformed text.
    static Decimal parse(std::string_view text);

    // Shortest text that round-trips: "50.25", "5000", "-0.5".
    std::string toString() const;

    double toDouble() const { return static_cast<double>(mantissa) / kScale; }

    bool isZero()     const { return mantissa == 0; }
    bool isPositive() const { return mantissa > 0; }
    bool isNegative() const { return mantissa < 0; }

    Decimal operator+(const Decimal& o) const { return {mantissa + o.mantissa}; }
    Decimal operator-(const Decimal& o) const { return {mantissa - o.mantissa}; }
    Decimal operator-() const { return {-mantissa}; }
    Decimal& operator+=(const Decimal& o) { mantissa += o.mantissa; return *this; }
    Decimal& operator-=(const Decimal& o) { mantissa -= o.mantissa; return *this; }

    // Exact: an integer share count times a price. Throws
    // std::overflow_error when the product does not fit the mantissa.
    Decimal operator*(Quantity qty) const;

    // Checked forms; false on overflow, out untouched.
    bool tryMultiply(Quantity qty, Decimal& out) const;
    bool tryAdd(const Decimal& o, Decimal& out) const;

    // Division by a share count, rounded half away from zero.
    Decimal divideBy(Quantity qty) const;

    bool operator< (const Decimal& o) const { return mantissa <  o.mantissa; }
    bool operator> (const Decimal& o) const { return mantissa >  o.mantissa; }
    bool operator==(const Decimal& o) const { return mantissa == o.mantissa; }
    bool operator!=(const Decimal& o) const { return mantissa != o.mantissa; }
    bool operator<=(const Decimal& o) const { return mantissa <= o.mantissa; }
    bool operator>=(const Decimal& o) const { return mantissa >= o.mantissa; }
};

// ---------------------------------------------------------------------------
// Enumerations
// ---------------------------------------------------------------------------
enum class Side : uint8_t {
    Buy  = 1,
    Sell = 2
};

enum class OrderKind : uint8_t {
    Market       = 1,
    Limit        = 2,
    Stop         = 3,
    TrailingStop = 4,
    Iceberg      = 5
};

// Values are the daemon's order status codes.
enum class OrderStatus : uint16_t {
    Pending         = 2000,
    Rejected        = 2001,
    Filled          = 2002,
    Cancelled       = 2003,
    PartiallyFilled = 2004
};

enum class SessionMode : uint8_t {
    Live       = 0,
    Simulation = 1
};

enum class LivenessState : uint8_t {
    Disconnected = 0,
    Connecting   = 1,
    Connected    = 2,
    Degraded     = 3
};

const char* toString(Side side);
const char* toString(OrderKind kind);
const char* toString(OrderStatus status);
const char* toString(SessionMode mode);
const char* toString(LivenessState state);

// Case-insensitive; return false for unknown text.
bool parseSide(std::string_view text, Side& out);
bool parseOrderKind(std::string_view text, OrderKind& out);
bool orderStatusFromCode(int64_t code, OrderStatus& out);

inline bool isTerminal(OrderStatus s) {
    return s == OrderStatus::Filled || s == OrderStatus::Cancelled ||
           s == OrderStatus::Rejected;
}

// Kinds that carry a limit or trigger price.
inline bool requiresPrice(OrderKind kind) { return kind != OrderKind::Market; }

} // namespace darwin::client
