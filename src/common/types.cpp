#include "common/types.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace darwin::client {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Decimal
// ---------------------------------------------------------------------------

bool Decimal::tryParse(std::string_view text, Decimal& out) {
    if (text.empty()) return false;

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        ++pos;
    }

    int64_t int_part = 0;
    size_t int_digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        const int digit = text[pos] - '0';
        if (int_part > (INT64_MAX / kScale - digit) / 10) return false; // overflow
        int_part = int_part * 10 + digit;
        ++pos;
        ++int_digits;
    }

    int64_t frac_part = 0;
    int frac_digits = 0;
    bool round_up = false;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (frac_digits < kDigits) {
                frac_part = frac_part * 10 + (text[pos] - '0');
                ++frac_digits;
            } else if (frac_digits == kDigits) {
                round_up = text[pos] >= '5';
                ++frac_digits; // only the first dropped digit decides rounding
            }
            ++pos;
        }
        if (pos == start && int_digits == 0) return false;
    } else if (int_digits == 0) {
        return false;
    }

    if (pos != text.size()) return false;

    for (int i = std::min(frac_digits, kDigits); i < kDigits; ++i) {
        frac_part *= 10;
    }

    const int64_t frac = frac_part + (round_up ? 1 : 0);
    if (int_part > (INT64_MAX - frac) / kScale) return false; // overflow
    int64_t m = int_part * kScale + frac;
    out.mantissa = negative ? -m : m;
    return true;
}

Decimal Decimal::parse(std::string_view text) {
    Decimal d;
    if (!tryParse(text, d)) {
        throw std::invalid_argument("malformed decimal: '" + std::string(text) + "'");
    }
    return d;
}

std::string Decimal::toString() const {
    int64_t abs_m = mantissa < 0 ? -mantissa : mantissa;
    std::string out = mantissa < 0 ? "-" : "";
    out += std::to_string(abs_m / kScale);

    int64_t frac = abs_m % kScale;
    if (frac != 0) {
        std::string digits = std::to_string(frac);
        digits.insert(0, static_cast<size_t>(kDigits) - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        out += '.';
        out += digits;
    }
    return out;
}

bool Decimal::tryMultiply(Quantity qty, Decimal& out) const {
    int64_t m;
    if (__builtin_mul_overflow(mantissa, qty, &m)) return false;
    out.mantissa = m;
    return true;
}

bool Decimal::tryAdd(const Decimal& o, Decimal& out) const {
    int64_t m;
    if (__builtin_add_overflow(mantissa, o.mantissa, &m)) return false;
    out.mantissa = m;
    return true;
}

Decimal Decimal::operator*(Quantity qty) const {
    Decimal out;
    if (!tryMultiply(qty, out)) {
        throw std::overflow_error("Decimal overflow: " + toString() + " x " + std::to_string(qty));
    }
    return out;
}

Decimal Decimal::divideBy(Quantity qty) const {
    if (qty == 0) {
        throw std::domain_error("Decimal division by zero quantity");
    }
    int64_t q = mantissa / qty;
    int64_t r = mantissa % qty;
    // Round half away from zero.
    if (r != 0 && std::llabs(r) * 2 >= std::llabs(qty)) {
        q += ((mantissa < 0) != (qty < 0)) ? -1 : 1;
    }
    return {q};
}

// ---------------------------------------------------------------------------
// Enum text
// ---------------------------------------------------------------------------

const char* toString(Side side) {
    switch (side) {
        case Side::Buy:  return "BUY";
        case Side::Sell: return "SELL";
    }
    return "UNKNOWN";
}

const char* toString(OrderKind kind) {
    switch (kind) {
        case OrderKind::Market:       return "MARKET";
        case OrderKind::Limit:        return "LIMIT";
        case OrderKind::Stop:         return "STOP";
        case OrderKind::TrailingStop: return "TRAILING_STOP";
        case OrderKind::Iceberg:      return "ICEBERG";
    }
    return "UNKNOWN";
}

const char* toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::Pending:         return "PENDING";
        case OrderStatus::Rejected:        return "REJECTED";
        case OrderStatus::Filled:          return "FILLED";
        case OrderStatus::Cancelled:       return "CANCELLED";
        case OrderStatus::PartiallyFilled: return "PARTIALLY_FILLED";
    }
    return "UNKNOWN";
}

const char* toString(SessionMode mode) {
    switch (mode) {
        case SessionMode::Live:       return "Live";
        case SessionMode::Simulation: return "Simulation";
    }
    return "Unknown";
}

const char* toString(LivenessState state) {
    switch (state) {
        case LivenessState::Disconnected: return "Disconnected";
        case LivenessState::Connecting:   return "Connecting";
        case LivenessState::Connected:    return "Connected";
        case LivenessState::Degraded:     return "Degraded";
    }
    return "Unknown";
}

bool parseSide(std::string_view text, Side& out) {
    if (iequals(text, "BUY") || iequals(text, "ACQ")) { out = Side::Buy;  return true; }
    if (iequals(text, "SELL") || iequals(text, "VEN")) { out = Side::Sell; return true; }
    return false;
}

bool parseOrderKind(std::string_view text, OrderKind& out) {
    if (iequals(text, "MARKET"))        { out = OrderKind::Market;       return true; }
    if (iequals(text, "LIMIT"))         { out = OrderKind::Limit;        return true; }
    if (iequals(text, "STOP"))          { out = OrderKind::Stop;         return true; }
    if (iequals(text, "TRAILING_STOP") ||
        iequals(text, "TRAILING-STOP") ||
        iequals(text, "TRAILING"))      { out = OrderKind::TrailingStop; return true; }
    if (iequals(text, "ICEBERG"))       { out = OrderKind::Iceberg;      return true; }
    return false;
}

bool orderStatusFromCode(int64_t code, OrderStatus& out) {
    switch (code) {
        case 2000: out = OrderStatus::Pending;         return true;
        case 2001: out = OrderStatus::Rejected;        return true;
        case 2002: out = OrderStatus::Filled;          return true;
        case 2003: out = OrderStatus::Cancelled;       return true;
        case 2004: out = OrderStatus::PartiallyFilled; return true;
        default:   return false;
    }
}

} // namespace darwin::client
