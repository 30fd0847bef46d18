#include "sim/position_ledger.h"
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace darwin::client::sim {

Decimal PositionLedger::applyFill(const Symbol& symbol, Side side, Quantity quantity,
                                  Decimal price) {
    Decimal realized;
    if (quantity <= 0) return realized;

    const Quantity signed_fill = side == Side::Buy ? quantity : -quantity;

    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        positions_.emplace(symbol, Position{symbol, signed_fill, price, price, Decimal{}});
        return realized;
    }

    Position& pos = it->second;
    const Quantity held = std::llabs(pos.quantity);
    Quantity net;
    if (__builtin_add_overflow(pos.quantity, signed_fill, &net)) {
        throw std::overflow_error("net quantity of " + symbol + " out of range");
    }

    // Computed first; the position changes only once nothing can throw.
    Decimal avg_price = pos.avg_price;
    Decimal gain = pos.gain;
    if (pos.quantity == 0 || (pos.quantity > 0) == (signed_fill > 0)) {
        // Opening or adding: quantity-weighted cost basis.
        Decimal total;
        if (!(pos.avg_price * held).tryAdd(price * quantity, total)) {
            throw std::overflow_error("cost basis of " + symbol + " out of range");
        }
        avg_price = total.divideBy(held + quantity);
    } else {
        const Quantity closing = quantity < held ? quantity : held;
        realized = pos.quantity > 0 ? (price - pos.avg_price) * closing
                                    : (pos.avg_price - price) * closing;
        if (!gain.tryAdd(realized, gain)) {
            throw std::overflow_error("gain of " + symbol + " out of range");
        }
        if (quantity > held) {
            // Crossed zero: the remainder opens a new position at the fill price.
            avg_price = price;
        }
    }

    pos.last_price = price;
    pos.avg_price = avg_price;
    pos.gain = gain;
    pos.quantity = net;
    if (pos.quantity == 0) {
        positions_.erase(it);
    }
    return realized;
}

void PositionLedger::adjust(const Symbol& symbol, Quantity quantity, Decimal avg_price,
                            Decimal gain) {
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        if (quantity == 0) return;
        positions_.emplace(symbol, Position{symbol, quantity, avg_price, avg_price, gain});
        return;
    }

    Position& pos = it->second;
    pos.quantity += quantity;
    if (quantity > 0) {
        pos.avg_price = avg_price;
    }
    pos.gain = gain;
    if (pos.quantity == 0) {
        positions_.erase(it);
    }
}

bool PositionLedger::remove(const Symbol& symbol) {
    return positions_.erase(symbol) > 0;
}

const Position* PositionLedger::find(const Symbol& symbol) const {
    auto it = positions_.find(symbol);
    return it == positions_.end() ? nullptr : &it->second;
}

std::vector<Position> PositionLedger::all() const {
    std::vector<Position> out;
    out.reserve(positions_.size());
    for (const auto& [symbol, pos] : positions_) {
        out.push_back(pos);
    }
    return out;
}

Decimal PositionLedger::marketValue() const {
    Decimal total;
    for (const auto& [symbol, pos] : positions_) {
        if (!total.tryAdd(pos.last_price * pos.quantity, total)) {
            throw std::overflow_error("market value out of range");
        }
    }
    return total;
}

} // namespace darwin::client::sim
