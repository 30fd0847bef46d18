#pragma once
#include "../common/types.h"
#include <map>
#include <vector>

namespace darwin::client::sim {

struct Position {
    Symbol symbol;
    Quantity quantity = 0;   // positive long, negative short
    Decimal avg_price;       // cost basis of the open quantity
    Decimal last_price;      // price of the latest fill
    Decimal gain;            // P&L realized since opened, or as set by adjust()
};

// Net holdings per symbol. Not thread-safe; the simulation engine
// serializes access.
class PositionLedger {
public:
    // Apply a fill. Adding to a position re-weights the cost basis;
    // reducing it realizes P&L against the basis; crossing zero realizes
    // the closed part and opens the rest at the fill price. A position
    // that nets to zero is removed. Returns the P&L realized by this fill.
    // Throws std::overflow_error, position untouched, when the result does
    // not fit the fixed-point range.
    Decimal applyFill(const Symbol& symbol, Side side, Quantity quantity, Decimal price);

    // Add quantity directly (negative reduces). A positive adjustment
    // replaces the cost basis with avg_price; gain is stored as given.
    void adjust(const Symbol& symbol, Quantity quantity, Decimal avg_price, Decimal gain);

    bool remove(const Symbol& symbol);

    const Position* find(const Symbol& symbol) const;

    // Sorted by symbol.
    std::vector<Position> all() const;

    bool empty() const { return positions_.empty(); }
    size_t size() const { return positions_.size(); }

    // Sum over open positions of quantity * last_price. Throws
    // std::overflow_error.
    Decimal marketValue() const;

    void clear() { positions_.clear(); }

private:
    std::map<Symbol, Position> positions_;
};

} // namespace darwin::client::sim
