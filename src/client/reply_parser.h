#pragma once

#include "domain.h"
#include "../sim/order.h"
#include "../wire/record.h"

namespace darwin::client {

// Record -> domain conversions. Each throws ParseError when the record is
// not of the expected kind or carries an unknown side or status code.

AccountSnapshot toAccountSnapshot(const wire::Record& record);
Availability toAvailability(const wire::Record& record);
PortfolioPosition toPortfolioPosition(const wire::Record& record);
OrderInfo toOrderInfo(const wire::Record& record);
OrderInfo toOrderInfo(const sim::Order& order);
OrderUpdate toOrderUpdate(const wire::Record& record);
Execution toExecution(const wire::Record& record);
Candle toCandle(const wire::Record& record);
Tick toTick(const wire::Record& record);

// TRADOK, TRADERR or TRADCONFIRM.
OrderAck toOrderAck(const wire::Record& record);

// Fills connection_status, trading_enabled and release only.
DarwinStatus toDarwinStatus(const wire::Record& record);

} // namespace darwin::client
