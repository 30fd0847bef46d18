#include "wire/schema.h"

namespace darwin::client::wire {

namespace {

FieldSpec str(const char* name, bool optional = false) {
    return {name, FieldType::String, optional, ""};
}
FieldSpec integer(const char* name, const char* unit = "", bool optional = false) {
    return {name, FieldType::Integer, optional, unit};
}
FieldSpec dec(const char* name, const char* unit = "", bool optional = false) {
    return {name, FieldType::Decimal, optional, unit};
}
FieldSpec ts(const char* name, bool optional = false) {
    return {name, FieldType::Timestamp, optional, ""};
}

RecordSchema inbound(const char* tag, std::vector<FieldSpec> fields,
                     const char* reply_key, bool asynchronous = false) {
    RecordSchema s;
    s.tag = tag;
    s.direction = Direction::Inbound;
    s.delimiter = ';';
    s.fields = std::move(fields);
    s.reply_key = reply_key;
    s.asynchronous = asynchronous;
    return s;
}

RecordSchema trading(const char* verb, std::vector<FieldSpec> fields,
                     const char* reply_key, bool list_reply = false) {
    RecordSchema s;
    s.tag = verb;
    s.direction = Direction::Outbound;
    s.delimiter = ',';
    s.fields = std::move(fields);
    s.reply_key = reply_key;
    s.list_reply = list_reply;
    return s;
}

RecordSchema historical(const char* verb, std::vector<FieldSpec> fields,
                        const char* reply_key) {
    RecordSchema s = trading(verb, std::move(fields), reply_key, true);
    s.delimiter = ' ';
    return s;
}

std::vector<RecordSchema> buildTable() {
    std::vector<RecordSchema> t;

    // ---------------------------------------------------------------------
    // Trading verbs (port 10002)
    // ---------------------------------------------------------------------
    const std::vector<FieldSpec> market_args = {
        str("order_id"), str("symbol"), integer("quantity", "shares")};
    const std::vector<FieldSpec> priced_args = {
        str("order_id"), str("symbol"), integer("quantity", "shares"), dec("price", "EUR")};
    std::vector<FieldSpec> trailing_args = priced_args;
    trailing_args.push_back(dec("trail", "EUR"));
    std::vector<FieldSpec> iceberg_args = priced_args;
    iceberg_args.push_back(integer("visible_quantity", "shares"));

    t.push_back(trading("ACQMARKET",   market_args,   ReplyKey::ORDER_REPLY));
    t.push_back(trading("VENMARKET",   market_args,   ReplyKey::ORDER_REPLY));
    t.push_back(trading("ACQAZ",       priced_args,   ReplyKey::ORDER_REPLY));
    t.push_back(trading("VENAZ",       priced_args,   ReplyKey::ORDER_REPLY));
    t.push_back(trading("ACQSTOP",     priced_args,   ReplyKey::ORDER_REPLY));
    t.push_back(trading("VENSTOP",     priced_args,   ReplyKey::ORDER_REPLY));
    t.push_back(trading("ACQTRAILING", trailing_args, ReplyKey::ORDER_REPLY));
    t.push_back(trading("VENTRAILING", trailing_args, ReplyKey::ORDER_REPLY));
    t.push_back(trading("ACQICEBERG",  iceberg_args,  ReplyKey::ORDER_REPLY));
    t.push_back(trading("VENICEBERG",  iceberg_args,  ReplyKey::ORDER_REPLY));

    t.push_back(trading("REVORD",  {str("order_id")}, ReplyKey::ORDER_REPLY));
    t.push_back(trading("REVALL",  {str("symbol")},   ReplyKey::ORDER_REPLY, true));
    t.push_back(trading("MODORD",  {str("order_id"), dec("price", "EUR"),
                                    dec("signal_price", "EUR", true)},
                        ReplyKey::ORDER_REPLY));
    t.push_back(trading("CONFORD", {str("order_id")}, ReplyKey::ORDER_REPLY));

    t.push_back(trading("INFOACCOUNT",      {}, ReplyKey::INFOACCOUNT));
    t.push_back(trading("INFOAVAILABILITY", {}, ReplyKey::AVAILABILITY));
    t.push_back(trading("INFOSTOCKS",       {}, ReplyKey::STOCK, true));
    t.push_back(trading("GETPOSITION",      {str("symbol")}, ReplyKey::STOCK));
    t.push_back(trading("ORDERLIST",        {str("symbol", true)}, ReplyKey::ORDER, true));
    t.push_back(trading("ORDERLISTPENDING", {}, ReplyKey::ORDER, true));
    t.push_back(trading("DARWINSTATUS",     {}, ReplyKey::DARWIN_STATUS));

    // ---------------------------------------------------------------------
    // Historical verbs (port 10003)
    // ---------------------------------------------------------------------
    t.push_back(historical("DDAY",   {str("symbol"), integer("days", "days")}, ReplyKey::CANDLE));
    t.push_back(historical("CANDLE", {str("symbol"), integer("days", "days"),
                                      integer("period", "seconds")}, ReplyKey::CANDLE));
    t.push_back(historical("TBT",    {str("symbol"), integer("days", "days")}, ReplyKey::TBT));
    t.push_back(historical("CANDLEDATE", {str("symbol"), integer("period", "seconds"),
                                          ts("from"), ts("to"), str("after_hours")},
                           ReplyKey::CANDLE));

    // ---------------------------------------------------------------------
    // Inbound records
    // ---------------------------------------------------------------------
    t.push_back(inbound(Tag::DARWIN_STATUS,
        {str("connection_status"), str("trading_enabled"), str("release", true)},
        ReplyKey::DARWIN_STATUS));

    t.push_back(inbound(Tag::INFOACCOUNT,
        {ts("time"), str("account_code"), dec("liquidity", "EUR"), dec("gain", "EUR"),
         dec("open_pnl", "EUR"), dec("equity", "EUR"), str("environment")},
        ReplyKey::INFOACCOUNT));

    t.push_back(inbound(Tag::AVAILABILITY,
        {ts("time"), dec("liquidity", "EUR"), dec("margin_liquidity", "EUR"),
         dec("buying_power", "EUR")},
        ReplyKey::AVAILABILITY));

    t.push_back(inbound(Tag::STOCK,
        {str("symbol"), ts("time"), integer("quantity_portfolio", "shares"),
         integer("quantity_darwin", "shares"), integer("quantity_negotiation", "shares"),
         dec("avg_price", "EUR"), dec("gain", "EUR"), dec("last_price", "EUR", true)},
        ReplyKey::STOCK));

    t.push_back(inbound(Tag::ORDER,
        {str("symbol"), ts("time"), str("order_id"), str("side"), dec("price", "EUR"),
         dec("signal_price", "EUR"), integer("quantity", "shares"), integer("status_code"),
         integer("filled_quantity", "shares", true), dec("avg_price", "EUR", true),
         str("kind", true)},
        ReplyKey::ORDER));

    t.push_back(inbound(Tag::TRADOK,
        {str("symbol"), str("order_id"), integer("status_code"), str("operation"),
         integer("quantity", "shares"), dec("price", "EUR"), dec("executed_price", "EUR"),
         integer("executed_quantity", "shares"), integer("remaining_quantity", "shares"),
         str("reference", true), str("command", true)},
        ReplyKey::ORDER_REPLY));

    t.push_back(inbound(Tag::TRADERR,
        {str("symbol"), str("order_id"), integer("error_code"), str("message", true)},
        ReplyKey::ORDER_REPLY));

    t.push_back(inbound(Tag::TRADCONFIRM,
        {str("symbol"), str("order_id"), integer("quantity", "shares"), dec("price", "EUR"),
         str("message", true)},
        ReplyKey::ORDER_REPLY));

    t.push_back(inbound(Tag::ORDUPD,
        {str("symbol"), str("order_id"), integer("status_code"), str("side"),
         integer("quantity", "shares"), integer("filled_quantity", "shares"),
         dec("avg_price", "EUR"), ts("time")},
        "", true));

    t.push_back(inbound(Tag::EXEC,
        {str("symbol"), str("order_id"), str("side"), integer("executed_quantity", "shares"),
         dec("executed_price", "EUR"), integer("filled_quantity", "shares"),
         integer("remaining_quantity", "shares"), ts("time")},
        "", true));

    t.push_back(inbound(Tag::END, {str("command"), integer("count")}, ""));
    t.push_back(inbound(Tag::ERR, {str("command"), integer("error_code")}, ""));

    t.push_back(inbound(Tag::CANDLE,
        {str("symbol"), ts("datetime"), dec("open", "EUR"), dec("low", "EUR"),
         dec("high", "EUR"), dec("close", "EUR"), integer("volume", "shares")},
        ReplyKey::CANDLE));

    t.push_back(inbound(Tag::TBT,
        {str("symbol"), ts("datetime"), dec("price", "EUR"), integer("quantity", "shares")},
        ReplyKey::TBT));

    return t;
}

} // anonymous namespace

const char* toString(FieldType type) {
    switch (type) {
        case FieldType::String:    return "string";
        case FieldType::Integer:   return "integer";
        case FieldType::Decimal:   return "decimal";
        case FieldType::Timestamp: return "timestamp";
    }
    return "unknown";
}

int RecordSchema::fieldIndex(std::string_view name) const {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (fields[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

const char* DaemonError::describe(int64_t code) {
    switch (code) {
        case INSUFFICIENT_LIQUIDITY: return "insufficient liquidity";
        case NO_POSITIONS:           return "no positions";
        case NO_ORDERS:              return "no orders";
        case ORDER_NOT_FOUND:        return "order not found";
        default:                     return "daemon error";
    }
}

const std::vector<RecordSchema>& allSchemas() {
    static const std::vector<RecordSchema> table = buildTable();
    return table;
}

const RecordSchema* findSchema(std::string_view tag, Direction direction) {
    for (const auto& s : allSchemas()) {
        if (s.direction == direction && s.tag == tag) return &s;
    }
    return nullptr;
}

} // namespace darwin::client::wire
