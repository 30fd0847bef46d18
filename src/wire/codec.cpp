#include "wire/codec.h"
#include "common/errors.h"

#include <charconv>

namespace darwin::client::wire {

namespace {

// ---------------------------------------------------------------------------
// Verb mapping
// ---------------------------------------------------------------------------

std::string placeOrderVerb(Side side, OrderKind kind) {
    std::string verb = side == Side::Buy ? "ACQ" : "VEN";
    switch (kind) {
        case OrderKind::Market:       return verb + "MARKET";
        case OrderKind::Limit:        return verb + "AZ";
        case OrderKind::Stop:         return verb + "STOP";
        case OrderKind::TrailingStop: return verb + "TRAILING";
        case OrderKind::Iceberg:      return verb + "ICEBERG";
    }
    return verb + "AZ";
}

const char* verbFor(CommandKind kind) {
    switch (kind) {
        case CommandKind::CancelOrder:        return "REVORD";
        case CommandKind::CancelAll:          return "REVALL";
        case CommandKind::ModifyOrder:        return "MODORD";
        case CommandKind::ConfirmOrder:       return "CONFORD";
        case CommandKind::QueryAccount:       return "INFOACCOUNT";
        case CommandKind::QueryAvailability:  return "INFOAVAILABILITY";
        case CommandKind::QueryPortfolio:     return "INFOSTOCKS";
        case CommandKind::QueryPosition:      return "GETPOSITION";
        case CommandKind::QueryOrders:        return "ORDERLIST";
        case CommandKind::QueryPendingOrders: return "ORDERLISTPENDING";
        case CommandKind::QueryStatus:        return "DARWINSTATUS";
        case CommandKind::DailyCandles:       return "DDAY";
        case CommandKind::IntradayCandles:    return "CANDLE";
        case CommandKind::CandleRange:        return "CANDLEDATE";
        case CommandKind::Ticks:              return "TBT";
        case CommandKind::PlaceOrder:         break;
    }
    return "";
}

struct VerbInfo {
    CommandKind kind;
    Side side;
    OrderKind order_kind;
};

bool verbInfo(std::string_view verb, VerbInfo& out) {
    static const CommandKind kOthers[] = {
        CommandKind::CancelOrder, CommandKind::CancelAll, CommandKind::ModifyOrder,
        CommandKind::ConfirmOrder, CommandKind::QueryAccount, CommandKind::QueryAvailability,
        CommandKind::QueryPortfolio, CommandKind::QueryPosition, CommandKind::QueryOrders,
        CommandKind::QueryPendingOrders, CommandKind::QueryStatus, CommandKind::DailyCandles,
        CommandKind::IntradayCandles, CommandKind::CandleRange, CommandKind::Ticks};
    for (CommandKind k : kOthers) {
        if (verb == verbFor(k)) {
            out = {k, Side::Buy, OrderKind::Limit};
            return true;
        }
    }
    static const OrderKind kKinds[] = {OrderKind::Market, OrderKind::Limit, OrderKind::Stop,
                                       OrderKind::TrailingStop, OrderKind::Iceberg};
    for (Side side : {Side::Buy, Side::Sell}) {
        for (OrderKind kind : kKinds) {
            if (verb == placeOrderVerb(side, kind)) {
                out = {CommandKind::PlaceOrder, side, kind};
                return true;
            }
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// Field parsing
// ---------------------------------------------------------------------------

FieldValue parseField(const RecordSchema& schema, const FieldSpec& spec, std::string_view token) {
    switch (spec.type) {
        case FieldType::String:
            return std::string(token);
        case FieldType::Integer: {
            int64_t value = 0;
            const char* first = token.data();
            const char* last = token.data() + token.size();
            if (!token.empty() && *first == '+') ++first;
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc() || ptr != last) {
                throw ParseError(schema.tag + ": field '" + spec.name +
                                 "' is not an integer: '" + std::string(token) + "'");
            }
            return value;
        }
        case FieldType::Decimal: {
            Decimal value;
            if (!Decimal::tryParse(token, value)) {
                throw ParseError(schema.tag + ": field '" + spec.name +
                                 "' is not a decimal: '" + std::string(token) + "'");
            }
            return value;
        }
        case FieldType::Timestamp: {
            Timestamp value;
            if (!Timestamp::tryParse(token, value)) {
                throw ParseError(schema.tag + ": field '" + spec.name +
                                 "' is not a timestamp: '" + std::string(token) + "'");
            }
            return value;
        }
    }
    return std::string(token);
}

Record decodeFields(const RecordSchema& schema, std::vector<std::string_view> tokens) {
    // Trailing empty tokens beyond the schema are padding, not data.
    while (tokens.size() > schema.fields.size() && tokens.back().empty()) {
        tokens.pop_back();
    }
    if (tokens.size() > schema.fields.size()) {
        throw ParseError(schema.tag + ": expected at most " +
                         std::to_string(schema.fields.size()) + " fields, got " +
                         std::to_string(tokens.size()));
    }

    std::vector<FieldValue> values;
    values.reserve(schema.fields.size());
    for (size_t i = 0; i < schema.fields.size(); ++i) {
        const FieldSpec& spec = schema.fields[i];
        bool present = i < tokens.size();
        if (!present || tokens[i].empty()) {
            if (spec.optional || (present && spec.type == FieldType::String)) {
                values.push_back(defaultValue(spec.type));
                continue;
            }
            throw ParseError(schema.tag + ": missing required field '" + spec.name + "'");
        }
        values.push_back(parseField(schema, spec, tokens[i]));
    }
    return Record::make(schema, std::move(values));
}

std::string_view stripLineEnding(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    return line;
}

bool isDefault(const FieldValue& value, FieldType type) {
    return value == defaultValue(type);
}

} // anonymous namespace

std::vector<std::string_view> splitFields(std::string_view text, char delimiter) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(delimiter, start);
        if (pos == std::string_view::npos) {
            out.push_back(text.substr(start));
            break;
        }
        out.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Encode
// ---------------------------------------------------------------------------

const RecordSchema& commandSchema(const Command& command) {
    std::string verb = command.kind == CommandKind::PlaceOrder
        ? placeOrderVerb(command.side(), command.orderKind())
        : std::string(verbFor(command.kind));
    const RecordSchema* schema = findSchema(verb, Direction::Outbound);
    if (!schema) {
        throw ValidationError("no wire verb for command " + std::string(toString(command.kind)));
    }
    return *schema;
}

std::string encode(const Command& command) {
    validateCommand(command);
    const RecordSchema& schema = commandSchema(command);

    std::vector<std::string> args;
    for (const auto& spec : schema.fields) {
        auto it = command.params.find(spec.name);
        if (it == command.params.end()) {
            if (!spec.optional) {
                throw ValidationError(schema.tag + ": missing parameter '" + spec.name + "'");
            }
            args.emplace_back();
            continue;
        }
        if (!matchesType(it->second, spec.type)) {
            throw ValidationError(schema.tag + ": parameter '" + spec.name + "' must be " +
                                  toString(spec.type));
        }
        args.push_back(formatValue(it->second));
    }
    while (!args.empty() && args.back().empty()) {
        args.pop_back();
    }

    std::string line = schema.tag;
    for (size_t i = 0; i < args.size(); ++i) {
        line += i == 0 ? ' ' : schema.delimiter;
        line += args[i];
    }
    return line;
}

std::string encodeRecord(const Record& record) {
    const RecordSchema& schema = record.schema();
    std::string line = schema.tag;
    bool outbound = schema.direction == Direction::Outbound;

    size_t count = record.size();
    if (outbound) {
        // Omit trailing optional arguments left at their default.
        while (count > 0 && schema.fields[count - 1].optional &&
               isDefault(record.at(count - 1), schema.fields[count - 1].type)) {
            --count;
        }
    }
    for (size_t i = 0; i < count; ++i) {
        line += (outbound && i == 0) ? ' ' : schema.delimiter;
        line += formatValue(record.at(i));
    }
    return line;
}

// ---------------------------------------------------------------------------
// Decode
// ---------------------------------------------------------------------------

DecodeResult decode(std::string_view raw) {
    std::string_view line = stripLineEnding(raw);
    if (line.empty()) {
        throw ParseError("empty line");
    }

    size_t semi = line.find(';');
    if (semi != std::string_view::npos) {
        std::string_view tag = line.substr(0, semi);
        const RecordSchema* schema = findSchema(tag, Direction::Inbound);
        if (!schema) {
            return UnknownRecordKind{std::string(tag), std::string(line)};
        }
        return decodeFields(*schema, splitFields(line.substr(semi + 1), ';'));
    }

    size_t space = line.find(' ');
    std::string_view verb = line.substr(0, space);
    if (const RecordSchema* schema = findSchema(verb, Direction::Outbound)) {
        if (space == std::string_view::npos) {
            return decodeFields(*schema, {});
        }
        return decodeFields(*schema, splitFields(line.substr(space + 1), schema->delimiter));
    }
    if (space == std::string_view::npos) {
        if (const RecordSchema* schema = findSchema(line, Direction::Inbound)) {
            return decodeFields(*schema, {});
        }
    }
    return UnknownRecordKind{std::string(verb), std::string(line)};
}

Command commandFromRecord(const Record& record) {
    const RecordSchema& schema = record.schema();
    VerbInfo info;
    if (schema.direction != Direction::Outbound || !verbInfo(schema.tag, info)) {
        throw ParseError(schema.tag + " is not a command");
    }

    Command cmd;
    cmd.kind = info.kind;
    if (info.kind == CommandKind::PlaceOrder) {
        cmd.params["side"] = std::string(toString(info.side));
        cmd.params["kind"] = std::string(toString(info.order_kind));
    }
    for (size_t i = 0; i < schema.fields.size(); ++i) {
        const FieldSpec& spec = schema.fields[i];
        if (spec.optional && isDefault(record.at(i), spec.type)) continue;
        cmd.params[spec.name] = record.at(i);
    }
    return cmd;
}

} // namespace darwin::client::wire
