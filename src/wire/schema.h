#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace darwin::client::wire {

enum class FieldType : uint8_t {
    String    = 0,
    Integer   = 1,
    Decimal   = 2,
    Timestamp = 3
};

const char* toString(FieldType type);

struct FieldSpec {
    std::string name;
    FieldType type = FieldType::String;
    bool optional = false;  // missing or empty => type default
    std::string unit;       // informational: "EUR", "shares", "seconds", ...
};

enum class Direction : uint8_t {
    Inbound  = 0,  // TAG;f1;f2;...
    Outbound = 1   // VERB f1<d>f2<d>...   (d = schema delimiter)
};

// ---------------------------------------------------------------------------
// One entry of the closed message-kind table.
// ---------------------------------------------------------------------------
struct RecordSchema {
    std::string tag;
    Direction direction = Direction::Inbound;
    char delimiter = ';';
    std::vector<FieldSpec> fields;

    // Inbound: correlation key this record resolves (empty for END/ERR, which
    // are routed through their command field, and for pure events).
    // Outbound: correlation key of the reply the verb expects.
    std::string reply_key;

    bool asynchronous = false; // inbound event, never correlated to a request
    bool list_reply = false;   // outbound: reply is items terminated by END

    // Index of a named field, or -1.
    int fieldIndex(std::string_view name) const;
};

// Correlation keys shared between the schema table and the response router.
namespace ReplyKey {
    inline constexpr const char* ORDER_REPLY   = "ORDER_REPLY";
    inline constexpr const char* INFOACCOUNT   = "INFOACCOUNT";
    inline constexpr const char* AVAILABILITY  = "AVAILABILITY";
    inline constexpr const char* STOCK         = "STOCK";
    inline constexpr const char* ORDER         = "ORDER";
    inline constexpr const char* DARWIN_STATUS = "DARWIN_STATUS";
    inline constexpr const char* CANDLE        = "CANDLE";
    inline constexpr const char* TBT           = "TBT";
} // namespace ReplyKey

// Inbound message-kind tags.
namespace Tag {
    inline constexpr const char* DARWIN_STATUS = "DARWIN_STATUS";
    inline constexpr const char* INFOACCOUNT   = "INFOACCOUNT";
    inline constexpr const char* AVAILABILITY  = "AVAILABILITY";
    inline constexpr const char* STOCK         = "STOCK";
    inline constexpr const char* ORDER         = "ORDER";
    inline constexpr const char* TRADOK        = "TRADOK";
    inline constexpr const char* TRADERR       = "TRADERR";
    inline constexpr const char* TRADCONFIRM   = "TRADCONFIRM";
    inline constexpr const char* ORDUPD        = "ORDUPD";
    inline constexpr const char* EXEC          = "EXEC";
    inline constexpr const char* END           = "END";
    inline constexpr const char* ERR           = "ERR";
    inline constexpr const char* CANDLE        = "CANDLE";
    inline constexpr const char* TBT           = "TBT";
} // namespace Tag

// Daemon error codes with a fixed meaning.
namespace DaemonError {
    inline constexpr int64_t INSUFFICIENT_LIQUIDITY = 1007;
    inline constexpr int64_t NO_POSITIONS           = 1018;
    inline constexpr int64_t NO_ORDERS              = 1019;
    inline constexpr int64_t ORDER_NOT_FOUND        = 1020;
    const char* describe(int64_t code);
} // namespace DaemonError

// Lookup by tag and direction; nullptr when the kind is not modelled.
// CANDLE and TBT exist both as historical verbs and as inbound records.
const RecordSchema* findSchema(std::string_view tag, Direction direction);

const std::vector<RecordSchema>& allSchemas();

} // namespace darwin::client::wire
