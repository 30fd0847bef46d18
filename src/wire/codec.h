#pragma once

#include "command.h"
#include "record.h"
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace darwin::client::wire {

// A syntactically sound line whose tag is not in the schema table.
struct UnknownRecordKind {
    std::string tag;
    std::string line;
};

using DecodeResult = std::variant<Record, UnknownRecordKind>;

// Schema entry of the verb a command encodes to.
const RecordSchema& commandSchema(const Command& command);

// Encode one command into a wire line, without the trailing newline.
// Validates first; throws ValidationError for malformed parameters.
std::string encode(const Command& command);

// Decode one wire line (trailing "\r\n" tolerated).
//
// Lines containing ';' are inbound records: TAG;f1;f2;...
// Other lines are outbound verbs: VERB f1<d>f2... with the verb's delimiter.
// Throws ParseError when the field count or a field type does not match the
// schema; returns UnknownRecordKind for tags the table does not model.
DecodeResult decode(std::string_view line);

// Rebuild the command an outbound record was encoded from.
// Throws ParseError for inbound records.
Command commandFromRecord(const Record& record);

// Wire text of a record in its own direction's syntax, without newline.
std::string encodeRecord(const Record& record);

// Split on a single-character delimiter, keeping empty tokens.
std::vector<std::string_view> splitFields(std::string_view text, char delimiter);

} // namespace darwin::client::wire
