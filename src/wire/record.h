#pragma once

#include "schema.h"
#include "../common/clock.h"
#include "../common/types.h"
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace darwin::client::wire {

using FieldValue = std::variant<std::string, int64_t, Decimal, Timestamp>;

// Default value for a field type (used for absent optional fields).
FieldValue defaultValue(FieldType type);

// Text form of a value as written on the wire.
std::string formatValue(const FieldValue& value);

// True when the value's alternative matches the declared field type.
bool matchesType(const FieldValue& value, FieldType type);

// ---------------------------------------------------------------------------
// A decoded, immutable response/event/command line.
//
// The field set is exactly the schema's field list for the kind: every
// field is present, absent optional fields hold their type's default.
// ---------------------------------------------------------------------------
class Record {
public:
    // Build a record of an inbound kind, checking count and types against
    // the schema. Throws ParseError on mismatch or unknown tag.
    static Record make(std::string_view tag, std::vector<FieldValue> values);

    // Same, for an explicit schema entry (outbound verbs included).
    static Record make(const RecordSchema& schema, std::vector<FieldValue> values);

    const std::string& kind() const { return schema_->tag; }
    const RecordSchema& schema() const { return *schema_; }
    size_t size() const { return values_.size(); }
    const FieldValue& at(size_t index) const { return values_.at(index); }
    const std::vector<FieldValue>& values() const { return values_; }

    bool has(std::string_view name) const { return schema_->fieldIndex(name) >= 0; }

    // Typed accessors; throw ParseError when the field does not exist.
    const FieldValue& get(std::string_view name) const;
    const std::string& getString(std::string_view name) const;
    int64_t getInt(std::string_view name) const;
    Decimal getDecimal(std::string_view name) const;
    Timestamp getTimestamp(std::string_view name) const;

    bool operator==(const Record& o) const {
        return schema_ == o.schema_ && values_ == o.values_;
    }
    bool operator!=(const Record& o) const { return !(*this == o); }

private:
    Record(const RecordSchema* schema, std::vector<FieldValue> values)
        : schema_(schema), values_(std::move(values)) {}

    const RecordSchema* schema_;
    std::vector<FieldValue> values_;
};

} // namespace darwin::client::wire
