#include "wire/record.h"
#include "common/errors.h"

namespace darwin::client::wire {

FieldValue defaultValue(FieldType type) {
    switch (type) {
        case FieldType::String:    return std::string{};
        case FieldType::Integer:   return int64_t{0};
        case FieldType::Decimal:   return Decimal{};
        case FieldType::Timestamp: return Timestamp{};
    }
    return std::string{};
}

std::string formatValue(const FieldValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else {
            return v.toString();
        }
    }, value);
}

bool matchesType(const FieldValue& value, FieldType type) {
    switch (type) {
        case FieldType::String:    return std::holds_alternative<std::string>(value);
        case FieldType::Integer:   return std::holds_alternative<int64_t>(value);
        case FieldType::Decimal:   return std::holds_alternative<Decimal>(value);
        case FieldType::Timestamp: return std::holds_alternative<Timestamp>(value);
    }
    return false;
}

Record Record::make(std::string_view tag, std::vector<FieldValue> values) {
    const RecordSchema* schema = findSchema(tag, Direction::Inbound);
    if (!schema) {
        throw ParseError("no inbound schema for kind '" + std::string(tag) + "'");
    }
    return make(*schema, std::move(values));
}

Record Record::make(const RecordSchema& schema, std::vector<FieldValue> values) {
    if (values.size() != schema.fields.size()) {
        throw ParseError(schema.tag + ": expected " + std::to_string(schema.fields.size()) +
                         " fields, got " + std::to_string(values.size()));
    }
    for (size_t i = 0; i < values.size(); ++i) {
        if (!matchesType(values[i], schema.fields[i].type)) {
            throw ParseError(schema.tag + ": field '" + schema.fields[i].name +
                             "' must be " + toString(schema.fields[i].type));
        }
    }
    return Record(&schema, std::move(values));
}

const FieldValue& Record::get(std::string_view name) const {
    int idx = schema_->fieldIndex(name);
    if (idx < 0) {
        throw ParseError(schema_->tag + " has no field '" + std::string(name) + "'");
    }
    return values_[static_cast<size_t>(idx)];
}

namespace {

template <typename T>
const T& typedField(const Record& record, std::string_view name, const char* type_name) {
    const FieldValue& v = record.get(name);
    if (!std::holds_alternative<T>(v)) {
        throw ParseError(record.kind() + ": field '" + std::string(name) +
                         "' is not " + type_name);
    }
    return std::get<T>(v);
}

} // anonymous namespace

const std::string& Record::getString(std::string_view name) const {
    return typedField<std::string>(*this, name, "a string");
}

int64_t Record::getInt(std::string_view name) const {
    return typedField<int64_t>(*this, name, "an integer");
}

Decimal Record::getDecimal(std::string_view name) const {
    return typedField<Decimal>(*this, name, "a decimal");
}

Timestamp Record::getTimestamp(std::string_view name) const {
    return typedField<Timestamp>(*this, name, "a timestamp");
}

} // namespace darwin::client::wire
