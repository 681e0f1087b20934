#include "../../include/db/schema.h"
#include "../../include/db/errors.h"
#include "../../include/db/types.h"
#include <algorithm>

namespace primdb {
namespace db {

Schema::Schema(const ColumnSpecs& columns) {
    if (columns.empty()) {
        throw SchemaError("A table needs at least one field");
    }

    for (const auto& [name, type_name] : columns) {
        if (!is_identifier(name)) {
            throw SchemaError("Invalid field name: '" + name + "'");
        }
        if (name == kIdField) {
            throw SchemaError("Field 'id' is reserved and generated automatically");
        }
        if (has_field(name)) {
            throw SchemaError("Duplicate field: '" + name + "'");
        }
        auto type = string_to_column_type(type_name);
        if (!type) {
            throw SchemaError("Unsupported type for field '" + name + "': '" + type_name + "'");
        }
        fields_.push_back(FieldDef{name, *type});
    }
}

std::vector<std::string> Schema::field_names() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& field : fields_) {
        names.push_back(field.name);
    }
    return names;
}

bool Schema::has_field(const std::string& name) const {
    return std::any_of(fields_.begin(), fields_.end(),
                       [&](const FieldDef& field) { return field.name == name; });
}

std::optional<ColumnType> Schema::field_type(const std::string& name) const {
    if (name == kIdField) return ColumnType::Int;
    for (const auto& field : fields_) {
        if (field.name == name) return field.type;
    }
    return std::nullopt;
}

ColumnSpecs Schema::to_specs() const {
    ColumnSpecs specs;
    for (const auto& field : fields_) {
        specs.emplace_back(field.name, type_to_string(field.type));
    }
    return specs;
}

Record Schema::validate_insert(const RawValues& values) const {
    std::vector<std::string> missing;
    for (const auto& field : fields_) {
        if (values.find(field.name) == values.end()) {
            missing.push_back(field.name);
        }
    }
    if (!missing.empty()) {
        throw MissingFieldsError(missing);
    }

    std::vector<std::string> unknown;
    for (const auto& [name, _] : values) {
        if (!has_field(name)) unknown.push_back(name);
    }
    if (!unknown.empty()) {
        throw UnknownFieldsError(unknown);
    }

    Record row;
    for (const auto& field : fields_) {
        row[field.name] = coerce(values.at(field.name), field.type);
    }
    return row;
}

Record Schema::validate_update(const RawValues& values) const {
    if (values.count(kIdField)) {
        throw ValidationError("Field 'id' cannot be modified");
    }

    std::vector<std::string> unknown;
    for (const auto& [name, _] : values) {
        if (!has_field(name)) unknown.push_back(name);
    }
    if (!unknown.empty()) {
        throw UnknownFieldsError(unknown);
    }

    Record changes;
    for (const auto& [name, raw] : values) {
        changes[name] = coerce(raw, *field_type(name));
    }
    return changes;
}

Predicate Schema::prepare(const Conjunction& conditions) const {
    std::vector<PreparedCondition> prepared;
    prepared.reserve(conditions.size());

    for (const auto& cond : conditions) {
        auto type = field_type(cond.field);
        if (!type) {
            throw ValidationError("Unknown field in where: '" + cond.field + "'");
        }
        prepared.push_back(PreparedCondition{cond.field, cond.op, coerce(cond.raw_value, *type)});
    }
    return make_conjunction(prepared);
}

} // namespace db
} // namespace primdb
