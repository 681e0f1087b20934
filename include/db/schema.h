#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "value.h"
#include "where.h"

namespace primdb {
namespace db {

// Reserved, auto-assigned primary key present in every table
inline const std::string kIdField = "id";

// Column definition
struct FieldDef {
    std::string name;
    ColumnType type;
};

// (field, type name) pairs as written by the user, e.g. {"age", "int"}
using ColumnSpecs = std::vector<std::pair<std::string, std::string>>;

// Ordered field -> type mapping for one table. Immutable once built.
class Schema {
public:
    Schema() = default;

    // Throws SchemaError on an empty list, a reserved/duplicate/invalid
    // field name or an unsupported type.
    explicit Schema(const ColumnSpecs& columns);

    const std::vector<FieldDef>& fields() const { return fields_; }
    std::vector<std::string> field_names() const;

    bool has_field(const std::string& name) const;

    // Declared type of a field; "id" always resolves to Int
    std::optional<ColumnType> field_type(const std::string& name) const;

    // Back to (field, type name) pairs for persistence
    ColumnSpecs to_specs() const;

    // Complete payload, no extras. Does not assign "id".
    Record validate_insert(const RawValues& values) const;

    // Subset payload, no extras, "id" is not settable
    Record validate_update(const RawValues& values) const;

    // Coerce each condition's raw value to its field's declared type and
    // lower the list into a predicate. An unknown field raises ValidationError.
    Predicate prepare(const Conjunction& conditions) const;

private:
    std::vector<FieldDef> fields_;
};

} // namespace db
} // namespace primdb
