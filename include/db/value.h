#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace primdb {
namespace db {

// Define the types our database can handle
using DBNull = std::monostate;
using DBInt = int64_t;
using DBFloat = double;
using DBText = std::string;
using DBBool = bool;
using DBValue = std::variant<DBNull, DBInt, DBFloat, DBText, DBBool>;

// Column types
enum class ColumnType {
    Null,
    Int,
    Float,
    Text,
    Bool
};

// A record maps field name to value, including the system "id" field
using Record = std::map<std::string, DBValue>;

// Raw user input: field name to uncoerced text
using RawValues = std::map<std::string, std::string>;

// Helper functions to work with DBValue
ColumnType value_type(const DBValue& value);
std::string type_to_string(ColumnType type);
std::optional<ColumnType> string_to_column_type(const std::string& type_name);

// Human readable form used when rendering results
std::string value_to_string(const DBValue& value);

// Unambiguous form: strings quoted, floats always carry a decimal point
std::string value_to_literal(const DBValue& value);

// Equality treats NULL as a normal value; Int and Float compare numerically
bool values_equal(const DBValue& a, const DBValue& b);

// Three-way ordering. Empty when either side is NULL or the types are not comparable.
std::optional<int> compare_values(const DBValue& a, const DBValue& b);

// Truthiness for bare operands in filter expressions
bool is_truthy(const DBValue& value);

// JSON conversion for persisted rows
nlohmann::json value_to_json(const DBValue& value);
DBValue value_from_json(const nlohmann::json& j);

} // namespace db
} // namespace primdb
