#include "../../include/db/value.h"
#include "../../include/db/errors.h"
#include <charconv>
#include <cmath>
#include <limits>

namespace primdb {
namespace db {

ColumnType value_type(const DBValue& value) {
    if (std::holds_alternative<DBNull>(value)) return ColumnType::Null;
    if (std::holds_alternative<DBInt>(value)) return ColumnType::Int;
    if (std::holds_alternative<DBFloat>(value)) return ColumnType::Float;
    if (std::holds_alternative<DBText>(value)) return ColumnType::Text;
    return ColumnType::Bool;
}

std::string type_to_string(ColumnType type) {
    switch (type) {
        case ColumnType::Null: return "null";
        case ColumnType::Int: return "int";
        case ColumnType::Float: return "float";
        case ColumnType::Text: return "str";
        case ColumnType::Bool: return "bool";
        default: return "unknown";
    }
}

std::optional<ColumnType> string_to_column_type(const std::string& type_name) {
    if (type_name == "int") return ColumnType::Int;
    if (type_name == "float") return ColumnType::Float;
    if (type_name == "str") return ColumnType::Text;
    if (type_name == "bool") return ColumnType::Bool;
    return std::nullopt;
}

namespace {

// Shortest representation that reads back to the same double
std::string float_to_string(DBFloat v) {
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    std::string s(buf, res.ptr);
    if (s.find_first_of(".eEn") == std::string::npos) {
        s += ".0";
    }
    return s;
}

std::string quote(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

bool is_numeric(const DBValue& v) {
    return std::holds_alternative<DBInt>(v) || std::holds_alternative<DBFloat>(v);
}

DBFloat as_double(const DBValue& v) {
    if (std::holds_alternative<DBInt>(v)) return static_cast<DBFloat>(std::get<DBInt>(v));
    return std::get<DBFloat>(v);
}

template <typename T>
int three_way(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

} // namespace

std::string value_to_string(const DBValue& value) {
    if (std::holds_alternative<DBNull>(value)) return "null";
    if (std::holds_alternative<DBInt>(value)) return std::to_string(std::get<DBInt>(value));
    if (std::holds_alternative<DBFloat>(value)) return float_to_string(std::get<DBFloat>(value));
    if (std::holds_alternative<DBText>(value)) return std::get<DBText>(value);
    return std::get<DBBool>(value) ? "true" : "false";
}

std::string value_to_literal(const DBValue& value) {
    if (std::holds_alternative<DBText>(value)) return quote(std::get<DBText>(value));
    return value_to_string(value);
}

bool values_equal(const DBValue& a, const DBValue& b) {
    if (is_numeric(a) && is_numeric(b)) {
        if (std::holds_alternative<DBInt>(a) && std::holds_alternative<DBInt>(b)) {
            return std::get<DBInt>(a) == std::get<DBInt>(b);
        }
        return as_double(a) == as_double(b);
    }
    if (value_type(a) != value_type(b)) return false;

    if (std::holds_alternative<DBNull>(a)) return true; // NULL == NULL
    if (std::holds_alternative<DBText>(a)) return std::get<DBText>(a) == std::get<DBText>(b);
    return std::get<DBBool>(a) == std::get<DBBool>(b);
}

std::optional<int> compare_values(const DBValue& a, const DBValue& b) {
    if (std::holds_alternative<DBNull>(a) || std::holds_alternative<DBNull>(b)) {
        return std::nullopt;
    }

    if (is_numeric(a) && is_numeric(b)) {
        if (std::holds_alternative<DBInt>(a) && std::holds_alternative<DBInt>(b)) {
            return three_way(std::get<DBInt>(a), std::get<DBInt>(b));
        }
        DBFloat x = as_double(a);
        DBFloat y = as_double(b);
        if (std::isnan(x) || std::isnan(y)) return std::nullopt;
        return three_way(x, y);
    }

    if (value_type(a) != value_type(b)) return std::nullopt;

    if (std::holds_alternative<DBText>(a)) return three_way(std::get<DBText>(a), std::get<DBText>(b));
    return three_way(std::get<DBBool>(a), std::get<DBBool>(b));
}

bool is_truthy(const DBValue& value) {
    if (std::holds_alternative<DBNull>(value)) return false;
    if (std::holds_alternative<DBInt>(value)) return std::get<DBInt>(value) != 0;
    if (std::holds_alternative<DBFloat>(value)) return std::get<DBFloat>(value) != 0.0;
    if (std::holds_alternative<DBText>(value)) return !std::get<DBText>(value).empty();
    return std::get<DBBool>(value);
}

nlohmann::json value_to_json(const DBValue& value) {
    if (std::holds_alternative<DBNull>(value)) return nullptr;
    if (std::holds_alternative<DBInt>(value)) return std::get<DBInt>(value);
    if (std::holds_alternative<DBFloat>(value)) return std::get<DBFloat>(value);
    if (std::holds_alternative<DBText>(value)) return std::get<DBText>(value);
    return std::get<DBBool>(value);
}

DBValue value_from_json(const nlohmann::json& j) {
    if (j.is_null()) return DBNull{};
    if (j.is_boolean()) return DBValue{j.get<bool>()};
    if (j.is_number_unsigned()) {
        auto v = j.get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<DBInt>::max())) {
            throw StorageError("Integer out of range: " + j.dump());
        }
        return DBValue{static_cast<DBInt>(v)};
    }
    if (j.is_number_integer()) return DBValue{j.get<DBInt>()};
    if (j.is_number_float()) return DBValue{j.get<DBFloat>()};
    if (j.is_string()) return DBValue{j.get<DBText>()};
    throw StorageError("Unsupported JSON value in row: " + j.dump());
}

} // namespace db
} // namespace primdb
