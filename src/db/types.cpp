#include "../../include/db/types.h"
#include "../../include/db/errors.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace primdb {
namespace db {

const std::set<std::string>& bool_true_tokens() {
    static const std::set<std::string> tokens = {"true", "1", "yes", "y", "да", "д"};
    return tokens;
}

const std::set<std::string>& bool_false_tokens() {
    static const std::set<std::string> tokens = {"false", "0", "no", "n", "нет", "н"};
    return tokens;
}

bool is_supported_type(const std::string& type_name) {
    return string_to_column_type(type_name).has_value();
}

std::string trim(const std::string& text) {
    const auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";

    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

// ASCII plus the basic Cyrillic block (U+0400..U+042F) in UTF-8
std::string to_lower(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c == 0xD0 && i + 1 < text.size()) {
            const auto next = static_cast<unsigned char>(text[i + 1]);
            if (next >= 0x90 && next <= 0x9F) {
                result += static_cast<char>(0xD0);
                result += static_cast<char>(next + 0x20);
                ++i;
                continue;
            }
            if (next >= 0xA0 && next <= 0xAF) {
                result += static_cast<char>(0xD1);
                result += static_cast<char>(next - 0x20);
                ++i;
                continue;
            }
            if (next >= 0x80 && next <= 0x8F) {
                result += static_cast<char>(0xD1);
                result += static_cast<char>(next + 0x10);
                ++i;
                continue;
            }
        }
        result += static_cast<char>(std::tolower(c));
    }
    return result;
}

std::string strip_quotes(const std::string& text) {
    std::string value = trim(text);
    if (value.size() >= 2 && value.front() == value.back() &&
        (value.front() == '\'' || value.front() == '"')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

bool is_null_token(const std::string& raw) {
    const std::string lowered = to_lower(trim(raw));
    return lowered == "null" || lowered == "none";
}

bool is_identifier(const std::string& name) {
    if (name.empty()) return false;
    const auto first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_') return false;
    return std::all_of(name.begin() + 1, name.end(), [](char c) {
        const auto u = static_cast<unsigned char>(c);
        return std::isalnum(u) || u == '_';
    });
}

namespace {

TypeMismatchError mismatch(const std::string& raw, ColumnType type) {
    return TypeMismatchError("Invalid " + type_to_string(type) + " value: '" + raw + "'");
}

DBInt parse_int(const std::string& raw) {
    const std::string text = trim(strip_quotes(raw));
    if (text.empty()) throw mismatch(raw, ColumnType::Int);
    try {
        std::size_t pos = 0;
        long long value = std::stoll(text, &pos, 10);
        if (pos != text.size()) throw mismatch(raw, ColumnType::Int);
        return static_cast<DBInt>(value);
    } catch (const std::invalid_argument&) {
        throw mismatch(raw, ColumnType::Int);
    } catch (const std::out_of_range&) {
        throw mismatch(raw, ColumnType::Int);
    }
}

DBFloat parse_float(const std::string& raw) {
    const std::string text = trim(strip_quotes(raw));
    if (text.empty()) throw mismatch(raw, ColumnType::Float);
    try {
        std::size_t pos = 0;
        if (text.find_first_of("xX") != std::string::npos) throw mismatch(raw, ColumnType::Float);
        double value = std::stod(text, &pos);
        if (pos != text.size() || !std::isfinite(value)) throw mismatch(raw, ColumnType::Float);
        return value;
    } catch (const std::invalid_argument&) {
        throw mismatch(raw, ColumnType::Float);
    } catch (const std::out_of_range&) {
        throw mismatch(raw, ColumnType::Float);
    }
}

DBBool parse_bool(const std::string& raw) {
    const std::string token = to_lower(trim(strip_quotes(raw)));
    if (bool_true_tokens().count(token)) return true;
    if (bool_false_tokens().count(token)) return false;
    throw mismatch(raw, ColumnType::Bool);
}

} // namespace

DBValue coerce(const std::string& raw, ColumnType type) {
    const std::string text = trim(raw);
    if (is_null_token(text)) {
        return DBNull{};
    }

    switch (type) {
        case ColumnType::Text:
            return DBValue{strip_quotes(text)};
        case ColumnType::Bool:
            return DBValue{parse_bool(text)};
        case ColumnType::Int:
            return DBValue{parse_int(text)};
        case ColumnType::Float:
            return DBValue{parse_float(text)};
        default:
            throw TypeMismatchError("Unsupported type: '" + type_to_string(type) + "'");
    }
}

DBValue coerce(const std::string& raw, const std::string& type_name) {
    auto type = string_to_column_type(type_name);
    if (!type) {
        throw TypeMismatchError("Unsupported type: '" + type_name + "'");
    }
    return coerce(raw, *type);
}

} // namespace db
} // namespace primdb
