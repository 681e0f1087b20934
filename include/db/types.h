#pragma once

#include <set>
#include <string>
#include "value.h"

namespace primdb {
namespace db {

// Canonical boolean tokens, compared after lower-casing
const std::set<std::string>& bool_true_tokens();
const std::set<std::string>& bool_false_tokens();

// True for the four declarable type names: int, float, str, bool
bool is_supported_type(const std::string& type_name);

// Text helpers shared by the coercion layer and the parsers
std::string trim(const std::string& text);
std::string to_lower(const std::string& text);

// Removes one matching pair of surrounding single or double quotes
std::string strip_quotes(const std::string& text);

// Unquoted "null" or "none", any case
bool is_null_token(const std::string& raw);

// [A-Za-z_][A-Za-z0-9_]*
bool is_identifier(const std::string& name);

// Convert raw user text to a typed value.
// Null tokens become NULL for every type; anything that cannot be
// converted raises TypeMismatchError.
DBValue coerce(const std::string& raw, ColumnType type);
DBValue coerce(const std::string& raw, const std::string& type_name);

} // namespace db
} // namespace primdb
