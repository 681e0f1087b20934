#pragma once

#include <optional>
#include <string>
#include <vector>
#include "value.h"

namespace primdb {
namespace db {

// The six comparison operators accepted in a where-clause
enum class CompareOp {
    Eq,
    Ne,
    Gt,
    Lt,
    Ge,
    Le
};

std::string op_to_string(CompareOp op);
std::optional<CompareOp> op_from_string(const std::string& text);

// Compare two values. Ordering against NULL, or across incomparable
// types, is false rather than an error.
bool evaluate_compare(const DBValue& left, CompareOp op, const DBValue& right);

// Condition for filtering rows. The value stays raw until it is coerced
// against the schema of the table being queried.
struct Condition {
    std::string field;
    CompareOp op;
    std::string raw_value;
};

// An AND of conditions
using Conjunction = std::vector<Condition>;

// Parse one comparison such as "age>=30" or name="Alice".
// The operator is the longest one starting at the first operator character.
Condition parse_comparison(const std::string& phrase);

// Split a where-clause on AND (case-insensitive) outside quotes and parse each part.
// OR is rejected with a ParseError.
Conjunction parse_conjunction(const std::string& where_text);

// Whitespace tokenizer that keeps quoted segments, quotes included, in one token
std::vector<std::string> split_respecting_quotes(const std::string& text);

} // namespace db
} // namespace primdb
