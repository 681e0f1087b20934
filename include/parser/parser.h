#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "../db/condition.h"
#include "../db/schema.h"
#include "../db/value.h"
#include "../db/where.h"

namespace primdb {
namespace parser {

// Which grammar the text after "where" is read with
enum class WhereSyntax {
    Conditions, // AND-only list of field<op>value comparisons
    Expression  // and/or expression compiled by db::compile_where
};

enum class CommandType {
    CreateTable,
    DropTable,
    ListTables,
    Insert,
    Select,
    Update,
    Delete,
    Help,
    Exit
};

// One parsed input line. Values stay raw (quotes included) until the
// engine coerces them against the table schema.
struct Command {
    CommandType type = CommandType::Help;
    std::string table;
    db::ColumnSpecs columns;   // create_table
    db::RawValues values;      // insert
    db::RawValues set_values;  // update
    db::WhereClause where;     // select/update/delete
    bool confirmed = false;    // trailing --yes
};

// Parser class
class Parser {
public:
    explicit Parser(WhereSyntax syntax = WhereSyntax::Conditions);

    WhereSyntax syntax() const { return syntax_; }

    // Parse one line. Throws ParseError on malformed input.
    Command parse(const std::string& line) const;

private:
    WhereSyntax syntax_;

    // Helper functions for parsing specific commands
    Command parse_create_table(const std::string& rest) const;
    Command parse_drop_table(const std::string& rest) const;
    Command parse_insert(const std::string& rest) const;
    Command parse_select(const std::string& rest) const;
    Command parse_update(const std::string& rest) const;
    Command parse_delete(const std::string& rest) const;

    db::WhereClause parse_where(const std::optional<std::string>& text) const;
};

// Split "<head> where <tail>" at the first unquoted, whole-word "where"
// (any case). The tail is empty when there is no where keyword.
std::pair<std::string, std::optional<std::string>> split_where(const std::string& text);

// Split on a separator that is not inside quotes; blank parts are dropped
std::vector<std::string> split_outside_quotes(const std::string& text, char sep);

// "field:type"
std::pair<std::string, std::string> parse_column_spec(const std::string& spec);

// "field=value"; the value keeps its quotes
std::pair<std::string, std::string> parse_assignment(const std::string& expr);

// Remove a trailing "--yes" token; returns whether one was present
bool take_confirm_flag(std::string& text);

} // namespace parser
} // namespace primdb
