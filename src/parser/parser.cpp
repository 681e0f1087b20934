#include "../../include/parser/parser.h"
#include "../../include/db/errors.h"
#include "../../include/db/types.h"
#include <cctype>

namespace primdb {
namespace parser {

namespace {

const std::string kConfirmFlag = "--yes";

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// First whitespace-delimited word and the remainder, both trimmed
std::pair<std::string, std::string> split_first_word(const std::string& text) {
    const std::string trimmed = db::trim(text);
    size_t end = 0;
    while (end < trimmed.size() && !is_space(trimmed[end])) {
        ++end;
    }
    return {trimmed.substr(0, end), db::trim(trimmed.substr(end))};
}

std::string single_table_name(const std::string& head, const std::string& usage) {
    const auto tokens = db::split_respecting_quotes(head);
    if (tokens.size() != 1) {
        throw db::ParseError("Syntax: " + usage);
    }
    return tokens[0];
}

} // namespace

Parser::Parser(WhereSyntax syntax)
    : syntax_(syntax) {
}

// Parse a command line
Command Parser::parse(const std::string& line) const {
    std::string text = db::trim(line);
    if (text.empty()) {
        throw db::ParseError("Empty command");
    }

    const bool confirmed = take_confirm_flag(text);
    auto [word, rest] = split_first_word(text);
    const std::string keyword = db::to_lower(word);

    Command cmd;
    if (keyword == "exit" || keyword == "quit" || keyword == "help" || keyword == "list_tables") {
        if (!rest.empty()) {
            throw db::ParseError("Syntax: " + keyword + " takes no arguments");
        }
        if (keyword == "help") {
            cmd.type = CommandType::Help;
        } else if (keyword == "list_tables") {
            cmd.type = CommandType::ListTables;
        } else {
            cmd.type = CommandType::Exit;
        }
    } else if (keyword == "create_table") {
        cmd = parse_create_table(rest);
    } else if (keyword == "drop_table") {
        cmd = parse_drop_table(rest);
    } else if (keyword == "insert") {
        cmd = parse_insert(rest);
    } else if (keyword == "select") {
        cmd = parse_select(rest);
    } else if (keyword == "update") {
        cmd = parse_update(rest);
    } else if (keyword == "delete") {
        cmd = parse_delete(rest);
    } else {
        throw db::ParseError("Unknown command: '" + word + "'");
    }

    cmd.confirmed = confirmed;
    return cmd;
}

Command Parser::parse_create_table(const std::string& rest) const {
    const auto tokens = db::split_respecting_quotes(rest);
    if (tokens.size() < 2) {
        throw db::ParseError("Syntax: create_table <table> <field:type> ...");
    }

    Command cmd;
    cmd.type = CommandType::CreateTable;
    cmd.table = tokens[0];
    for (size_t i = 1; i < tokens.size(); ++i) {
        cmd.columns.push_back(parse_column_spec(tokens[i]));
    }
    return cmd;
}

Command Parser::parse_drop_table(const std::string& rest) const {
    Command cmd;
    cmd.type = CommandType::DropTable;
    cmd.table = single_table_name(rest, "drop_table <table> [--yes]");
    return cmd;
}

Command Parser::parse_insert(const std::string& rest) const {
    const auto tokens = db::split_respecting_quotes(rest);
    if (tokens.size() < 2) {
        throw db::ParseError("Syntax: insert <table> <field=value> ...");
    }

    Command cmd;
    cmd.type = CommandType::Insert;
    cmd.table = tokens[0];
    for (size_t i = 1; i < tokens.size(); ++i) {
        auto [field, raw] = parse_assignment(tokens[i]);
        if (!cmd.values.emplace(field, raw).second) {
            throw db::ParseError("Field '" + field + "' is assigned twice");
        }
    }
    return cmd;
}

Command Parser::parse_select(const std::string& rest) const {
    auto [head, where_text] = split_where(rest);

    Command cmd;
    cmd.type = CommandType::Select;
    cmd.table = single_table_name(head, "select <table> [where <condition>]");
    cmd.where = parse_where(where_text);
    return cmd;
}

Command Parser::parse_update(const std::string& rest) const {
    static const std::string usage = "update <table> set <field=value>, ... [where <condition>]";

    auto [head, where_text] = split_where(rest);
    auto [table, after_table] = split_first_word(head);
    auto [set_word, assignments] = split_first_word(after_table);
    if (table.empty() || db::to_lower(set_word) != "set" || assignments.empty()) {
        throw db::ParseError("Syntax: " + usage);
    }

    Command cmd;
    cmd.type = CommandType::Update;
    cmd.table = table;
    for (const auto& part : split_outside_quotes(assignments, ',')) {
        auto [field, raw] = parse_assignment(part);
        if (!cmd.set_values.emplace(field, raw).second) {
            throw db::ParseError("Field '" + field + "' is assigned twice");
        }
    }
    if (cmd.set_values.empty()) {
        throw db::ParseError("Syntax: " + usage);
    }
    cmd.where = parse_where(where_text);
    return cmd;
}

Command Parser::parse_delete(const std::string& rest) const {
    auto [head, where_text] = split_where(rest);

    Command cmd;
    cmd.type = CommandType::Delete;
    cmd.table = single_table_name(head, "delete <table> [where <condition>] [--yes]");
    cmd.where = parse_where(where_text);
    return cmd;
}

db::WhereClause Parser::parse_where(const std::optional<std::string>& text) const {
    if (!text) {
        return std::monostate{};
    }
    if (text->empty()) {
        throw db::ParseError("Empty where clause");
    }

    if (syntax_ == WhereSyntax::Expression) {
        return db::Expression{*text};
    }
    return db::parse_conjunction(*text);
}

std::pair<std::string, std::optional<std::string>> split_where(const std::string& text) {
    static const std::string keyword = "where";

    bool in_quotes = false;
    char quote_char = '\0';
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_quotes) {
            if (c == quote_char) in_quotes = false;
            continue;
        }
        if (c == '\'' || c == '"') {
            in_quotes = true;
            quote_char = c;
            continue;
        }

        const bool starts_word = i == 0 || is_space(text[i - 1]);
        const size_t end = i + keyword.size();
        const bool ends_word = end == text.size() || (end < text.size() && is_space(text[end]));
        if (starts_word && ends_word && db::to_lower(text.substr(i, keyword.size())) == keyword) {
            return {db::trim(text.substr(0, i)), db::trim(text.substr(end))};
        }
    }
    return {db::trim(text), std::nullopt};
}

std::vector<std::string> split_outside_quotes(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::string current;
    bool in_quotes = false;
    char quote_char = '\0';

    for (char c : text) {
        if (c == '\'' || c == '"') {
            if (!in_quotes) {
                in_quotes = true;
                quote_char = c;
            } else if (c == quote_char) {
                in_quotes = false;
            }
        }

        if (c == sep && !in_quotes) {
            std::string part = db::trim(current);
            if (!part.empty()) parts.push_back(part);
            current.clear();
            continue;
        }
        current += c;
    }

    if (in_quotes) {
        throw db::ParseError("Unterminated quote in: " + text);
    }
    std::string tail = db::trim(current);
    if (!tail.empty()) parts.push_back(tail);
    return parts;
}

std::pair<std::string, std::string> parse_column_spec(const std::string& spec) {
    const auto colon = spec.find(':');
    if (colon == std::string::npos) {
        throw db::ParseError("Expected <field:type>, got: '" + spec + "'");
    }

    std::string field = db::trim(spec.substr(0, colon));
    std::string type_name = db::trim(spec.substr(colon + 1));
    if (field.empty() || type_name.empty()) {
        throw db::ParseError("Expected <field:type>, got: '" + spec + "'");
    }
    return {field, type_name};
}

std::pair<std::string, std::string> parse_assignment(const std::string& expr) {
    const auto eq = expr.find('=');
    if (eq == std::string::npos) {
        throw db::ParseError("Expected <field=value>, got: '" + expr + "'");
    }

    std::string field = db::trim(expr.substr(0, eq));
    std::string raw = db::trim(expr.substr(eq + 1));
    if (!db::is_identifier(field)) {
        throw db::ParseError("Invalid field name: '" + field + "'");
    }
    return {field, raw};
}

bool take_confirm_flag(std::string& text) {
    if (text.size() < kConfirmFlag.size() ||
        text.compare(text.size() - kConfirmFlag.size(), kConfirmFlag.size(), kConfirmFlag) != 0) {
        return false;
    }

    const size_t start = text.size() - kConfirmFlag.size();
    if (start > 0 && !is_space(text[start - 1])) {
        return false;
    }
    text = db::trim(text.substr(0, start));
    return true;
}

} // namespace parser
} // namespace primdb
