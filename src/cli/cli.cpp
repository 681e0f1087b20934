#include "../../include/cli/cli.h"
#include "../../include/db/errors.h"
#include "../../include/db/types.h"
#include <algorithm>
#include <iomanip>
#include <optional>
#include <set>
#include <variant>

namespace primdb {
namespace cli {

namespace {

std::optional<db::CommandJournal> make_journal(const Config& config) {
    if (!config.journal) return std::nullopt;
    return db::CommandJournal(config.journal_file());
}

std::string schema_text(const db::Schema& schema) {
    std::string text;
    for (const auto& [name, type] : schema.to_specs()) {
        if (!text.empty()) text += ", ";
        text += name + ":" + type;
    }
    return text;
}

// Bordered table in the same layout for query results and the table list
void print_grid(std::ostream& out, const std::vector<std::string>& headers,
                const std::vector<std::vector<std::string>>& cells) {
    std::vector<size_t> widths(headers.size());
    for (size_t i = 0; i < headers.size(); ++i) {
        widths[i] = headers[i].length();
    }
    for (const auto& row : cells) {
        for (size_t i = 0; i < headers.size() && i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].length());
        }
    }

    auto separator = [&]() {
        for (size_t i = 0; i < headers.size(); ++i) {
            out << "+-" << std::string(widths[i], '-') << "-";
        }
        out << "+" << std::endl;
    };

    separator();
    for (size_t i = 0; i < headers.size(); ++i) {
        out << "| " << std::left << std::setw(widths[i]) << headers[i] << " ";
    }
    out << "|" << std::endl;
    separator();

    for (const auto& row : cells) {
        for (size_t i = 0; i < headers.size(); ++i) {
            out << "| " << std::left << std::setw(widths[i]) << (i < row.size() ? row[i] : std::string()) << " ";
        }
        out << "|" << std::endl;
    }
    separator();
}

} // namespace

CLI::CLI(const Config& config, std::istream& in, std::ostream& out, std::ostream& err)
    : config_(config),
      in_(in),
      out_(out),
      err_(err),
      db_(config.root, config.cache),
      instrumented_(db_, make_journal(config), config.show_timing ? &out : nullptr),
      parser_(config.where_syntax) {
}

void CLI::start() {
    out_ << "primdb: file-backed record store. Type 'help' for usage information, 'exit' to quit.\n";

    while (true) {
        out_ << "primdb> " << std::flush;

        std::string line;
        if (!std::getline(in_, line)) {
            out_ << std::endl;
            break; // EOF
        }

        if (!execute_command(line)) {
            out_ << "Goodbye!" << std::endl;
            break;
        }
    }
}

bool CLI::execute_command(const std::string& line) {
    if (db::trim(line).empty()) {
        return true;
    }

    try {
        const parser::Command cmd = parser_.parse(line);

        switch (cmd.type) {
            case parser::CommandType::Exit:
                return false;
            case parser::CommandType::Help:
                print_help();
                break;
            case parser::CommandType::CreateTable:
                handle_create_table(cmd);
                break;
            case parser::CommandType::DropTable:
                handle_drop_table(cmd);
                break;
            case parser::CommandType::ListTables:
                handle_list_tables();
                break;
            case parser::CommandType::Insert:
                handle_insert(cmd);
                break;
            case parser::CommandType::Select:
                handle_select(cmd);
                break;
            case parser::CommandType::Update:
                handle_update(cmd);
                break;
            case parser::CommandType::Delete:
                handle_delete(cmd);
                break;
        }
    } catch (const db::DBError& e) {
        out_ << "Error: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        err_ << "Unexpected error: " << e.what() << std::endl;
    }
    return true;
}

void CLI::handle_create_table(const parser::Command& cmd) {
    instrumented_.create_table(cmd.table, cmd.columns);
    out_ << "OK: table '" << cmd.table << "' created." << std::endl;
}

void CLI::handle_drop_table(const parser::Command& cmd) {
    // Fail fast on a missing table instead of asking first
    db_.schema(cmd.table);
    if (!confirm(cmd, "Drop table '" + cmd.table + "'?")) {
        return;
    }

    instrumented_.drop_table(cmd.table);
    out_ << "OK: table '" << cmd.table << "' dropped." << std::endl;
}

void CLI::handle_list_tables() {
    auto tables = instrumented_.list_tables();
    if (tables.empty()) {
        out_ << "No tables found." << std::endl;
        return;
    }

    std::vector<std::vector<std::string>> cells;
    for (const auto& info : tables) {
        cells.push_back({info.name, schema_text(info.schema), info.rows_file.string()});
    }
    print_grid(out_, {"table", "schema", "file"}, cells);
    out_ << tables.size() << " table(s) found." << std::endl;
}

void CLI::handle_insert(const parser::Command& cmd) {
    db::Record row = instrumented_.insert(cmd.table, cmd.values);
    out_ << "OK: inserted record id=" << db::value_to_string(row.at(db::kIdField)) << "." << std::endl;
}

void CLI::handle_select(const parser::Command& cmd) {
    auto result = instrumented_.select(cmd.table, cmd.where);
    print_results(result, db_.schema(cmd.table));
}

void CLI::handle_update(const parser::Command& cmd) {
    db_.schema(cmd.table);
    if (std::holds_alternative<std::monostate>(cmd.where) &&
        !confirm(cmd, "Update every record of '" + cmd.table + "'?")) {
        return;
    }

    size_t count = instrumented_.update(cmd.table, cmd.set_values, cmd.where);
    out_ << "OK: updated " << count << " record(s)." << std::endl;
}

void CLI::handle_delete(const parser::Command& cmd) {
    db_.schema(cmd.table);
    if (std::holds_alternative<std::monostate>(cmd.where) &&
        !confirm(cmd, "Delete every record of '" + cmd.table + "'?")) {
        return;
    }

    size_t count = instrumented_.remove(cmd.table, cmd.where);
    out_ << "OK: deleted " << count << " record(s)." << std::endl;
}

bool CLI::confirm(const parser::Command& cmd, const std::string& question) {
    if (cmd.confirmed || config_.confirm == ConfirmMode::Never) {
        return true;
    }

    if (config_.confirm == ConfirmMode::Flag) {
        out_ << "Cancelled: add --yes to confirm." << std::endl;
        return false;
    }

    out_ << question << " [yes/no]: " << std::flush;
    std::string answer;
    if (!std::getline(in_, answer)) {
        out_ << std::endl << "Cancelled." << std::endl;
        return false;
    }

    const std::string reply = db::to_lower(db::trim(answer));
    if (reply == "y" || reply == "yes" || reply == "д" || reply == "да") {
        return true;
    }
    out_ << "Cancelled." << std::endl;
    return false;
}

void CLI::print_results(const db::SelectResult& result, const db::Schema& schema) {
    if (result.rows.empty()) {
        out_ << (result.from_cache ? "Empty result (cache)." : "Empty result.") << std::endl;
        return;
    }

    const auto columns = result_columns(result.rows, schema);

    std::vector<std::vector<std::string>> cells;
    cells.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        std::vector<std::string> line;
        for (const auto& column : columns) {
            auto it = row.find(column);
            line.push_back(it == row.end() ? "" : db::value_to_string(it->second));
        }
        cells.push_back(std::move(line));
    }

    print_grid(out_, columns, cells);
    out_ << result.rows.size() << " row(s) returned." << std::endl;
    if (result.from_cache) {
        out_ << "[cache]" << std::endl;
    }
}

std::vector<std::string> result_columns(const std::vector<db::Record>& rows, const db::Schema& schema) {
    std::vector<std::string> columns{db::kIdField};
    for (const auto& field : schema.fields()) {
        columns.push_back(field.name);
    }

    std::set<std::string> extra;
    for (const auto& row : rows) {
        for (const auto& [name, _] : row) {
            if (std::find(columns.begin(), columns.end(), name) == columns.end()) {
                extra.insert(name);
            }
        }
    }
    columns.insert(columns.end(), extra.begin(), extra.end());
    return columns;
}

void CLI::print_help() const {
    out_ << "primdb Help:\n"
         << "-----------\n"
         << "create_table <table> <field:type> ...\n"
         << "  - Create a table. Types: int, float, str, bool. 'id' is added automatically.\n\n"
         << "drop_table <table> [--yes]\n"
         << "  - Remove a table and its rows\n\n"
         << "list_tables\n"
         << "  - List all tables with their schema and data file\n\n"
         << "insert <table> <field=value> ...\n"
         << "  - Insert one record; every field must be given\n\n"
         << "select <table> [where <condition>]\n"
         << "  - Query records\n\n"
         << "update <table> set <field=value>, ... [where <condition>] [--yes]\n"
         << "  - Change matching records\n\n"
         << "delete <table> [where <condition>] [--yes]\n"
         << "  - Delete matching records\n\n";

    if (parser_.syntax() == parser::WhereSyntax::Expression) {
        out_ << "Conditions: and/or expressions over fields and literals, e.g.\n"
             << "  age >= 30 and (is_active or name == \"Bob\")\n\n";
    } else {
        out_ << "Conditions: comparisons joined by AND, e.g.\n"
             << "  age>=30 and is_active=true\n"
             << "  Operators: = != > < >= <=\n\n";
    }

    out_ << "Values: null/none for NULL; true/false, yes/no, 1/0 for bool; quote strings with spaces.\n\n"
         << "Special commands:\n"
         << "  help - Display this help\n"
         << "  exit/quit - Exit primdb\n";
}

} // namespace cli
} // namespace primdb
