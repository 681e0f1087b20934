#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "config.h"
#include "../db/database.h"
#include "../db/instrumented.h"
#include "../parser/parser.h"

namespace primdb {
namespace cli {

// Class to manage the command-line interface
class CLI {
public:
    explicit CLI(const Config& config, std::istream& in = std::cin,
                 std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // Start the interactive loop; returns on exit/quit or end of input
    void start();

    // Execute a single command line. Returns false when the line asks to exit.
    bool execute_command(const std::string& line);

    // Print the rows of a select as a table
    void print_results(const db::SelectResult& result, const db::Schema& schema);

    db::Database& database() { return db_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
    db::Database db_;
    db::InstrumentedDatabase instrumented_;
    parser::Parser parser_;

    // Handle specific command types
    void handle_create_table(const parser::Command& cmd);
    void handle_drop_table(const parser::Command& cmd);
    void handle_list_tables();
    void handle_insert(const parser::Command& cmd);
    void handle_select(const parser::Command& cmd);
    void handle_update(const parser::Command& cmd);
    void handle_delete(const parser::Command& cmd);

    // Apply the confirmation policy; false means the command is skipped
    bool confirm(const parser::Command& cmd, const std::string& question);

    // Print help/usage information
    void print_help() const;
};

// Column order for rendering: id, the schema fields, then any other keys sorted
std::vector<std::string> result_columns(const std::vector<db::Record>& rows, const db::Schema& schema);

} // namespace cli
} // namespace primdb
