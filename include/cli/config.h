#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "../parser/parser.h"

namespace primdb {
namespace cli {

// When destructive commands ask before running
enum class ConfirmMode {
    Prompt, // ask yes/no on the input stream
    Flag,   // the command itself must carry --yes
    Never   // run without asking
};

std::string confirm_mode_to_string(ConfirmMode mode);
ConfirmMode confirm_mode_from_string(const std::string& text);

std::string where_syntax_to_string(parser::WhereSyntax syntax);
parser::WhereSyntax where_syntax_from_string(const std::string& text);

// Runtime settings. Sources in increasing priority: these defaults,
// <root>/primdb.json, then command-line flags.
struct Config {
    std::filesystem::path root = ".";
    parser::WhereSyntax where_syntax = parser::WhereSyntax::Conditions;
    ConfirmMode confirm = ConfirmMode::Prompt;
    bool show_timing = true;
    bool journal = true;
    bool cache = true;
    bool show_help = false;

    // One-shot commands; the REPL starts only when this is empty
    std::vector<std::string> commands;

    std::filesystem::path config_file() const { return root / "primdb.json"; }
    std::filesystem::path journal_file() const { return root / "logs" / "commands.log"; }
};

// Overlay the keys present in a JSON config file. A missing file is
// ignored; unreadable JSON or a bad value raises ParseError.
void apply_config_file(Config& config, const std::filesystem::path& file);

// Build the configuration from program arguments (without argv[0]).
// Throws ParseError on an unknown flag, a missing argument or a bad value.
Config load_config(const std::vector<std::string>& args);

// Usage text for -h/--help
std::string usage();

} // namespace cli
} // namespace primdb
