#include "../../include/cli/config.h"
#include "../../include/db/errors.h"
#include "../../include/db/types.h"
#include <fstream>
#include <optional>
#include <nlohmann/json.hpp>

namespace primdb {
namespace cli {

namespace {

// Flag values kept apart so they can be applied after the config file
struct Overrides {
    std::optional<std::filesystem::path> root;
    std::optional<parser::WhereSyntax> where_syntax;
    std::optional<ConfirmMode> confirm;
    bool no_timing = false;
    bool no_journal = false;
    bool no_cache = false;
    bool show_help = false;
    std::vector<std::string> commands;
};

const std::string& require_value(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw db::ParseError("Option " + args[i] + " requires a value");
    }
    return args[++i];
}

Overrides parse_args(const std::vector<std::string>& args) {
    Overrides flags;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--root") {
            flags.root = require_value(args, i);
        } else if (arg == "--syntax") {
            flags.where_syntax = where_syntax_from_string(require_value(args, i));
        } else if (arg == "--confirm") {
            flags.confirm = confirm_mode_from_string(require_value(args, i));
        } else if (arg == "--yes") {
            flags.confirm = ConfirmMode::Never;
        } else if (arg == "--no-timing") {
            flags.no_timing = true;
        } else if (arg == "--no-log") {
            flags.no_journal = true;
        } else if (arg == "--no-cache") {
            flags.no_cache = true;
        } else if (arg == "-c" || arg == "--command") {
            flags.commands.push_back(require_value(args, i));
        } else if (arg == "-h" || arg == "--help") {
            flags.show_help = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw db::ParseError("Unknown option: " + arg);
        } else {
            // Positional arguments are commands too
            flags.commands.push_back(arg);
        }
    }
    return flags;
}

} // namespace

std::string confirm_mode_to_string(ConfirmMode mode) {
    switch (mode) {
        case ConfirmMode::Prompt: return "prompt";
        case ConfirmMode::Flag: return "flag";
        case ConfirmMode::Never: return "never";
        default: return "unknown";
    }
}

ConfirmMode confirm_mode_from_string(const std::string& text) {
    const std::string mode = db::to_lower(db::trim(text));
    if (mode == "prompt") return ConfirmMode::Prompt;
    if (mode == "flag") return ConfirmMode::Flag;
    if (mode == "never") return ConfirmMode::Never;
    throw db::ParseError("Invalid confirm mode: '" + text + "' (expected prompt, flag or never)");
}

std::string where_syntax_to_string(parser::WhereSyntax syntax) {
    return syntax == parser::WhereSyntax::Expression ? "expression" : "conditions";
}

parser::WhereSyntax where_syntax_from_string(const std::string& text) {
    const std::string syntax = db::to_lower(db::trim(text));
    if (syntax == "conditions") return parser::WhereSyntax::Conditions;
    if (syntax == "expression") return parser::WhereSyntax::Expression;
    throw db::ParseError("Invalid where syntax: '" + text + "' (expected conditions or expression)");
}

void apply_config_file(Config& config, const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        return;
    }

    std::ifstream in(file);
    if (!in) {
        throw db::ParseError("Cannot open config file: " + file.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(in);
        if (!j.is_object()) {
            throw db::ParseError("Config file must hold a JSON object: " + file.string());
        }

        if (j.contains("where_syntax")) {
            config.where_syntax = where_syntax_from_string(j.at("where_syntax").get<std::string>());
        }
        if (j.contains("confirm")) {
            config.confirm = confirm_mode_from_string(j.at("confirm").get<std::string>());
        }
        if (j.contains("timing")) {
            config.show_timing = j.at("timing").get<bool>();
        }
        if (j.contains("journal")) {
            config.journal = j.at("journal").get<bool>();
        }
        if (j.contains("cache")) {
            config.cache = j.at("cache").get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw db::ParseError("Invalid config file " + file.string() + ": " + e.what());
    }
}

Config load_config(const std::vector<std::string>& args) {
    const Overrides flags = parse_args(args);

    Config config;
    if (flags.root) {
        config.root = *flags.root;
    }
    apply_config_file(config, config.config_file());

    if (flags.where_syntax) config.where_syntax = *flags.where_syntax;
    if (flags.confirm) config.confirm = *flags.confirm;
    if (flags.no_timing) config.show_timing = false;
    if (flags.no_journal) config.journal = false;
    if (flags.no_cache) config.cache = false;
    config.show_help = flags.show_help;
    config.commands = flags.commands;
    return config;
}

std::string usage() {
    return "Usage: primdb [options] [command ...]\n"
           "\n"
           "Options:\n"
           "  --root DIR                       database directory (default: .)\n"
           "  --syntax conditions|expression   where-clause grammar (default: conditions)\n"
           "  --confirm prompt|flag|never      confirmation policy for destructive commands\n"
           "  --yes                            same as --confirm never\n"
           "  --no-timing                      do not print [time] lines\n"
           "  --no-log                         do not write logs/commands.log\n"
           "  --no-cache                       disable the select cache\n"
           "  -c, --command CMD                run CMD and exit (repeatable)\n"
           "  -h, --help                       show this help\n"
           "\n"
           "Without commands an interactive session is started.\n";
}

} // namespace cli
} // namespace primdb
