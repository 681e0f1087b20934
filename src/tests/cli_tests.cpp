#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "../../include/cli/cli.h"
#include "../../include/cli/config.h"
#include "../../include/db/errors.h"
#include "test_util.h"

using namespace primdb;
using namespace primdb::cli;
using primdb::testing::clean_dir;
using primdb::testing::read_file;
using primdb::testing::throws;
using primdb::testing::write_file;

static const std::filesystem::path kBase = "./primdb_cli_testdata";

static Config quiet_config() {
    Config config;
    config.root = kBase;
    config.show_timing = false;
    return config;
}

static bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

int main() {
    clean_dir(kBase);

    // 1) users scenario through the command loop
    {
        std::istringstream in;
        std::ostringstream out, err;
        Config config = quiet_config();
        config.confirm = ConfirmMode::Flag;
        CLI cli(config, in, out, err);

        assert(cli.execute_command("create_table users name:str age:int is_active:bool"));
        assert(cli.execute_command("insert users name=\"Alice\" age=30 is_active=true"));
        assert(cli.execute_command("insert users name=Bob age=25 is_active=false"));
        assert(contains(out.str(), "OK: table 'users' created."));
        assert(contains(out.str(), "OK: inserted record id=1."));
        assert(contains(out.str(), "OK: inserted record id=2."));

        out.str("");
        cli.execute_command("select users where age>=30");
        const std::string table = out.str();
        assert(contains(table, "| id | name  | age | is_active |"));
        assert(contains(table, "| 1  | Alice | 30  | true      |"));
        assert(!contains(table, "Bob"));
        assert(contains(table, "1 row(s) returned."));
        assert(!contains(table, "[cache]"));

        out.str("");
        cli.execute_command("select users where age>=30");
        assert(contains(out.str(), "[cache]"));

        out.str("");
        cli.execute_command("update users set age=31 where name=\"Alice\"");
        cli.execute_command("delete users where id=1");
        assert(contains(out.str(), "OK: updated 1 record(s)."));
        assert(contains(out.str(), "OK: deleted 1 record(s)."));

        out.str("");
        cli.execute_command("select users where id=1");
        assert(contains(out.str(), "Empty result."));

        out.str("");
        cli.execute_command("list_tables");
        assert(contains(out.str(), "| table | schema"));
        assert(contains(out.str(), "name:str, age:int, is_active:bool"));

        assert(!cli.execute_command("exit"));
        assert(err.str().empty());
    }

    // 2) domain errors print one line and the session goes on
    {
        std::istringstream in;
        std::ostringstream out, err;
        CLI cli(quiet_config(), in, out, err);

        assert(cli.execute_command("select ghosts"));
        assert(cli.execute_command("insert users name=Carol age=old is_active=true"));
        assert(cli.execute_command("select users where age>1 or id=2"));
        assert(cli.execute_command("create_table users x:int"));
        assert(cli.execute_command("frobnicate"));

        const std::string text = out.str();
        assert(contains(text, "Error: Table 'ghosts' not found"));
        assert(contains(text, "Error: Invalid int value: 'old'"));
        assert(contains(text, "Error: OR is not supported in conditions (use AND)"));
        assert(contains(text, "Error: Table 'users' already exists"));
        assert(contains(text, "Error: Unknown command: 'frobnicate'"));
        assert(err.str().empty());

        // nothing was consumed by the failed insert
        out.str("");
        cli.execute_command("insert users name=Carol age=40 is_active=true");
        assert(contains(out.str(), "OK: inserted record id=3."));
    }

    // 3) confirmation in prompt mode reads the answer from the input stream
    {
        std::istringstream in("no\nyes\nДа\n");
        std::ostringstream out, err;
        CLI cli(quiet_config(), in, out, err);

        cli.execute_command("delete users");
        assert(contains(out.str(), "Delete every record of 'users'? [yes/no]: "));
        assert(contains(out.str(), "Cancelled."));

        out.str("");
        cli.execute_command("delete users where id=999");
        assert(contains(out.str(), "OK: deleted 0 record(s)."));
        assert(!contains(out.str(), "[yes/no]"));

        cli.execute_command("update users set is_active=false");
        assert(contains(out.str(), "OK: updated 2 record(s)."));

        // the localized answer is accepted too
        out.str("");
        cli.execute_command("update users set is_active=true");
        assert(contains(out.str(), "OK: updated 2 record(s)."));

        // input exhausted: treated as a refusal
        out.str("");
        cli.execute_command("drop_table users");
        assert(contains(out.str(), "Cancelled."));
        assert(cli.database().table_exists("users"));
    }

    // 4) flag mode needs --yes; never mode does not ask
    {
        std::istringstream in;
        std::ostringstream out, err;
        Config config = quiet_config();
        config.confirm = ConfirmMode::Flag;
        CLI cli(config, in, out, err);

        cli.execute_command("drop_table users");
        assert(contains(out.str(), "Cancelled: add --yes to confirm."));
        assert(cli.database().table_exists("users"));

        cli.execute_command("drop_table users --yes");
        assert(contains(out.str(), "OK: table 'users' dropped."));
        assert(!cli.database().table_exists("users"));

        out.str("");
        cli.execute_command("drop_table users --yes");
        assert(contains(out.str(), "Error: Table 'users' not found"));

        std::ostringstream out2;
        Config never = quiet_config();
        never.confirm = ConfirmMode::Never;
        CLI unattended(never, in, out2, err);
        unattended.execute_command("create_table t v:int");
        unattended.execute_command("insert t v=1");
        unattended.execute_command("delete t");
        assert(contains(out2.str(), "OK: deleted 1 record(s)."));
    }

    // 5) expression syntax and the REPL loop
    {
        std::istringstream in(
            "create_table pets name:str legs:int\n"
            "insert pets name=Rex legs=4\n"
            "insert pets name=Tweety legs=2\n"
            "\n"
            "select pets where legs > 2 or name == 'Tweety'\n"
            "select pets where len(name) > 1\n"
            "quit\n"
            "select pets\n");
        std::ostringstream out, err;
        Config config = quiet_config();
        config.where_syntax = parser::WhereSyntax::Expression;
        CLI cli(config, in, out, err);
        cli.start();

        const std::string text = out.str();
        assert(contains(text, "primdb> "));
        assert(contains(text, "2 row(s) returned."));
        assert(contains(text, "Error: Function calls are not allowed"));
        assert(contains(text, "Goodbye!"));
        // the line after quit is never executed
        size_t returned = 0;
        for (size_t pos = text.find("row(s) returned."); pos != std::string::npos;
             pos = text.find("row(s) returned.", pos + 1)) {
            ++returned;
        }
        assert(returned == 1);
    }

    // 6) timing and journal follow the configuration
    {
        std::istringstream in;
        std::ostringstream out, err;
        Config config = quiet_config();
        config.show_timing = true;
        CLI cli(config, in, out, err);
        cli.execute_command("list_tables");
        assert(contains(out.str(), "[time] list_tables: "));
        assert(contains(read_file(config.journal_file()), "\tlist_tables\t"));
    }

    // 7) configuration sources
    {
        Config defaults = load_config({});
        assert(defaults.root == ".");
        assert(defaults.where_syntax == parser::WhereSyntax::Conditions);
        assert(defaults.confirm == ConfirmMode::Prompt);
        assert(defaults.show_timing && defaults.journal && defaults.cache);

        write_file(kBase / "primdb.json",
                   R"({"where_syntax": "expression", "confirm": "flag", "timing": false, "cache": false})");
        Config file = load_config({"--root", kBase.string()});
        assert(file.where_syntax == parser::WhereSyntax::Expression);
        assert(file.confirm == ConfirmMode::Flag);
        assert(!file.show_timing && !file.cache && file.journal);

        Config flags = load_config({"--root", kBase.string(), "--syntax", "conditions", "--yes",
                                    "--no-log", "-c", "list_tables", "select t"});
        assert(flags.where_syntax == parser::WhereSyntax::Conditions);
        assert(flags.confirm == ConfirmMode::Never);
        assert(!flags.journal);
        assert((flags.commands == std::vector<std::string>{"list_tables", "select t"}));
        assert(load_config({"--help"}).show_help);

        assert(throws<db::ParseError>([] { load_config({"--syntax", "sql"}); }));
        assert(throws<db::ParseError>([] { load_config({"--confirm"}); }));
        assert(throws<db::ParseError>([] { load_config({"--verbose"}); }));

        write_file(kBase / "primdb.json", R"({"timing": "often"})");
        assert(throws<db::ParseError>([] { load_config({"--root", kBase.string()}); }));
        write_file(kBase / "primdb.json", "{broken");
        assert(throws<db::ParseError>([] { load_config({"--root", kBase.string()}); }));
    }

    clean_dir(kBase);
    std::cout << "All cli tests passed.\n";
    return 0;
}
