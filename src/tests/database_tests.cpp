#include <cassert>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "../../include/db/database.h"
#include "../../include/db/errors.h"
#include "../../include/db/instrumented.h"
#include "test_util.h"

using namespace primdb::db;
using primdb::testing::clean_dir;
using primdb::testing::read_file;
using primdb::testing::throws;
using primdb::testing::write_file;

static const ColumnSpecs kUsers{{"name", "str"}, {"age", "int"}, {"is_active", "bool"}};

static DBInt id_of(const Record& row) {
    return std::get<DBInt>(row.at("id"));
}

int main() {
    const std::filesystem::path base = "./primdb_testdata";
    clean_dir(base);

    // 1) users scenario end to end
    {
        Database db(base);
        db.create_table("users", kUsers);

        Record alice = db.insert("users", {{"name", "\"Alice\""}, {"age", "30"}, {"is_active", "true"}});
        Record bob = db.insert("users", {{"name", "Bob"}, {"age", "25"}, {"is_active", "false"}});
        assert(id_of(alice) == 1 && id_of(bob) == 2);

        auto result = db.select("users", parse_conjunction("age>=30"));
        assert(result.rows.size() == 1);
        assert(std::get<DBText>(result.rows[0].at("name")) == "Alice");

        assert(db.update("users", {{"age", "31"}}, parse_conjunction("name=\"Alice\"")) == 1);
        result = db.select("users", parse_conjunction("id=1"));
        assert(std::get<DBInt>(result.rows[0].at("age")) == 31);

        assert(db.remove("users", parse_conjunction("id=1")) == 1);
        result = db.select("users");
        assert(result.rows.size() == 1 && id_of(result.rows[0]) == 2);

        auto tables = db.list_tables();
        assert(tables.size() == 1 && tables[0].name == "users");
        assert(tables[0].rows_file == base / "data" / "users.json");
    }

    // 2) catalog errors
    {
        Database db(base);
        assert(throws<TableExistsError>([&] { db.create_table("users", kUsers); }));
        assert(throws<TableNotFoundError>([&] { db.drop_table("ghosts"); }));
        assert(throws<TableNotFoundError>([&] { db.select("ghosts"); }));
        assert(throws<TableNotFoundError>([&] { db.insert("ghosts", {{"a", "1"}}); }));
        assert(throws<ValidationError>([&] { db.create_table("bad-name", kUsers); }));
        assert(throws<SchemaError>([&] { db.create_table("things", ColumnSpecs{{"id", "int"}}); }));
        assert(!db.table_exists("things"));
    }

    // 3) ids survive reopen and are never reused; failed inserts keep the counter
    {
        Database db(base);
        Record carol = db.insert("users", {{"name", "Carol"}, {"age", "41"}, {"is_active", "yes"}});
        assert(id_of(carol) == 3);

        assert(throws<TypeMismatchError>([&] {
            db.insert("users", {{"name", "Dan"}, {"age", "abc"}, {"is_active", "no"}});
        }));
        assert(throws<MissingFieldsError>([&] { db.insert("users", {{"name", "Dan"}}); }));

        assert(db.remove("users") == 2);
        Record dan = db.insert("users", {{"name", "Dan"}, {"age", "null"}, {"is_active", "no"}});
        assert(id_of(dan) == 4);
    }

    // 4) updates: empty set, id and unknown fields are rejected
    {
        Database db(base);
        assert(throws<ValidationError>([&] { db.update("users", {}, WhereClause()); }));
        assert(throws<ValidationError>([&] { db.update("users", {{"id", "9"}}); }));
        assert(throws<UnknownFieldsError>([&] { db.update("users", {{"email", "x"}}); }));
        assert(throws<ValidationError>([&] { db.select("users", parse_conjunction("email=x")); }));
        assert(db.update("users", {{"is_active", "да"}}) == 1);
    }

    // 5) null values: ordering is false, equality matches
    {
        Database db(base);
        assert(db.select("users", parse_conjunction("age>10")).rows.empty());
        assert(db.select("users", parse_conjunction("age<10")).rows.empty());
        assert(db.select("users", parse_conjunction("age=null")).rows.size() == 1);
        assert(db.select("users", Expression{"age == None and is_active"}).rows.size() == 1);
    }

    // 6) select cache: hits until the table changes
    {
        Database db(base);
        db.insert("users", {{"name", "Eve"}, {"age", "35"}, {"is_active", "true"}});
        const uint64_t before = db.version("users");

        auto first = db.select("users", Expression{"age >= 30"});
        auto second = db.select("users", Expression{"age>=30"});
        assert(!first.from_cache && second.from_cache);
        assert(second.rows.size() == 1);

        db.insert("users", {{"name", "Frank"}, {"age", "50"}, {"is_active", "false"}});
        assert(db.version("users") == before + 1);
        auto third = db.select("users", Expression{"age >= 30"});
        assert(!third.from_cache && third.rows.size() == 2);

        db.update("users", {{"age", "29"}}, parse_conjunction("name=Frank"));
        auto fourth = db.select("users", Expression{"age >= 30"});
        assert(!fourth.from_cache && fourth.rows.size() == 1);

        db.remove("users", Expression{"name == 'Eve'"});
        assert(db.select("users", Expression{"age >= 30"}).rows.empty());
    }

    // 7) disabled cache never hits
    {
        Database db(base, false);
        db.select("users");
        assert(!db.select("users").from_cache);
        assert(db.cache().size() == 0);
    }

    // 8) expression filters go through the allow-list
    {
        Database db(base);
        assert(throws<WhereError>([&] { db.select("users", Expression{"__import__('os')"}); }));
        assert(throws<WhereError>([&] { db.remove("users", Expression{"age + 1 > 2"}); }));
        auto rows = db.select("users", Expression{"name == 'Frank' or age == null"}).rows;
        assert(rows.size() == 2);
    }

    // 9) on-disk layout
    {
        auto meta = nlohmann::json::parse(read_file(base / "db_meta.json"));
        assert(meta["tables"]["users"]["last_id"] == 6);
        auto schema = meta["tables"]["users"]["schema"];
        assert(schema["name"] == "str" && schema["age"] == "int" && schema["is_active"] == "bool");

        auto rows = nlohmann::json::parse(read_file(base / "data" / "users.json"));
        assert(rows.is_array() && rows.size() == 2);
        assert(rows[0].contains("id") && rows[0].contains("name"));
        assert(!std::filesystem::exists(base / "data" / "users.json.tmp"));
    }

    // 10) drop removes the catalog entry and the row file
    {
        Database db(base);
        db.drop_table("users");
        assert(!db.table_exists("users"));
        assert(!std::filesystem::exists(base / "data" / "users.json"));
        assert(Database(base).list_tables().empty());

        db.create_table("users", kUsers);
        Record first = db.insert("users", {{"name", "New"}, {"age", "1"}, {"is_active", "1"}});
        assert(id_of(first) == 1);
    }

    // 11) legacy metadata layout is read and rewritten in the current layout
    {
        clean_dir(base);
        write_file(base / "db_meta.json",
                   R"({"tables": {"pets": {"name": "str", "legs": "int"}}, "counters": {"pets": 2}})");
        write_file(base / "data" / "pets.json",
                   R"([{"id": 1, "name": "Rex", "legs": 4}, {"id": 2, "name": "Tweety", "legs": 2}])");

        Database db(base);
        auto tables = db.list_tables();
        assert(tables.size() == 1);
        assert((tables[0].schema.field_names() == std::vector<std::string>{"name", "legs"}));
        assert(db.select("pets", parse_conjunction("legs=4")).rows.size() == 1);

        Record nemo = db.insert("pets", {{"name", "Nemo"}, {"legs", "0"}});
        assert(id_of(nemo) == 3);

        auto meta = nlohmann::json::parse(read_file(base / "db_meta.json"));
        assert(!meta.contains("counters"));
        assert(meta["tables"]["pets"]["last_id"] == 3);
    }

    // 12) corrupt files raise StorageError
    {
        write_file(base / "data" / "pets.json", "{not json");
        Database db(base);
        assert(throws<StorageError>([&] { db.select("pets"); }));

        write_file(base / "db_meta.json", "[1, 2]");
        assert(throws<StorageError>([&] { Database broken(base); }));
    }

    // 13) instrumentation: journal lines and timing reports
    {
        clean_dir(base);
        Database db(base);
        std::ostringstream timing;
        InstrumentedDatabase wrapped(db, CommandJournal(base / "logs" / "commands.log"), &timing);

        wrapped.create_table("t", ColumnSpecs{{"v", "int"}});
        wrapped.insert("t", {{"v", "1"}});
        assert(throws<TypeMismatchError>([&] { wrapped.insert("t", {{"v", "x"}}); }));
        assert(wrapped.select("t", parse_conjunction("v=1")).rows.size() == 1);

        const std::string log = read_file(base / "logs" / "commands.log");
        assert(log.find("\tcreate_table\tt v:int") != std::string::npos);
        assert(log.find("\tinsert\tt v=1") != std::string::npos);
        assert(log.find("\tselect\tt where v = 1") != std::string::npos);

        const std::string report = timing.str();
        assert(report.find("[time] create_table: ") != std::string::npos);
        // the failed insert is still timed
        size_t inserts = 0;
        for (size_t pos = report.find("[time] insert: "); pos != std::string::npos;
             pos = report.find("[time] insert: ", pos + 1)) {
            ++inserts;
        }
        assert(inserts == 2);

        // an unwritable journal does not break the operation
        write_file(base / "blocked", "file, not a directory");
        InstrumentedDatabase quiet(db, CommandJournal(base / "blocked" / "commands.log"), nullptr);
        assert(quiet.insert("t", {{"v", "2"}}).at("v") == DBValue{DBInt{2}});
    }

    clean_dir(base);
    std::cout << "All database tests passed.\n";
    return 0;
}
