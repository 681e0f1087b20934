#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "schema.h"
#include "select_cache.h"
#include "table.h"
#include "value.h"
#include "where.h"
#include "../storage/json_store.h"

namespace primdb {
namespace db {

// One catalog entry as reported by list_tables()
struct TableInfo {
    std::string name;
    Schema schema;
    std::filesystem::path rows_file;
};

struct SelectResult {
    std::vector<Record> rows;
    bool from_cache = false;
};

// Table engine over a JsonStore. Every operation loads what it needs from
// disk, works in memory and writes back before returning.
class Database {
public:
    explicit Database(const std::filesystem::path& root, bool cache_enabled = true);

    const std::filesystem::path& root() const { return store_.root(); }
    const storage::JsonStore& store() const { return store_; }

    // Create a new table
    void create_table(const std::string& name, const ColumnSpecs& columns);

    // Drop a table together with its rows
    void drop_table(const std::string& name);

    // All tables, sorted by name
    std::vector<TableInfo> list_tables() const;

    bool table_exists(const std::string& name) const;

    // Throws TableNotFoundError
    const Schema& schema(const std::string& name) const;

    // Returns the stored row including its new id
    Record insert(const std::string& table, const RawValues& values);

    SelectResult select(const std::string& table, const WhereClause& where = WhereClause());

    // Returns the number of rows changed
    size_t update(const std::string& table, const RawValues& set_values,
                  const WhereClause& where = WhereClause());

    // Returns the number of rows deleted
    size_t remove(const std::string& table, const WhereClause& where = WhereClause());

    Predicate prepare_where(const std::string& table, const WhereClause& where) const;

    // Bumped by every insert/update/delete; 0 for a freshly opened table
    uint64_t version(const std::string& table) const;

    const SelectCache& cache() const { return cache_; }

private:
    storage::JsonStore store_;
    storage::Meta meta_;
    std::map<std::string, Schema> schemas_;
    std::map<std::string, uint64_t> versions_;
    SelectCache cache_;

    Table load_table(const std::string& name) const;
    void touch(const std::string& table);
};

} // namespace db
} // namespace primdb
