#include "../../include/db/database.h"
#include "../../include/db/errors.h"
#include "../../include/db/types.h"
#include <type_traits>
#include <utility>

namespace primdb {
namespace db {

namespace {

void ensure_table_name(const std::string& name) {
    if (!is_identifier(name)) {
        throw ValidationError("Invalid table name: '" + name + "'");
    }
}

} // namespace

Database::Database(const std::filesystem::path& root, bool cache_enabled)
    : store_(root), meta_(store_.read_meta()), cache_(cache_enabled) {
    for (const auto& [name, entry] : meta_.tables) {
        try {
            schemas_.emplace(name, Schema(entry.schema));
        } catch (const SchemaError& e) {
            throw StorageError("Corrupt schema of table '" + name + "' in " +
                               store_.meta_path().string() + ": " + e.what());
        }
        versions_[name] = 0;
    }
}

void Database::create_table(const std::string& name, const ColumnSpecs& columns) {
    ensure_table_name(name);
    if (table_exists(name)) {
        throw TableExistsError("Table '" + name + "' already exists");
    }

    Schema schema(columns);

    // Commit the catalog only once it is on disk
    storage::Meta next = meta_;
    next.tables[name] = storage::TableMeta{schema.to_specs(), 0};
    store_.write_meta(next);
    store_.write_table(name, {});

    meta_ = std::move(next);
    schemas_[name] = schema;
    versions_[name] = 0;
    cache_.invalidate(name);
}

void Database::drop_table(const std::string& name) {
    ensure_table_name(name);
    if (!table_exists(name)) {
        throw TableNotFoundError("Table '" + name + "' not found");
    }

    storage::Meta next = meta_;
    next.tables.erase(name);
    store_.write_meta(next);
    store_.remove_table(name);

    meta_ = std::move(next);
    schemas_.erase(name);
    versions_.erase(name);
    cache_.invalidate(name);
}

std::vector<TableInfo> Database::list_tables() const {
    std::vector<TableInfo> result;
    for (const auto& [name, schema] : schemas_) {
        result.push_back(TableInfo{name, schema, store_.table_path(name)});
    }
    return result;
}

bool Database::table_exists(const std::string& name) const {
    return schemas_.find(name) != schemas_.end();
}

const Schema& Database::schema(const std::string& name) const {
    ensure_table_name(name);
    auto it = schemas_.find(name);
    if (it == schemas_.end()) {
        throw TableNotFoundError("Table '" + name + "' not found");
    }
    return it->second;
}

Record Database::insert(const std::string& table, const RawValues& values) {
    Table loaded = load_table(table);
    Record row = loaded.insert_row(values);

    store_.write_table(table, loaded.rows());

    storage::Meta next = meta_;
    next.tables[table].last_id = loaded.last_id();
    store_.write_meta(next);
    meta_ = std::move(next);

    touch(table);
    return row;
}

SelectResult Database::select(const std::string& table, const WhereClause& where) {
    Predicate predicate = prepare_where(table, where);
    const std::string signature = predicate.signature();
    const uint64_t current = version(table);

    if (auto cached = cache_.find(table, signature, current)) {
        return SelectResult{std::move(*cached), true};
    }

    std::vector<Record> rows = load_table(table).select(predicate);
    cache_.store(table, signature, current, rows);
    return SelectResult{std::move(rows), false};
}

size_t Database::update(const std::string& table, const RawValues& set_values,
                        const WhereClause& where) {
    if (set_values.empty()) {
        throw ValidationError("update requires set");
    }
    Record changes = schema(table).validate_update(set_values);
    Predicate predicate = prepare_where(table, where);

    Table loaded = load_table(table);
    size_t count = loaded.update(changes, predicate);
    store_.write_table(table, loaded.rows());

    touch(table);
    return count;
}

size_t Database::remove(const std::string& table, const WhereClause& where) {
    Predicate predicate = prepare_where(table, where);

    Table loaded = load_table(table);
    size_t count = loaded.remove(predicate);
    store_.write_table(table, loaded.rows());

    touch(table);
    return count;
}

Predicate Database::prepare_where(const std::string& table, const WhereClause& where) const {
    const Schema& table_schema = schema(table);

    return std::visit([&](const auto& clause) -> Predicate {
        using T = std::decay_t<decltype(clause)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return Predicate();
        } else if constexpr (std::is_same_v<T, Conjunction>) {
            return table_schema.prepare(clause);
        } else {
            return compile_where(clause.text);
        }
    }, where);
}

uint64_t Database::version(const std::string& table) const {
    auto it = versions_.find(table);
    return it == versions_.end() ? 0 : it->second;
}

Table Database::load_table(const std::string& name) const {
    const Schema& table_schema = schema(name);
    return Table(name, table_schema, meta_.tables.at(name).last_id, store_.read_table(name));
}

void Database::touch(const std::string& table) {
    versions_[table]++;
    cache_.invalidate(table);
}

} // namespace db
} // namespace primdb
