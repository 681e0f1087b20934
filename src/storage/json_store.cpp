#include "../../include/storage/json_store.h"
#include "../../include/db/errors.h"
#include <fstream>
#include <system_error>
#include <nlohmann/json.hpp>

namespace primdb {
namespace storage {

namespace fs = std::filesystem;
using nlohmann::json;
using nlohmann::ordered_json;

namespace {

// Parse a JSON file, or return the fallback when the file does not exist
template <typename Json>
Json read_json(const fs::path& path, Json fallback) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return fallback;
    }

    std::ifstream in(path);
    if (!in) {
        throw db::StorageError("Cannot read JSON file: " + path.string());
    }
    try {
        return Json::parse(in);
    } catch (const json::exception& e) {
        throw db::StorageError("Cannot read JSON file: " + path.string() + " (" + e.what() + ")");
    }
}

// Write to <path>.tmp, then rename over <path>
template <typename Json>
void write_json_atomic(const fs::path& path, const Json& payload) {
    std::string text;
    try {
        text = payload.dump(2);
    } catch (const json::exception& e) {
        throw db::StorageError("Cannot encode JSON for " + path.string() + " (" + e.what() + ")");
    }

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw db::StorageError("Cannot create directory " + path.parent_path().string() + ": " +
                               ec.message());
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        out << text << '\n';
        out.close();
        if (!out) {
            throw db::StorageError("Cannot write JSON file: " + tmp.string());
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw db::StorageError("Cannot replace JSON file " + path.string() + ": " + ec.message());
    }
}

std::vector<std::pair<std::string, std::string>> decode_schema(const ordered_json& fields) {
    std::vector<std::pair<std::string, std::string>> schema;
    for (const auto& item : fields.items()) {
        schema.emplace_back(item.key(), item.value().get<std::string>());
    }
    return schema;
}

} // namespace

JsonStore::JsonStore(const fs::path& root) : root_(root) {
    std::error_code ec;
    fs::create_directories(data_dir(), ec);
    if (ec) {
        throw db::StorageError("Cannot create data directory " + data_dir().string() + ": " +
                               ec.message());
    }
}

fs::path JsonStore::meta_path() const {
    return root_ / "db_meta.json";
}

fs::path JsonStore::data_dir() const {
    return root_ / "data";
}

fs::path JsonStore::table_path(const std::string& table) const {
    return data_dir() / (table + ".json");
}

Meta JsonStore::read_meta() const {
    const auto doc = read_json(meta_path(), ordered_json{{"tables", ordered_json::object()}});

    Meta meta;
    try {
        if (!doc.is_object()) {
            throw db::StorageError("Corrupt metadata file: " + meta_path().string());
        }
        const auto tables = doc.value("tables", ordered_json::object());
        const auto counters = doc.value("counters", ordered_json::object());

        for (const auto& item : tables.items()) {
            const auto& info = item.value();
            if (!info.is_object()) {
                throw db::StorageError("Corrupt metadata entry for table '" + item.key() + "'");
            }
            TableMeta table;
            if (info.contains("schema")) {
                table.schema = decode_schema(info.at("schema"));
                table.last_id = info.value("last_id", int64_t{0});
            } else {
                // legacy layout: the entry is the schema, counters live apart
                table.schema = decode_schema(info);
                table.last_id = counters.value(item.key(), int64_t{0});
            }
            meta.tables[item.key()] = std::move(table);
        }
    } catch (const json::exception& e) {
        throw db::StorageError("Corrupt metadata file: " + meta_path().string() + " (" + e.what() + ")");
    }
    return meta;
}

void JsonStore::write_meta(const Meta& meta) const {
    ordered_json tables = ordered_json::object();
    for (const auto& [name, table] : meta.tables) {
        ordered_json schema = ordered_json::object();
        for (const auto& [field, type_name] : table.schema) {
            schema[field] = type_name;
        }
        ordered_json entry = ordered_json::object();
        entry["last_id"] = table.last_id;
        entry["schema"] = std::move(schema);
        tables[name] = std::move(entry);
    }

    ordered_json doc = ordered_json::object();
    doc["tables"] = std::move(tables);
    write_json_atomic(meta_path(), doc);
}

std::vector<db::Record> JsonStore::read_table(const std::string& table) const {
    const fs::path path = table_path(table);
    const auto doc = read_json(path, json::array());
    if (!doc.is_array()) {
        throw db::StorageError("Corrupt table file (expected an array): " + path.string());
    }

    std::vector<db::Record> rows;
    rows.reserve(doc.size());
    for (const auto& item : doc) {
        if (!item.is_object()) {
            throw db::StorageError("Corrupt table file (expected objects): " + path.string());
        }
        db::Record row;
        for (const auto& field : item.items()) {
            row[field.key()] = db::value_from_json(field.value());
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

void JsonStore::write_table(const std::string& table, const std::vector<db::Record>& rows) const {
    json doc = json::array();
    for (const auto& row : rows) {
        json obj = json::object();
        for (const auto& [key, value] : row) {
            obj[key] = db::value_to_json(value);
        }
        doc.push_back(std::move(obj));
    }
    write_json_atomic(table_path(table), doc);
}

void JsonStore::remove_table(const std::string& table) const {
    std::error_code ec;
    fs::remove(table_path(table), ec);
    if (ec) {
        throw db::StorageError("Cannot remove table file " + table_path(table).string() + ": " +
                               ec.message());
    }
}

} // namespace storage
} // namespace primdb
