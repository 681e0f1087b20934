#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "../db/value.h"

namespace primdb {
namespace storage {

// Catalog entry of one table as persisted in the metadata file
struct TableMeta {
    std::vector<std::pair<std::string, std::string>> schema; // declared order
    int64_t last_id = 0;
};

// Whole metadata file, tables keyed (and written) in sorted order
struct Meta {
    std::map<std::string, TableMeta> tables;
};

// File-backed JSON storage rooted at one directory:
//   <root>/db_meta.json       table catalog
//   <root>/data/<table>.json  rows of one table
// Every write goes to a sibling ".tmp" file first and is renamed over the
// target, so readers see either the old or the new content.
class JsonStore {
public:
    explicit JsonStore(const std::filesystem::path& root);

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path meta_path() const;
    std::filesystem::path data_dir() const;
    std::filesystem::path table_path(const std::string& table) const;

    // Missing file reads as an empty catalog. Also accepts the legacy layout
    // {"tables": {name: {field: type}}, "counters": {name: n}}.
    Meta read_meta() const;
    void write_meta(const Meta& meta) const;

    // Missing file reads as no rows
    std::vector<db::Record> read_table(const std::string& table) const;
    void write_table(const std::string& table, const std::vector<db::Record>& rows) const;

    // Remove the row file; a missing file is not an error
    void remove_table(const std::string& table) const;

private:
    std::filesystem::path root_;
};

} // namespace storage
} // namespace primdb
