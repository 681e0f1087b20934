#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>
#include "value.h"

namespace primdb {
namespace db {

// Select results keyed by (table, where signature, table version).
// Entries are snapshots: stored and returned by value, never aliased to live rows.
class SelectCache {
public:
    explicit SelectCache(bool enabled = true) : enabled_(enabled) {}

    bool enabled() const { return enabled_; }

    std::optional<std::vector<Record>> find(const std::string& table, const std::string& signature,
                                            uint64_t version) const;

    void store(const std::string& table, const std::string& signature, uint64_t version,
               const std::vector<Record>& rows);

    // Drop every entry of one table
    void invalidate(const std::string& table);

    size_t size() const { return entries_.size(); }

private:
    using Key = std::tuple<std::string, std::string, uint64_t>;

    bool enabled_;
    std::map<Key, std::vector<Record>> entries_;
};

} // namespace db
} // namespace primdb
