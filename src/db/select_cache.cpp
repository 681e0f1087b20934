#include "../../include/db/select_cache.h"

namespace primdb {
namespace db {

std::optional<std::vector<Record>> SelectCache::find(const std::string& table,
                                                     const std::string& signature,
                                                     uint64_t version) const {
    if (!enabled_) return std::nullopt;

    auto it = entries_.find(Key{table, signature, version});
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void SelectCache::store(const std::string& table, const std::string& signature, uint64_t version,
                        const std::vector<Record>& rows) {
    if (!enabled_) return;
    entries_[Key{table, signature, version}] = rows;
}

void SelectCache::invalidate(const std::string& table) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (std::get<0>(it->first) == table) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace db
} // namespace primdb
