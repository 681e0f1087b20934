#include "../../include/db/table.h"
#include <algorithm>
#include <utility>

namespace primdb {
namespace db {

Table::Table(const std::string& name, const Schema& schema, DBInt last_id, std::vector<Record> rows)
    : name_(name), schema_(schema), last_id_(last_id), rows_(std::move(rows)) {
}

Record Table::insert_row(const RawValues& values) {
    Record row = schema_.validate_insert(values);

    // Only assign the id once every value has been coerced
    row[kIdField] = DBValue{++last_id_};
    rows_.push_back(row);
    return row;
}

std::vector<Record> Table::select(const Predicate& where) const {
    std::vector<Record> result;
    for (const auto& row : rows_) {
        if (where.matches(row)) {
            result.push_back(row);
        }
    }
    return result;
}

size_t Table::update(const Record& changes, const Predicate& where) {
    size_t count = 0;
    for (auto& row : rows_) {
        if (!where.matches(row)) continue;

        for (const auto& [field, value] : changes) {
            row[field] = value;
        }
        count++;
    }
    return count;
}

size_t Table::remove(const Predicate& where) {
    size_t initial_size = rows_.size();

    rows_.erase(
        std::remove_if(rows_.begin(), rows_.end(),
                       [&where](const Record& row) {
                           return where.matches(row);
                       }),
        rows_.end()
    );

    return initial_size - rows_.size();
}

} // namespace db
} // namespace primdb
