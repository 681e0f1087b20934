#pragma once

#include <string>
#include <vector>
#include "schema.h"
#include "value.h"
#include "where.h"

namespace primdb {
namespace db {

// Table class: one table's schema, id counter and rows, loaded for the
// duration of a single engine operation.
class Table {
public:
    Table(const std::string& name, const Schema& schema, DBInt last_id = 0,
          std::vector<Record> rows = {});

    const std::string& name() const { return name_; }
    const Schema& schema() const { return schema_; }
    DBInt last_id() const { return last_id_; }
    const std::vector<Record>& rows() const { return rows_; }

    // Validate a full payload, assign the next id and append the row.
    // A validation failure leaves the counter untouched.
    Record insert_row(const RawValues& values);

    // Select rows matching the predicate
    std::vector<Record> select(const Predicate& where = Predicate()) const;

    // Apply already-validated changes to matching rows
    size_t update(const Record& changes, const Predicate& where = Predicate());

    // Delete rows matching the predicate
    size_t remove(const Predicate& where = Predicate());

private:
    std::string name_;
    Schema schema_;
    DBInt last_id_;
    std::vector<Record> rows_;
};

} // namespace db
} // namespace primdb
