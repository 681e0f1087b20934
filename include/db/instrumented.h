#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "database.h"

namespace primdb {
namespace db {

// Append-only command log. One line per executed operation:
//   <ISO-8601 local time>\t<operation>\t<arguments>
// Failures to create or write the file are ignored.
class CommandJournal {
public:
    explicit CommandJournal(std::filesystem::path file);

    const std::filesystem::path& file() const { return file_; }

    // Returns false when the line could not be written
    bool record(const std::string& op, const std::string& args) const;

private:
    std::filesystem::path file_;
};

// Prints "[time] <op>: <ms> ms" when it goes out of scope
class ScopedTimer {
public:
    ScopedTimer(std::string op, std::ostream* out);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string op_;
    std::ostream* out_;
    std::chrono::steady_clock::time_point start_;
};

// Database front that journals and times every operation before
// forwarding it to the engine.
class InstrumentedDatabase {
public:
    InstrumentedDatabase(Database& db, std::optional<CommandJournal> journal = std::nullopt,
                         std::ostream* timing = nullptr);

    Database& engine() { return db_; }

    void create_table(const std::string& name, const ColumnSpecs& columns);
    void drop_table(const std::string& name);
    std::vector<TableInfo> list_tables();
    Record insert(const std::string& table, const RawValues& values);
    SelectResult select(const std::string& table, const WhereClause& where = WhereClause());
    size_t update(const std::string& table, const RawValues& set_values,
                  const WhereClause& where = WhereClause());
    size_t remove(const std::string& table, const WhereClause& where = WhereClause());

private:
    Database& db_;
    std::optional<CommandJournal> journal_;
    std::ostream* timing_;

    template <typename Fn>
    auto run(const std::string& op, const std::string& args, Fn&& fn) {
        if (journal_) {
            journal_->record(op, args);
        }
        ScopedTimer timer(op, timing_);
        return fn();
    }
};

// Text forms used in journal lines
std::string describe(const ColumnSpecs& columns);
std::string describe(const RawValues& values);
std::string describe(const WhereClause& where);

} // namespace db
} // namespace primdb
