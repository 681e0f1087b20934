#include "../../include/db/instrumented.h"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace primdb {
namespace db {

namespace {

std::string timestamp_now() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

} // namespace

CommandJournal::CommandJournal(std::filesystem::path file)
    : file_(std::move(file)) {
}

bool CommandJournal::record(const std::string& op, const std::string& args) const {
    std::error_code ec;
    if (file_.has_parent_path()) {
        std::filesystem::create_directories(file_.parent_path(), ec);
        if (ec) return false;
    }

    std::ofstream out(file_, std::ios::app);
    if (!out) return false;

    out << timestamp_now() << '\t' << op << '\t' << args << '\n';
    return static_cast<bool>(out);
}

ScopedTimer::ScopedTimer(std::string op, std::ostream* out)
    : op_(std::move(op)), out_(out), start_(std::chrono::steady_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    if (!out_) return;

    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start_);
    *out_ << "[time] " << op_ << ": " << std::fixed << std::setprecision(3)
          << elapsed.count() << " ms" << std::defaultfloat << std::endl;
}

InstrumentedDatabase::InstrumentedDatabase(Database& db, std::optional<CommandJournal> journal,
                                           std::ostream* timing)
    : db_(db), journal_(std::move(journal)), timing_(timing) {
}

void InstrumentedDatabase::create_table(const std::string& name, const ColumnSpecs& columns) {
    run("create_table", name + " " + describe(columns),
        [&] { db_.create_table(name, columns); });
}

void InstrumentedDatabase::drop_table(const std::string& name) {
    run("drop_table", name, [&] { db_.drop_table(name); });
}

std::vector<TableInfo> InstrumentedDatabase::list_tables() {
    return run("list_tables", "", [&] { return db_.list_tables(); });
}

Record InstrumentedDatabase::insert(const std::string& table, const RawValues& values) {
    return run("insert", table + " " + describe(values),
               [&] { return db_.insert(table, values); });
}

SelectResult InstrumentedDatabase::select(const std::string& table, const WhereClause& where) {
    return run("select", table + " " + describe(where),
               [&] { return db_.select(table, where); });
}

size_t InstrumentedDatabase::update(const std::string& table, const RawValues& set_values,
                                    const WhereClause& where) {
    return run("update", table + " set " + describe(set_values) + " " + describe(where),
               [&] { return db_.update(table, set_values, where); });
}

size_t InstrumentedDatabase::remove(const std::string& table, const WhereClause& where) {
    return run("delete", table + " " + describe(where),
               [&] { return db_.remove(table, where); });
}

std::string describe(const ColumnSpecs& columns) {
    std::string out;
    for (const auto& [name, type] : columns) {
        if (!out.empty()) out += " ";
        out += name + ":" + type;
    }
    return out;
}

std::string describe(const RawValues& values) {
    std::string out;
    for (const auto& [name, raw] : values) {
        if (!out.empty()) out += ", ";
        out += name + "=" + raw;
    }
    return out;
}

std::string describe(const WhereClause& where) {
    if (const auto* conditions = std::get_if<Conjunction>(&where)) {
        std::string out;
        for (const auto& cond : *conditions) {
            out += out.empty() ? "where " : " and ";
            out += cond.field + " " + op_to_string(cond.op) + " " + cond.raw_value;
        }
        return out;
    }
    if (const auto* expression = std::get_if<Expression>(&where)) {
        return "where " + expression->text;
    }
    return "";
}

} // namespace db
} // namespace primdb
