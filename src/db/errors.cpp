#include "../../include/db/errors.h"
#include <utility>

namespace primdb {
namespace db {

namespace {

std::string join_fields(const std::vector<std::string>& fields) {
    std::string out;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out += ", ";
        out += fields[i];
    }
    return out;
}

} // namespace

MissingFieldsError::MissingFieldsError(std::vector<std::string> fields)
    : ValidationError("Missing fields: " + join_fields(fields)), fields_(std::move(fields)) {
}

UnknownFieldsError::UnknownFieldsError(std::vector<std::string> fields)
    : ValidationError("Unknown fields: " + join_fields(fields)), fields_(std::move(fields)) {
}

} // namespace db
} // namespace primdb
