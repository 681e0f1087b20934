#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace primdb {
namespace db {

// Base class for every domain error. The CLI prints what() as a single line.
class DBError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed command or condition syntax
class ParseError : public DBError {
public:
    using DBError::DBError;
};

// Invalid table or column definition
class SchemaError : public DBError {
public:
    using DBError::DBError;
};

// Bad input data: coercion failure, unknown/missing field, forbidden where construct
class ValidationError : public DBError {
public:
    using DBError::DBError;
};

class TypeMismatchError : public ValidationError {
public:
    using ValidationError::ValidationError;
};

class MissingFieldsError : public ValidationError {
public:
    explicit MissingFieldsError(std::vector<std::string> fields);
    const std::vector<std::string>& fields() const { return fields_; }

private:
    std::vector<std::string> fields_;
};

class UnknownFieldsError : public ValidationError {
public:
    explicit UnknownFieldsError(std::vector<std::string> fields);
    const std::vector<std::string>& fields() const { return fields_; }

private:
    std::vector<std::string> fields_;
};

// Rejected where expression (syntax error or a construct outside the allow-list)
class WhereError : public ValidationError {
public:
    using ValidationError::ValidationError;
};

class TableExistsError : public DBError {
public:
    using DBError::DBError;
};

class TableNotFoundError : public DBError {
public:
    using DBError::DBError;
};

// I/O or JSON decode failure on the persisted files
class StorageError : public DBError {
public:
    using DBError::DBError;
};

} // namespace db
} // namespace primdb
