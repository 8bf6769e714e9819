#ifndef RSBRIDGE_ERRORS_HPP
#define RSBRIDGE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace rsbridge {

/**
 * Bad or missing parameters, ambiguous columns, unsupported staging scheme.
 * Always raised before any I/O.
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * A logical or physical column type with no counterpart on the other side.
 */
class SchemaMappingError : public std::runtime_error {
public:
    explicit SchemaMappingError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * A statement or query rejected by the warehouse (or a failed connection).
 * The SQL is kept with credentials already redacted; the SQLSTATE is empty
 * when the driver reported none.
 */
class WarehouseStatementError : public std::runtime_error {
public:
    WarehouseStatementError(const std::string& message, std::string sql = "", std::string sqlstate = "")
        : std::runtime_error(message), sql_(std::move(sql)), sqlstate_(std::move(sqlstate)) {}

    const std::string& sql() const { return sql_; }
    const std::string& sqlstate() const { return sqlstate_; }

private:
    std::string sql_;
    std::string sqlstate_;
};

/// SQLSTATE for a reference to a table that does not exist.
inline constexpr const char* kUndefinedTableState = "42P01";

/**
 * COPY returned successfully but the load-error log has rows for it.
 */
class LoadVerificationError : public WarehouseStatementError {
public:
    using WarehouseStatementError::WarehouseStatementError;
};

/**
 * Object-store failure, or staged data that cannot be decoded.
 */
class StagingIOError : public std::runtime_error {
public:
    explicit StagingIOError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Write with SaveMode::ErrorIfExists against a table that already exists.
 */
class TableExistsError : public std::runtime_error {
public:
    explicit TableExistsError(const std::string& table)
        : std::runtime_error("Table " + table + " already exists (SaveMode = ErrorIfExists)") {}
};

class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace rsbridge

#endif  // RSBRIDGE_ERRORS_HPP
