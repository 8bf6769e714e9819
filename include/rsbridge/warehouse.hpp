#ifndef RSBRIDGE_WAREHOUSE_HPP
#define RSBRIDGE_WAREHOUSE_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "type_mapper.hpp"

namespace rsbridge {

/** One result row; NULL cells are nullopt. */
using Row = std::vector<std::optional<std::string>>;
using RowCallback = std::function<void(const Row&)>;

/**
 * An open session with the warehouse. Statement failures are reported as
 * WarehouseStatementError.
 */
class WarehouseConnection {
public:
    virtual ~WarehouseConnection() = default;

    /**
     * Execute a statement (or a ';'-separated block) with no result rows.
     */
    virtual void execute(const std::string& sql) = 0;

    /**
     * Execute a query and call `callback` once per result row.
     */
    virtual void query(const std::string& sql, const RowCallback& callback) = 0;

    /**
     * Describe the result columns of a query without running it.
     */
    virtual std::vector<ColumnDescription> describe(const std::string& sql) = 0;

    /**
     * Whether execute() accepts several ';'-separated statements at once,
     * run as a single unit.
     */
    virtual bool supports_multi_statement() const = 0;

    virtual void close() = 0;
};

using ConnectionPtr = std::unique_ptr<WarehouseConnection>;

struct ConnectionOptions {
    /** Upper bound for every statement on the connection; unset = no limit. */
    std::optional<int> query_timeout_seconds;
};

/**
 * Opens connections from a JDBC-style or libpq URL.
 */
class WarehouseDriver {
public:
    virtual ~WarehouseDriver() = default;

    /**
     * @throws WarehouseStatementError if the connection cannot be established
     */
    virtual ConnectionPtr connect(const std::string& url, const ConnectionOptions& options) = 0;
};

}  // namespace rsbridge

#endif  // RSBRIDGE_WAREHOUSE_HPP
