#ifndef RSBRIDGE_GATEWAY_HPP
#define RSBRIDGE_GATEWAY_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <arrow/type_fwd.h>

#include "parameters.hpp"
#include "warehouse.hpp"

namespace rsbridge {

/**
 * Owns one warehouse connection and closes it exactly once: explicitly
 * through close() or from the destructor, including during unwinding.
 */
class ConnectionGuard {
public:
    explicit ConnectionGuard(ConnectionPtr connection);
    ~ConnectionGuard();

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

    WarehouseConnection& get() { return *connection_; }

    /**
     * Close now. A failure to close is logged, not raised.
     */
    void close();

private:
    ConnectionPtr connection_;
    bool closed_ = false;
};

/**
 * Every warehouse interaction of an operation goes through the gateway:
 * connection lifetime, statement tracing and transactional blocks.
 */
class WarehouseGateway {
public:
    /**
     * @param driver Opens connections
     * @param verbose Log every statement (credentials redacted) to stdout
     */
    explicit WarehouseGateway(std::shared_ptr<WarehouseDriver> driver, bool verbose = false);

    /**
     * Open one connection, run fn(connection) and close the connection on
     * every exit path. Returns whatever fn returns.
     */
    template <typename Fn>
    auto with_connection(const Parameters& params, Fn&& fn) {
        ConnectionGuard guard(open(params));
        return std::forward<Fn>(fn)(guard.get());
    }

    void execute(WarehouseConnection& connection, const std::string& sql) const;
    void query(WarehouseConnection& connection, const std::string& sql, const RowCallback& callback) const;

    /**
     * Run the statements as one unit. Connections that accept multi-statement
     * blocks get a single BEGIN; ...; END; block, others an explicit
     * BEGIN / COMMIT. Either way a failure is followed by ROLLBACK, so the
     * session is usable again when the error reaches the caller.
     */
    void execute_atomically(WarehouseConnection& connection,
                            const std::vector<std::string>& statements) const;

    /**
     * Probe the table. Only an undefined-table error (SQLSTATE 42P01) means
     * it does not exist; any other failure propagates.
     *
     * @throws WarehouseStatementError if the probe fails for another reason
     */
    bool table_exists(WarehouseConnection& connection, const std::string& table) const;

    /**
     * Arrow schema of `SELECT * FROM <source_expr>`.
     * @throws SchemaMappingError for a column type with no Arrow equivalent
     */
    std::shared_ptr<arrow::Schema> resolve_schema(WarehouseConnection& connection,
                                                  const std::string& source_expr) const;

    bool verbose() const { return verbose_; }

private:
    ConnectionPtr open(const Parameters& params);
    void trace(const std::string& sql) const;

    std::shared_ptr<WarehouseDriver> driver_;
    bool verbose_;
};

}  // namespace rsbridge

#endif  // RSBRIDGE_GATEWAY_HPP
