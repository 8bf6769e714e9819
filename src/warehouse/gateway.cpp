#include "rsbridge/gateway.hpp"
#include "rsbridge/errors.hpp"
#include "rsbridge/sql_generator.hpp"
#include "rsbridge/type_mapper.hpp"

#include <iostream>

#include <arrow/type.h>

namespace rsbridge {

namespace {

/**
 * BEGIN on construction, ROLLBACK on destruction unless committed.
 */
class Transaction {
public:
    Transaction(const WarehouseGateway& gateway, WarehouseConnection& connection)
        : gateway_(gateway), connection_(connection) {
        gateway_.execute(connection_, "BEGIN");
    }

    ~Transaction() {
        if (!committed_) {
            rollback(gateway_, connection_);
        }
    }

    static void rollback(const WarehouseGateway& gateway, WarehouseConnection& connection) {
        try {
            gateway.execute(connection, "ROLLBACK");
        } catch (const std::exception& e) {
            std::cerr << "Warning: ROLLBACK failed: " << e.what() << std::endl;
        }
    }

    void commit() {
        gateway_.execute(connection_, "COMMIT");
        committed_ = true;
    }

private:
    const WarehouseGateway& gateway_;
    WarehouseConnection& connection_;
    bool committed_ = false;
};

}  // namespace

ConnectionGuard::ConnectionGuard(ConnectionPtr connection)
    : connection_(std::move(connection)) {
    if (!connection_) {
        throw WarehouseStatementError("Warehouse driver returned no connection");
    }
}

ConnectionGuard::~ConnectionGuard() {
    close();
}

void ConnectionGuard::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    try {
        connection_->close();
    } catch (const std::exception& e) {
        std::cerr << "Warning: failed to close warehouse connection: " << e.what() << std::endl;
    }
}

WarehouseGateway::WarehouseGateway(std::shared_ptr<WarehouseDriver> driver, bool verbose)
    : driver_(std::move(driver)), verbose_(verbose) {
    if (!driver_) {
        throw ConfigurationError("A warehouse driver is required");
    }
}

ConnectionPtr WarehouseGateway::open(const Parameters& params) {
    ConnectionOptions options;
    options.query_timeout_seconds = params.query_timeout_seconds();
    if (verbose_) {
        std::cout << "Opening warehouse connection" << std::endl;
    }
    return driver_->connect(params.url(), options);
}

void WarehouseGateway::trace(const std::string& sql) const {
    if (verbose_) {
        std::cout << "Executing: " << sql::redact_credentials(sql) << std::endl;
    }
}

void WarehouseGateway::execute(WarehouseConnection& connection, const std::string& sql) const {
    trace(sql);
    connection.execute(sql);
}

void WarehouseGateway::query(WarehouseConnection& connection,
                             const std::string& sql,
                             const RowCallback& callback) const {
    trace(sql);
    connection.query(sql, callback);
}

void WarehouseGateway::execute_atomically(WarehouseConnection& connection,
                                          const std::vector<std::string>& statements) const {
    if (connection.supports_multi_statement()) {
        // A failed block leaves the session inside an aborted transaction.
        try {
            execute(connection, sql::as_transaction_block(statements));
        } catch (const WarehouseStatementError&) {
            Transaction::rollback(*this, connection);
            throw;
        }
        return;
    }

    Transaction transaction(*this, connection);
    for (const auto& statement : statements) {
        execute(connection, statement);
    }
    transaction.commit();
}

bool WarehouseGateway::table_exists(WarehouseConnection& connection, const std::string& table) const {
    try {
        query(connection, sql::table_exists_query(table), [](const Row&) {});
        return true;
    } catch (const WarehouseStatementError& e) {
        if (e.sqlstate() == kUndefinedTableState) {
            return false;
        }
        throw;
    }
}

std::shared_ptr<arrow::Schema> WarehouseGateway::resolve_schema(WarehouseConnection& connection,
                                                                const std::string& source_expr) const {
    std::string sql = sql::describe_query(source_expr);
    trace(sql);

    arrow::FieldVector fields;
    for (const auto& column : connection.describe(sql)) {
        fields.push_back(to_arrow_field(column));
    }
    return arrow::schema(fields);
}

}  // namespace rsbridge
