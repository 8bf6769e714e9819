#ifndef RSBRIDGE_PG_CONNECTION_HPP
#define RSBRIDGE_PG_CONNECTION_HPP

#include <string>
#include <vector>

#include <libpq-fe.h>

#include "warehouse.hpp"

namespace rsbridge {

/**
 * WarehouseConnection over libpq. Redshift speaks the PostgreSQL frontend
 * protocol, so the stock client library is enough.
 */
class PgConnection : public WarehouseConnection {
public:
    /**
     * @param conninfo libpq connection URI or keyword/value string
     * @throws WarehouseStatementError if the connection fails
     */
    PgConnection(const std::string& conninfo, const ConnectionOptions& options);
    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    bool is_connected() const;

    void execute(const std::string& sql) override;
    void query(const std::string& sql, const RowCallback& callback) override;
    std::vector<ColumnDescription> describe(const std::string& sql) override;

    /** The simple query protocol runs a ';'-separated block in one round trip. */
    bool supports_multi_statement() const override { return true; }

    void close() override;

    const std::string& last_error() const { return last_error_; }

private:
    void check_connected() const;
    void check_result(PGresult* result, const std::string& sql);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

/**
 * WarehouseDriver that opens PgConnection instances.
 */
class PgWarehouseDriver : public WarehouseDriver {
public:
    ConnectionPtr connect(const std::string& url, const ConnectionOptions& options) override;

    /**
     * Rewrite jdbc:redshift:// and jdbc:postgresql:// URLs (including their
     * ?user=..&password=.. query string) into a libpq postgresql:// URI.
     * Anything else is passed through.
     */
    static std::string to_conninfo(const std::string& url);
};

/**
 * Warehouse type name for a PostgreSQL type OID and type modifier, filled
 * into `column` (type_name, length, scale).
 *
 * @throws SchemaMappingError for an OID with no known name
 */
void describe_pg_type(unsigned int oid, int type_modifier, ColumnDescription& column);

}  // namespace rsbridge

#endif  // RSBRIDGE_PG_CONNECTION_HPP
