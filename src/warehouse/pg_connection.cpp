#include "rsbridge/pg_connection.hpp"
#include "rsbridge/errors.hpp"
#include "rsbridge/sql_generator.hpp"

namespace rsbridge {

namespace {

// pg_type OIDs of the column types the warehouse can report.
constexpr unsigned int kBoolOid = 16;
constexpr unsigned int kInt8Oid = 20;
constexpr unsigned int kInt2Oid = 21;
constexpr unsigned int kInt4Oid = 23;
constexpr unsigned int kTextOid = 25;
constexpr unsigned int kFloat4Oid = 700;
constexpr unsigned int kFloat8Oid = 701;
constexpr unsigned int kBpcharOid = 1042;
constexpr unsigned int kVarcharOid = 1043;
constexpr unsigned int kDateOid = 1082;
constexpr unsigned int kTimestampOid = 1114;
constexpr unsigned int kTimestamptzOid = 1184;
constexpr unsigned int kNumericOid = 1700;

// Type modifiers carry a 4-byte header (VARHDRSZ).
constexpr int kVarHeaderSize = 4;

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

void describe_pg_type(unsigned int oid, int type_modifier, ColumnDescription& column) {
    switch (oid) {
        case kBoolOid:
            column.type_name = "boolean";
            break;
        case kInt2Oid:
            column.type_name = "smallint";
            break;
        case kInt4Oid:
            column.type_name = "integer";
            break;
        case kInt8Oid:
            column.type_name = "bigint";
            break;
        case kFloat4Oid:
            column.type_name = "real";
            break;
        case kFloat8Oid:
            column.type_name = "double precision";
            break;
        case kTextOid:
            column.type_name = "text";
            break;
        case kBpcharOid:
        case kVarcharOid:
            column.type_name = oid == kBpcharOid ? "character" : "character varying";
            if (type_modifier >= kVarHeaderSize) {
                column.length = type_modifier - kVarHeaderSize;
            }
            break;
        case kDateOid:
            column.type_name = "date";
            break;
        case kTimestampOid:
            column.type_name = "timestamp";
            break;
        case kTimestamptzOid:
            column.type_name = "timestamptz";
            break;
        case kNumericOid:
            column.type_name = "numeric";
            if (type_modifier >= kVarHeaderSize) {
                int packed = type_modifier - kVarHeaderSize;
                column.length = (packed >> 16) & 0xFFFF;
                column.scale = packed & 0xFFFF;
            }
            break;
        default:
            throw SchemaMappingError("Column '" + column.name + "' has unsupported type OID " +
                                     std::to_string(oid));
    }
}

PgConnection::PgConnection(const std::string& conninfo, const ConnectionOptions& options) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw WarehouseStatementError("Warehouse connection failed: " + last_error_);
    }

    if (options.query_timeout_seconds) {
        execute("SET statement_timeout TO " +
                std::to_string(static_cast<long long>(*options.query_timeout_seconds) * 1000));
    }
}

PgConnection::~PgConnection() {
    close();
}

bool PgConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::check_connected() const {
    if (!is_connected()) {
        throw WarehouseStatementError("Not connected to the warehouse");
    }
}

void PgConnection::check_result(PGresult* result, const std::string& sql) {
    ExecStatusType status = PQresultStatus(result);

    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        last_error_ = PQerrorMessage(conn_);
        const char* state = PQresultErrorField(result, PG_DIAG_SQLSTATE);
        std::string sqlstate = state ? state : "";
        PQclear(result);
        throw WarehouseStatementError("Warehouse statement failed: " + last_error_,
                                      sql::redact_credentials(sql), sqlstate);
    }
}

void PgConnection::execute(const std::string& sql) {
    check_connected();

    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result, sql);
    PQclear(result);
}

void PgConnection::query(const std::string& sql, const RowCallback& callback) {
    check_connected();

    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result, sql);

    int nrows = PQntuples(result);
    int nfields = PQnfields(result);

    try {
        for (int i = 0; i < nrows; ++i) {
            Row row;
            row.reserve(nfields);
            for (int j = 0; j < nfields; ++j) {
                if (PQgetisnull(result, i, j)) {
                    row.emplace_back(std::nullopt);
                } else {
                    row.emplace_back(std::string(PQgetvalue(result, i, j),
                                                 static_cast<size_t>(PQgetlength(result, i, j))));
                }
            }
            callback(row);
        }
    } catch (const std::exception&) {
        PQclear(result);
        throw;
    }

    PQclear(result);
}

std::vector<ColumnDescription> PgConnection::describe(const std::string& sql) {
    check_connected();

    PGresult* prepared = PQprepare(conn_, "", sql.c_str(), 0, nullptr);
    check_result(prepared, sql);
    PQclear(prepared);

    PGresult* description = PQdescribePrepared(conn_, "");
    check_result(description, sql);

    std::vector<ColumnDescription> columns;
    int nfields = PQnfields(description);
    columns.reserve(nfields);

    try {
        for (int i = 0; i < nfields; ++i) {
            ColumnDescription column;
            column.name = PQfname(description, i);
            describe_pg_type(PQftype(description, i), PQfmod(description, i), column);
            columns.push_back(std::move(column));
        }
    } catch (const std::exception&) {
        PQclear(description);
        throw;
    }

    PQclear(description);
    return columns;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

std::string PgWarehouseDriver::to_conninfo(const std::string& url) {
    static const char* const kPrefixes[] = {"jdbc:redshift://", "jdbc:postgresql://"};
    for (const char* prefix : kPrefixes) {
        std::string p(prefix);
        if (starts_with(url, p)) {
            return "postgresql://" + url.substr(p.size());
        }
    }
    return url;
}

ConnectionPtr PgWarehouseDriver::connect(const std::string& url, const ConnectionOptions& options) {
    return std::make_unique<PgConnection>(to_conninfo(url), options);
}

}  // namespace rsbridge
