#ifndef RSBRIDGE_SQL_GENERATOR_HPP
#define RSBRIDGE_SQL_GENERATOR_HPP

#include <optional>
#include <string>
#include <vector>

#include <arrow/type_fwd.h>

#include "filters.hpp"
#include "parameters.hpp"

namespace rsbridge {
namespace sql {

/** Marker written for NULL in text staging formats and UNLOAD output. */
inline constexpr const char* kNullMarker = "@NULL@";

/**
 * "name" with embedded double quotes doubled.
 */
std::string quote_identifier(const std::string& name);

/**
 * 'text' with embedded single quotes doubled. Bytes are passed through, so
 * UTF-8 text survives unchanged.
 */
std::string quote_string_literal(const std::string& text);

/**
 * Escape a statement for embedding inside UNLOAD ('...'): backslashes are
 * doubled and single quotes become \'.
 */
std::string escape_for_unload(const std::string& sql);

/**
 * SQL literal for a filter operand; nullopt for NaN and infinities.
 */
std::optional<std::string> render_literal(const Literal& literal);

/**
 * Render a predicate tree, or nullopt if any part of it cannot be pushed
 * down.
 */
std::optional<std::string> build_filter_expression(const Filter& filter);

/**
 * "WHERE a AND b ..." over the renderable filters; "" if none render.
 */
std::string build_where_clause(const std::vector<Filter>& filters);

/**
 * UNLOAD ('SELECT <cols> FROM <source> [WHERE ...] ') TO '<dest>'
 * WITH CREDENTIALS '<creds>' ESCAPE NULL AS '@NULL@'
 *
 * @param source_expr Table name or "(query)"
 * @param columns Projected columns, in output order; empty selects 1
 * @param destination Warehouse-visible URI prefix (s3://...)
 */
std::string unload_query(const std::string& source_expr,
                         const std::vector<std::string>& columns,
                         const std::vector<Filter>& filters,
                         const Credentials& credentials,
                         const std::string& destination);

/**
 * @throws ConfigurationError if two columns differ only in case
 */
void check_no_ambiguous_columns(const arrow::Schema& schema);

/**
 * Column list for CREATE TABLE: "a" INTEGER, "b" VARCHAR(10), ...
 */
std::string schema_to_column_definitions(const arrow::Schema& schema);

/**
 * CREATE TABLE IF NOT EXISTS <table> (<cols>)[ DISTSTYLE s][ DISTKEY ("k")][ <sortkeyspec>]
 *
 * @throws ConfigurationError on ambiguous columns or bad maxlength metadata
 * @throws SchemaMappingError on a column type with no warehouse equivalent
 */
std::string create_table_sql(const arrow::Schema& schema,
                             const std::string& table,
                             const std::optional<std::string>& dist_style = std::nullopt,
                             const std::optional<std::string>& dist_key = std::nullopt,
                             const std::optional<std::string>& sort_key_spec = std::nullopt);

/**
 * COPY <table> FROM '<uri>' CREDENTIALS '<creds>' <format options> [extra]
 */
std::string copy_query(const std::string& table,
                       const std::string& source_uri,
                       const Credentials& credentials,
                       TempFormat format,
                       const std::string& extra_copy_options = "");

std::string drop_table_sql(const std::string& table);
std::string rename_table_sql(const TableName& from, const TableName& to);

/**
 * Statements that atomically replace `target` with `staging`.
 */
std::vector<std::string> swap_statements(const TableName& target,
                                         const TableName& staging,
                                         const std::string& backup_suffix);

/**
 * swap_statements() as one BEGIN; ...; END; block.
 */
std::string transaction_sql(const TableName& target,
                            const TableName& staging,
                            const std::string& backup_suffix);

/**
 * Statements that append the staging table's rows to `target`.
 */
std::vector<std::string> append_statements(const TableName& target, const TableName& staging);
std::string append_transaction_sql(const TableName& target, const TableName& staging);

/**
 * Wrap statements into a single BEGIN; ...; END; block.
 */
std::string as_transaction_block(const std::vector<std::string>& statements);

/** Cheap probe that fails when the table does not exist. */
std::string table_exists_query(const std::string& table);

/** SELECT * FROM <source> WHERE 1 = 0, for describing result columns. */
std::string describe_query(const std::string& source_expr);

/**
 * Rows of the load-error log belonging to the session's last COPY.
 */
std::string load_errors_query();

/**
 * Substitute %s in pre/post-action templates with the table name.
 */
std::vector<std::string> expand_actions(const std::vector<std::string>& templates,
                                        const std::string& table);

/**
 * Replace credential values embedded in a statement with "***", for logs
 * and error messages.
 */
std::string redact_credentials(const std::string& sql);

}  // namespace sql
}  // namespace rsbridge

#endif  // RSBRIDGE_SQL_GENERATOR_HPP
