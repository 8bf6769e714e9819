#ifndef RSBRIDGE_PARAMETERS_HPP
#define RSBRIDGE_PARAMETERS_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rsbridge {

/**
 * What to do when the target table of a write already exists.
 */
enum class SaveMode {
    Append,
    Overwrite,
    ErrorIfExists,
    Ignore
};

SaveMode parse_save_mode(const std::string& name);
const char* to_string(SaveMode mode);

/**
 * Intermediate file format used for data staged ahead of a COPY.
 */
enum class TempFormat {
    Avro,
    Csv
};

/**
 * Possibly schema-qualified table name, kept as the user wrote it.
 */
class TableName {
public:
    /**
     * Split "schema.table" on the last '.' outside double quotes.
     * @throws ConfigurationError on an empty name
     */
    static TableName parse(const std::string& name);

    TableName(std::string schema, std::string table)
        : schema_(std::move(schema)), table_(std::move(table)) {}

    const std::string& schema() const { return schema_; }
    const std::string& unqualified() const { return table_; }

    /** Qualified form used in DDL and DML. */
    std::string to_string() const;

    /** Same schema, table name with `suffix` appended. */
    TableName with_suffix(const std::string& suffix) const;

private:
    std::string schema_;
    std::string table_;
};

/**
 * Credentials forwarded to the warehouse in UNLOAD / COPY statements.
 */
struct Credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;

    bool empty() const { return access_key_id.empty() || secret_access_key.empty(); }

    /**
     * Render the CREDENTIALS string, e.g.
     * "aws_access_key_id=AK;aws_secret_access_key=SK[;token=T]".
     */
    std::string to_clause() const;
};

/**
 * Validated, immutable connector configuration.
 *
 * Built from a flat string map. Keys are case-insensitive and unknown keys
 * are ignored. Defaults are merged underneath user values.
 */
class Parameters {
public:
    /**
     * Merge user parameters over the defaults and validate the result.
     *
     * @param user_parameters Flat option map (url, tempdir, dbtable, ...)
     * @return Validated parameters
     * @throws ConfigurationError naming the missing or invalid key
     */
    static Parameters merge(const std::map<std::string, std::string>& user_parameters);

    const std::string& url() const { return url_; }

    /** Root URI under which every operation allocates its own sub-path. */
    const std::string& temp_root() const { return temp_root_; }

    const std::optional<TableName>& table() const { return table_; }
    const std::optional<std::string>& query() const { return query_; }

    /**
     * The table name, or the query wrapped in parentheses.
     */
    std::string source_expression() const;

    /**
     * Target of a write. Writes need a table, not a query.
     * @throws ConfigurationError mentioning dbtable when only a query is set
     */
    const TableName& require_table() const;

    /** Unset means "use the save mode's default". */
    std::optional<bool> use_staging_table() const { return use_staging_table_; }

    const std::optional<std::string>& dist_style() const { return dist_style_; }
    const std::optional<std::string>& dist_key() const { return dist_key_; }
    const std::optional<std::string>& sort_key_spec() const { return sort_key_spec_; }

    const std::vector<std::string>& pre_actions() const { return pre_actions_; }
    const std::vector<std::string>& post_actions() const { return post_actions_; }
    const std::string& extra_copy_options() const { return extra_copy_options_; }

    TempFormat temp_format() const { return temp_format_; }
    const Credentials& credentials() const { return credentials_; }

    std::optional<int> query_timeout_seconds() const { return query_timeout_seconds_; }
    std::optional<int> temp_dir_expiration_days() const { return temp_dir_expiration_days_; }

    /** Merged key/value map, keys lowercased. */
    const std::map<std::string, std::string>& values() const { return values_; }

private:
    Parameters() = default;

    std::map<std::string, std::string> values_;
    std::string url_;
    std::string temp_root_;
    std::optional<TableName> table_;
    std::optional<std::string> query_;
    std::optional<bool> use_staging_table_;
    std::optional<std::string> dist_style_;
    std::optional<std::string> dist_key_;
    std::optional<std::string> sort_key_spec_;
    std::vector<std::string> pre_actions_;
    std::vector<std::string> post_actions_;
    std::string extra_copy_options_;
    TempFormat temp_format_ = TempFormat::Avro;
    Credentials credentials_;
    std::optional<int> query_timeout_seconds_;
    std::optional<int> temp_dir_expiration_days_;
};

}  // namespace rsbridge

#endif  // RSBRIDGE_PARAMETERS_HPP
