#ifndef RSBRIDGE_TYPE_MAPPER_HPP
#define RSBRIDGE_TYPE_MAPPER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <arrow/type.h>

namespace rsbridge {

/** Field metadata key carrying a string column's VARCHAR length. */
inline constexpr const char* kMaxLengthKey = "maxlength";

/** Widest VARCHAR the warehouse accepts. */
inline constexpr int64_t kMaxVarcharLength = 65535;

/**
 * Column as reported by the warehouse when describing a query.
 */
struct ColumnDescription {
    std::string name;
    std::string type_name;      ///< e.g. "integer", "character varying", "numeric"
    int32_t length = -1;        ///< VARCHAR/CHAR length or NUMERIC precision, -1 if unknown
    int32_t scale = -1;         ///< NUMERIC scale, -1 if unknown
    bool nullable = true;
};

/**
 * `maxlength` metadata of a field, if any.
 * @throws ConfigurationError if present but not an integer in [1, 65535]
 */
std::optional<int64_t> max_length(const arrow::Field& field);

/**
 * Warehouse column type for an Arrow field (e.g. "INTEGER", "VARCHAR(10)").
 * @throws SchemaMappingError naming the column and type if unmapped
 */
std::string to_warehouse_type(const arrow::Field& field);

/**
 * Arrow field for a column described by the warehouse. String lengths are
 * carried into `maxlength` metadata.
 * @throws SchemaMappingError naming the column and type if unmapped
 */
std::shared_ptr<arrow::Field> to_arrow_field(const ColumnDescription& column);

/**
 * Date/timestamp text written to staged files. Formats: "YYYY-MM-DD" and
 * "YYYY-MM-DD HH:MM:SS[.ffffff]".
 */
std::string format_date(int32_t days_since_epoch);
std::string format_timestamp(int64_t micros_since_epoch);

/**
 * Scale a timestamp value of the given unit to microseconds.
 */
int64_t to_micros(int64_t value, arrow::TimeUnit::type unit);

}  // namespace rsbridge

#endif  // RSBRIDGE_TYPE_MAPPER_HPP
