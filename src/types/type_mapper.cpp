#include "rsbridge/type_mapper.hpp"
#include "rsbridge/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

#include <arrow/util/key_value_metadata.h>

namespace rsbridge {

namespace {

constexpr int64_t kMicrosPerSecond = 1000000;
constexpr int64_t kMicrosPerDay = 86400 * kMicrosPerSecond;

// Proleptic Gregorian calendar (H. Hinnant's civil_from_days).
void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

std::string lower_trimmed(const std::string& value) {
    std::string result;
    for (char c : value) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    auto begin = result.find_first_not_of(' ');
    auto end = result.find_last_not_of(' ');
    return begin == std::string::npos ? "" : result.substr(begin, end - begin + 1);
}

std::shared_ptr<arrow::KeyValueMetadata> length_metadata(int32_t length) {
    if (length <= 0) {
        return nullptr;
    }
    return arrow::key_value_metadata({kMaxLengthKey}, {std::to_string(length)});
}

}  // namespace

std::optional<int64_t> max_length(const arrow::Field& field) {
    const auto& metadata = field.metadata();
    if (!metadata) {
        return std::nullopt;
    }
    int index = metadata->FindKey(kMaxLengthKey);
    if (index < 0) {
        return std::nullopt;
    }

    const std::string& raw = metadata->value(index);
    int64_t length = 0;
    try {
        size_t consumed = 0;
        length = std::stoll(raw, &consumed);
        if (consumed != raw.size()) {
            throw std::invalid_argument(raw);
        }
    } catch (const std::logic_error&) {
        throw ConfigurationError("Column '" + field.name() + "' has non-numeric maxlength: " + raw);
    }
    if (length < 1 || length > kMaxVarcharLength) {
        throw ConfigurationError("Column '" + field.name() + "' has maxlength " + raw +
                                 " outside [1, " + std::to_string(kMaxVarcharLength) + "]");
    }
    return length;
}

std::string to_warehouse_type(const arrow::Field& field) {
    const auto& type = field.type();
    switch (type->id()) {
        case arrow::Type::BOOL:
            return "BOOLEAN";
        case arrow::Type::INT8:
        case arrow::Type::INT16:
            return "SMALLINT";
        case arrow::Type::INT32:
            return "INTEGER";
        case arrow::Type::INT64:
            return "BIGINT";
        case arrow::Type::FLOAT:
            return "REAL";
        case arrow::Type::DOUBLE:
            return "DOUBLE PRECISION";
        case arrow::Type::DATE32:
            return "DATE";
        case arrow::Type::TIMESTAMP:
            return "TIMESTAMP";
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING: {
            auto length = max_length(field);
            return length ? "VARCHAR(" + std::to_string(*length) + ")" : "TEXT";
        }
        case arrow::Type::DECIMAL128: {
            auto decimal = std::static_pointer_cast<arrow::Decimal128Type>(type);
            return "DECIMAL(" + std::to_string(decimal->precision()) + "," +
                   std::to_string(decimal->scale()) + ")";
        }
        default:
            throw SchemaMappingError("Column '" + field.name() + "' has type " + type->ToString() +
                                     " with no warehouse equivalent");
    }
}

std::shared_ptr<arrow::Field> to_arrow_field(const ColumnDescription& column) {
    std::string type_name = lower_trimmed(column.type_name);
    int32_t length = column.length;
    int32_t scale = column.scale;

    // "character varying(256)", "numeric(18,2)"
    auto paren = type_name.find('(');
    if (paren != std::string::npos) {
        int first = -1;
        int second = -1;
        std::sscanf(type_name.c_str() + paren, "(%d,%d)", &first, &second);
        if (first > 0) {
            length = first;
        }
        if (second >= 0) {
            scale = second;
        }
        type_name = lower_trimmed(type_name.substr(0, paren));
    }

    std::shared_ptr<arrow::DataType> type;
    std::shared_ptr<arrow::KeyValueMetadata> metadata;

    if (type_name == "boolean" || type_name == "bool") {
        type = arrow::boolean();
    } else if (type_name == "smallint" || type_name == "int2") {
        type = arrow::int16();
    } else if (type_name == "integer" || type_name == "int" || type_name == "int4") {
        type = arrow::int32();
    } else if (type_name == "bigint" || type_name == "int8") {
        type = arrow::int64();
    } else if (type_name == "real" || type_name == "float4") {
        type = arrow::float32();
    } else if (type_name == "double precision" || type_name == "float8" || type_name == "float") {
        type = arrow::float64();
    } else if (type_name == "date") {
        type = arrow::date32();
    } else if (type_name == "timestamp" || type_name == "timestamp without time zone") {
        type = arrow::timestamp(arrow::TimeUnit::MICRO);
    } else if (type_name == "timestamptz" || type_name == "timestamp with time zone") {
        type = arrow::timestamp(arrow::TimeUnit::MICRO, "UTC");
    } else if (type_name == "varchar" || type_name == "character varying" ||
               type_name == "nvarchar" || type_name == "char" || type_name == "character" ||
               type_name == "nchar" || type_name == "bpchar") {
        type = arrow::utf8();
        metadata = length_metadata(length);
    } else if (type_name == "text") {
        type = arrow::utf8();
    } else if (type_name == "numeric" || type_name == "decimal") {
        // Unconstrained NUMERIC takes the widest decimal128 precision.
        int32_t precision = length > 0 ? length : 38;
        type = arrow::decimal128(precision, scale >= 0 ? scale : 0);
    } else {
        throw SchemaMappingError("Column '" + column.name + "' has warehouse type '" +
                                 column.type_name + "' with no Arrow equivalent");
    }

    return arrow::field(column.name, type, column.nullable, metadata);
}

std::string format_date(int32_t days_since_epoch) {
    int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days_since_epoch, year, month, day);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u",
                  static_cast<long long>(year), month, day);
    return buffer;
}

std::string format_timestamp(int64_t micros_since_epoch) {
    int64_t days = floor_div(micros_since_epoch, kMicrosPerDay);
    int64_t micros_of_day = micros_since_epoch - days * kMicrosPerDay;

    int64_t seconds_of_day = micros_of_day / kMicrosPerSecond;
    int64_t fraction = micros_of_day % kMicrosPerSecond;

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%s %02lld:%02lld:%02lld",
                  format_date(static_cast<int32_t>(days)).c_str(),
                  static_cast<long long>(seconds_of_day / 3600),
                  static_cast<long long>((seconds_of_day / 60) % 60),
                  static_cast<long long>(seconds_of_day % 60));
    std::string result = buffer;

    if (fraction != 0) {
        char frac[8];
        std::snprintf(frac, sizeof(frac), "%06lld", static_cast<long long>(fraction));
        std::string digits = frac;
        digits.erase(digits.find_last_not_of('0') + 1);
        result += "." + digits;
    }
    return result;
}

int64_t to_micros(int64_t value, arrow::TimeUnit::type unit) {
    switch (unit) {
        case arrow::TimeUnit::SECOND:
            return value * kMicrosPerSecond;
        case arrow::TimeUnit::MILLI:
            return value * 1000;
        case arrow::TimeUnit::MICRO:
            return value;
        case arrow::TimeUnit::NANO:
            return floor_div(value, 1000);
    }
    return value;
}

}  // namespace rsbridge
