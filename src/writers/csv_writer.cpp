#include "rsbridge/csv_writer.hpp"
#include "rsbridge/errors.hpp"
#include "rsbridge/sql_generator.hpp"
#include "rsbridge/type_mapper.hpp"

#include <charconv>
#include <cmath>

#include <arrow/api.h>

namespace rsbridge {

namespace {

template <typename T>
std::string format_floating(T value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    return std::string(buffer, result.ptr);
}

}  // namespace

CSVWriter::CSVWriter(std::shared_ptr<arrow::Schema> schema)
    : schema_(std::move(schema)) {
    for (const auto& field : schema_->fields()) {
        switch (field->type()->id()) {
            case arrow::Type::BOOL:
            case arrow::Type::INT8:
            case arrow::Type::INT16:
            case arrow::Type::INT32:
            case arrow::Type::INT64:
            case arrow::Type::FLOAT:
            case arrow::Type::DOUBLE:
            case arrow::Type::STRING:
            case arrow::Type::LARGE_STRING:
            case arrow::Type::DATE32:
            case arrow::Type::TIMESTAMP:
            case arrow::Type::DECIMAL128:
                break;
            default:
                throw SchemaMappingError("Column '" + field->name() + "' has type " +
                                         field->type()->ToString() + " which cannot be staged as CSV");
        }
    }
}

std::string CSVWriter::escape_csv_value(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped += '"';
    for (char c : value) {
        if (c == '"') {
            escaped += "\"\"";  // Escape quotes by doubling
        } else {
            escaped += c;
        }
    }
    escaped += '"';
    return escaped;
}

void CSVWriter::write_value(const arrow::Array& array, int64_t row) {
    switch (array.type_id()) {
        case arrow::Type::BOOL:
            output_ << (static_cast<const arrow::BooleanArray&>(array).Value(row) ? "true" : "false");
            break;
        case arrow::Type::INT8:
            output_ << static_cast<int>(static_cast<const arrow::Int8Array&>(array).Value(row));
            break;
        case arrow::Type::INT16:
            output_ << static_cast<const arrow::Int16Array&>(array).Value(row);
            break;
        case arrow::Type::INT32:
            output_ << static_cast<const arrow::Int32Array&>(array).Value(row);
            break;
        case arrow::Type::INT64:
            output_ << static_cast<const arrow::Int64Array&>(array).Value(row);
            break;
        case arrow::Type::FLOAT:
            output_ << format_floating(static_cast<const arrow::FloatArray&>(array).Value(row));
            break;
        case arrow::Type::DOUBLE:
            output_ << format_floating(static_cast<const arrow::DoubleArray&>(array).Value(row));
            break;
        case arrow::Type::STRING:
            output_ << escape_csv_value(static_cast<const arrow::StringArray&>(array).GetString(row));
            break;
        case arrow::Type::LARGE_STRING:
            output_ << escape_csv_value(static_cast<const arrow::LargeStringArray&>(array).GetString(row));
            break;
        case arrow::Type::DATE32:
            output_ << format_date(static_cast<const arrow::Date32Array&>(array).Value(row));
            break;
        case arrow::Type::TIMESTAMP: {
            auto unit = std::static_pointer_cast<arrow::TimestampType>(array.type())->unit();
            output_ << format_timestamp(
                to_micros(static_cast<const arrow::TimestampArray&>(array).Value(row), unit));
            break;
        }
        case arrow::Type::DECIMAL128:
            output_ << static_cast<const arrow::Decimal128Array&>(array).FormatValue(row);
            break;
        default:
            throw SchemaMappingError("Type " + array.type()->ToString() + " cannot be staged as CSV");
    }
}

void CSVWriter::write_batch(const std::shared_ptr<arrow::RecordBatch>& batch) {
    if (!batch->schema()->Equals(*schema_, false)) {
        throw std::runtime_error("Batch schema does not match writer schema: " +
                                 batch->schema()->ToString());
    }

    for (int64_t row = 0; row < batch->num_rows(); ++row) {
        for (int col = 0; col < batch->num_columns(); ++col) {
            if (col > 0) output_ << ",";

            const auto& array = *batch->column(col);
            if (array.IsNull(row)) {
                output_ << sql::kNullMarker;
            } else {
                write_value(array, row);
            }
        }
        output_ << "\n";
    }
}

std::vector<uint8_t> CSVWriter::finish() {
    std::string text = output_.str();
    return std::vector<uint8_t>(text.begin(), text.end());
}

}  // namespace rsbridge
