#include "rsbridge/avro_writer.hpp"
#include "rsbridge/errors.hpp"
#include "rsbridge/type_mapper.hpp"

#include <arrow/api.h>

using json = nlohmann::json;

namespace rsbridge {

AvroFileWriter::AvroFileWriter(std::string schema_json)
    : schema_json_(std::move(schema_json)),
      sync_marker_(avro_detail::random_sync_marker()) {}

void AvroFileWriter::append_record(const std::vector<uint8_t>& record_bytes) {
    records_.insert(records_.end(), record_bytes.begin(), record_bytes.end());
    ++record_count_;
}

std::vector<uint8_t> AvroFileWriter::finish() const {
    std::vector<uint8_t> out;
    out.reserve(records_.size() + schema_json_.size() + 64);
    write_header(out);
    write_block(out);
    return out;
}

void AvroFileWriter::write_header(std::vector<uint8_t>& out) const {
    // Magic: "Obj\x01"
    out.push_back('O');
    out.push_back('b');
    out.push_back('j');
    out.push_back(0x01);

    auto metadata = encode_metadata_map();
    out.insert(out.end(), metadata.begin(), metadata.end());

    out.insert(out.end(), sync_marker_.begin(), sync_marker_.end());
}

/**
 * Block format: [zigzag record-count] [zigzag byte-size] [records...] [sync marker]
 *
 * A record count of 0 would read as an end marker, so an empty file has no
 * block at all.
 */
void AvroFileWriter::write_block(std::vector<uint8_t>& out) const {
    if (record_count_ == 0) {
        return;
    }

    avro_detail::encode_long(out, static_cast<int64_t>(record_count_));
    avro_detail::encode_long(out, static_cast<int64_t>(records_.size()));
    out.insert(out.end(), records_.begin(), records_.end());
    out.insert(out.end(), sync_marker_.begin(), sync_marker_.end());
}

/**
 * Metadata as Avro map<string, bytes>, one entry per block, then the empty
 * terminating block.
 */
std::vector<uint8_t> AvroFileWriter::encode_metadata_map() const {
    std::vector<uint8_t> map;

    avro_detail::encode_long(map, 1);
    avro_detail::encode_string(map, "avro.schema");
    avro_detail::encode_bytes(map, schema_json_.data(), schema_json_.size());

    avro_detail::encode_long(map, 1);
    avro_detail::encode_string(map, "avro.codec");
    std::string codec = "null";
    avro_detail::encode_bytes(map, codec.data(), codec.size());

    avro_detail::encode_long(map, 0);

    return map;
}

namespace {

std::string avro_primitive_for(const arrow::Field& field) {
    switch (field.type()->id()) {
        case arrow::Type::BOOL:
            return "boolean";
        case arrow::Type::INT8:
        case arrow::Type::INT16:
        case arrow::Type::INT32:
            return "int";
        case arrow::Type::INT64:
            return "long";
        case arrow::Type::FLOAT:
            return "float";
        case arrow::Type::DOUBLE:
            return "double";
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
        case arrow::Type::DATE32:
        case arrow::Type::TIMESTAMP:
        case arrow::Type::DECIMAL128:
            return "string";
        default:
            throw SchemaMappingError("Column '" + field.name() + "' has type " +
                                     field.type()->ToString() + " which cannot be staged as Avro");
    }
}

}  // namespace

json avro_schema_for(const arrow::Schema& schema) {
    json fields = json::array();
    for (const auto& field : schema.fields()) {
        json type = avro_primitive_for(*field);
        if (field->nullable()) {
            type = json::array({"null", type});
        }
        fields.push_back({{"name", field->name()}, {"type", type}});
    }

    json record;
    record["type"] = "record";
    record["name"] = "topLevelRecord";
    record["fields"] = fields;
    return record;
}

ArrowAvroWriter::ArrowAvroWriter(std::shared_ptr<arrow::Schema> schema)
    : schema_(std::move(schema)),
      file_(avro_schema_for(*schema_).dump()) {}

void ArrowAvroWriter::encode_value(std::vector<uint8_t>& record,
                                   const arrow::Array& array,
                                   int64_t row) const {
    switch (array.type_id()) {
        case arrow::Type::BOOL:
            avro_detail::encode_boolean(record, static_cast<const arrow::BooleanArray&>(array).Value(row));
            break;
        case arrow::Type::INT8:
            avro_detail::encode_int(record, static_cast<const arrow::Int8Array&>(array).Value(row));
            break;
        case arrow::Type::INT16:
            avro_detail::encode_int(record, static_cast<const arrow::Int16Array&>(array).Value(row));
            break;
        case arrow::Type::INT32:
            avro_detail::encode_int(record, static_cast<const arrow::Int32Array&>(array).Value(row));
            break;
        case arrow::Type::INT64:
            avro_detail::encode_long(record, static_cast<const arrow::Int64Array&>(array).Value(row));
            break;
        case arrow::Type::FLOAT:
            avro_detail::encode_float(record, static_cast<const arrow::FloatArray&>(array).Value(row));
            break;
        case arrow::Type::DOUBLE:
            avro_detail::encode_double(record, static_cast<const arrow::DoubleArray&>(array).Value(row));
            break;
        case arrow::Type::STRING:
            avro_detail::encode_string(record, static_cast<const arrow::StringArray&>(array).GetString(row));
            break;
        case arrow::Type::LARGE_STRING:
            avro_detail::encode_string(record,
                                           static_cast<const arrow::LargeStringArray&>(array).GetString(row));
            break;
        case arrow::Type::DATE32:
            avro_detail::encode_string(record,
                                           format_date(static_cast<const arrow::Date32Array&>(array).Value(row)));
            break;
        case arrow::Type::TIMESTAMP: {
            const auto& timestamps = static_cast<const arrow::TimestampArray&>(array);
            auto unit = std::static_pointer_cast<arrow::TimestampType>(array.type())->unit();
            avro_detail::encode_string(record, format_timestamp(to_micros(timestamps.Value(row), unit)));
            break;
        }
        case arrow::Type::DECIMAL128:
            avro_detail::encode_string(record,
                                           static_cast<const arrow::Decimal128Array&>(array).FormatValue(row));
            break;
        default:
            throw SchemaMappingError("Type " + array.type()->ToString() + " cannot be staged as Avro");
    }
}

void ArrowAvroWriter::write_batch(const std::shared_ptr<arrow::RecordBatch>& batch) {
    if (!batch->schema()->Equals(*schema_, false)) {
        throw std::runtime_error("Batch schema does not match writer schema: " +
                                 batch->schema()->ToString());
    }

    std::vector<uint8_t> record;
    for (int64_t row = 0; row < batch->num_rows(); ++row) {
        record.clear();
        for (int col = 0; col < batch->num_columns(); ++col) {
            const auto& array = *batch->column(col);
            bool nullable = schema_->field(col)->nullable();
            if (array.IsNull(row)) {
                if (!nullable) {
                    throw std::runtime_error("Null value in non-nullable column '" +
                                             schema_->field(col)->name() + "'");
                }
                avro_detail::encode_null_branch(record);
                continue;
            }
            if (nullable) {
                avro_detail::encode_branch(record, 1);
            }
            encode_value(record, array, row);
        }
        file_.append_record(record);
    }
}

std::vector<uint8_t> ArrowAvroWriter::finish() {
    return file_.finish();
}

}  // namespace rsbridge
