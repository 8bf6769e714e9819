#ifndef RSBRIDGE_AVRO_WRITER_HPP
#define RSBRIDGE_AVRO_WRITER_HPP

#include <array>
#include <cstdint>
#include <cstring>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <arrow/type_fwd.h>
#include <nlohmann/json.hpp>

#include "writer_interface.hpp"

namespace rsbridge {

// Avro binary encoding (null codec only).
namespace avro_detail {

// Unsigned base-128 varint, low group first.
inline void encode_varint(std::vector<uint8_t>& out, uint64_t value) {
    do {
        uint8_t group = value & 0x7F;
        value >>= 7;
        out.push_back(value ? static_cast<uint8_t>(group | 0x80) : group);
    } while (value);
}

inline void encode_long(std::vector<uint8_t>& out, int64_t value) {
    encode_varint(out, (static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63));
}

inline void encode_int(std::vector<uint8_t>& out, int32_t value) {
    encode_varint(out, (static_cast<uint32_t>(value) << 1) ^ static_cast<uint32_t>(value >> 31));
}

inline void encode_boolean(std::vector<uint8_t>& out, bool value) {
    out.push_back(value ? 1 : 0);
}

template <typename Float, typename Bits>
inline void encode_ieee754(std::vector<uint8_t>& out, Float value) {
    static_assert(sizeof(Float) == sizeof(Bits));
    Bits bits;
    std::memcpy(&bits, &value, sizeof(bits));
    for (size_t shift = 0; shift < 8 * sizeof(Bits); shift += 8) {
        out.push_back(static_cast<uint8_t>(bits >> shift));
    }
}

inline void encode_float(std::vector<uint8_t>& out, float value) {
    encode_ieee754<float, uint32_t>(out, value);
}

inline void encode_double(std::vector<uint8_t>& out, double value) {
    encode_ieee754<double, uint64_t>(out, value);
}

inline void encode_bytes(std::vector<uint8_t>& out, const void* data, size_t size) {
    encode_long(out, static_cast<int64_t>(size));
    auto begin = static_cast<const uint8_t*>(data);
    out.insert(out.end(), begin, begin + size);
}

inline void encode_string(std::vector<uint8_t>& out, const std::string& value) {
    encode_bytes(out, value.data(), value.size());
}

/// Union branch selector; nullable columns are ["null", T] so the null branch is 0.
inline void encode_branch(std::vector<uint8_t>& out, uint32_t branch) {
    encode_long(out, branch);
}

inline void encode_null_branch(std::vector<uint8_t>& out) {
    encode_branch(out, 0);
}

inline std::array<uint8_t, 16> random_sync_marker() {
    std::random_device device;
    std::array<uint8_t, 16> marker{};
    for (size_t i = 0; i < marker.size(); i += 4) {
        uint32_t word = device();
        std::memcpy(marker.data() + i, &word, 4);
    }
    return marker;
}

}  // namespace avro_detail

/**
 * Avro container file encoder.
 *
 * Produces:
 *  - Magic: "Obj\x01"
 *  - Metadata: Avro map<string, bytes> with "avro.schema" and "avro.codec"
 *  - Sync marker: 16 random bytes
 *  - Data: one block with all records concatenated (omitted when empty)
 */
class AvroFileWriter {
public:
    explicit AvroFileWriter(std::string schema_json);

    /**
     * Append a pre-encoded record matching the schema.
     */
    void append_record(const std::vector<uint8_t>& record_bytes);

    /**
     * Encode the complete container file.
     */
    std::vector<uint8_t> finish() const;

    size_t record_count() const { return record_count_; }

    const std::array<uint8_t, 16>& sync_marker() const { return sync_marker_; }

private:
    void write_header(std::vector<uint8_t>& out) const;
    void write_block(std::vector<uint8_t>& out) const;
    std::vector<uint8_t> encode_metadata_map() const;

    std::string schema_json_;
    std::array<uint8_t, 16> sync_marker_;
    std::vector<uint8_t> records_;
    size_t record_count_ = 0;
};

/**
 * Avro record schema for an Arrow schema. The record is named
 * "topLevelRecord"; nullable columns become ["null", T] unions. Dates,
 * timestamps and decimals are carried as strings the COPY command parses
 * with its DATEFORMAT / TIMEFORMAT options.
 *
 * @throws SchemaMappingError for an unsupported column type
 */
nlohmann::json avro_schema_for(const arrow::Schema& schema);

/**
 * Staged-file writer emitting one Avro container file.
 */
class ArrowAvroWriter : public StagingFileWriter {
public:
    explicit ArrowAvroWriter(std::shared_ptr<arrow::Schema> schema);

    void write_batch(const std::shared_ptr<arrow::RecordBatch>& batch) override;
    std::vector<uint8_t> finish() override;
    const char* file_extension() const override { return ".avro"; }

private:
    void encode_value(std::vector<uint8_t>& record, const arrow::Array& array, int64_t row) const;

    std::shared_ptr<arrow::Schema> schema_;
    AvroFileWriter file_;
};

}  // namespace rsbridge

#endif  // RSBRIDGE_AVRO_WRITER_HPP
