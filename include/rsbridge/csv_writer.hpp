#ifndef RSBRIDGE_CSV_WRITER_HPP
#define RSBRIDGE_CSV_WRITER_HPP

#include <memory>
#include <sstream>
#include <string>

#include "writer_interface.hpp"

namespace rsbridge {

/**
 * Staged-file writer emitting CSV for COPY ... FORMAT AS CSV NULL AS '@NULL@'.
 * No header row. NULL cells are the bare null marker; strings are always
 * quoted so an empty string stays distinct from NULL.
 */
class CSVWriter : public StagingFileWriter {
public:
    explicit CSVWriter(std::shared_ptr<arrow::Schema> schema);

    void write_batch(const std::shared_ptr<arrow::RecordBatch>& batch) override;
    std::vector<uint8_t> finish() override;
    const char* file_extension() const override { return ".csv"; }

    /**
     * Quote a value, doubling embedded quotes.
     */
    static std::string escape_csv_value(const std::string& value);

private:
    void write_value(const arrow::Array& array, int64_t row);

    std::shared_ptr<arrow::Schema> schema_;
    std::ostringstream output_;
};

}  // namespace rsbridge

#endif  // RSBRIDGE_CSV_WRITER_HPP
