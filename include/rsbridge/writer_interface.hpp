#ifndef RSBRIDGE_WRITER_INTERFACE_HPP
#define RSBRIDGE_WRITER_INTERFACE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <arrow/record_batch.h>

#include "parameters.hpp"

namespace rsbridge {

/**
 * Abstract base class for staged-file writers.
 * Implementations serialize Arrow RecordBatch data into one file of the
 * intermediate format that COPY reads.
 */
class StagingFileWriter {
public:
    virtual ~StagingFileWriter() = default;

    /**
     * Append a batch of rows. The batch schema must match the writer's.
     */
    virtual void write_batch(const std::shared_ptr<arrow::RecordBatch>& batch) = 0;

    /**
     * Finalize and return the complete file contents. The writer cannot be
     * used afterwards.
     */
    virtual std::vector<uint8_t> finish() = 0;

    /** Extension of the produced file, e.g. ".avro". */
    virtual const char* file_extension() const = 0;
};

using StagingWriterPtr = std::unique_ptr<StagingFileWriter>;

/**
 * Writer for the configured temp format.
 * @throws SchemaMappingError if a column cannot be represented
 */
StagingWriterPtr make_staging_writer(TempFormat format, const std::shared_ptr<arrow::Schema>& schema);

}  // namespace rsbridge

#endif  // RSBRIDGE_WRITER_INTERFACE_HPP
