#ifndef RSBRIDGE_UNLOAD_READER_HPP
#define RSBRIDGE_UNLOAD_READER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <arrow/record_batch.h>

namespace rsbridge {

/**
 * Decodes unloaded files into record batches of a fixed schema.
 *
 * UNLOAD ... ESCAPE output is '|'-delimited, newline-terminated text with
 * no quoting. A backslash makes the following character literal (\|, \\,
 * \ + newline) and "@NULL@" is NULL. Booleans are written as t / f.
 */
class UnloadReader {
public:
    explicit UnloadReader(std::shared_ptr<arrow::Schema> schema);

    /**
     * Decode one unloaded file. A schema with no fields yields a batch that
     * only carries the row count.
     *
     * @throws StagingIOError naming the file (and the column, where known) on
     *         a malformed record or a value that does not convert
     */
    std::shared_ptr<arrow::RecordBatch> read(const std::vector<uint8_t>& bytes,
                                             const std::string& source) const;

    const std::shared_ptr<arrow::Schema>& schema() const { return schema_; }

private:
    std::shared_ptr<arrow::Schema> schema_;
};

}  // namespace rsbridge

#endif  // RSBRIDGE_UNLOAD_READER_HPP
