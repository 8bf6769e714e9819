#include "rsbridge/writer_interface.hpp"
#include "rsbridge/avro_writer.hpp"
#include "rsbridge/csv_writer.hpp"
#include "rsbridge/errors.hpp"

namespace rsbridge {

StagingWriterPtr make_staging_writer(TempFormat format, const std::shared_ptr<arrow::Schema>& schema) {
    switch (format) {
        case TempFormat::Avro:
            return std::make_unique<ArrowAvroWriter>(schema);
        case TempFormat::Csv:
            return std::make_unique<CSVWriter>(schema);
    }
    throw ConfigurationError("Unknown temp format");
}

}  // namespace rsbridge
