#include "rsbridge/unload_reader.hpp"
#include "rsbridge/errors.hpp"
#include "rsbridge/sql_generator.hpp"

#include <regex>

#include <arrow/api.h>
#include <arrow/csv/api.h>
#include <arrow/io/api.h>

namespace rsbridge {

namespace {

// Columns are read under positional names and take the schema's names after.
std::string positional_name(int index) {
    return "f" + std::to_string(index);
}

arrow::csv::ParseOptions unload_parse_options() {
    auto options = arrow::csv::ParseOptions::Defaults();
    options.delimiter = '|';
    options.quoting = false;
    options.escaping = true;
    options.escape_char = '\\';
    options.newlines_in_values = true;
    // An empty string in a single-column projection is an empty line.
    options.ignore_empty_lines = false;
    return options;
}

arrow::csv::ConvertOptions unload_convert_options(const arrow::Schema& schema) {
    auto options = arrow::csv::ConvertOptions::Defaults();
    options.null_values = {sql::kNullMarker};
    options.strings_can_be_null = true;
    options.true_values = {"t"};
    options.false_values = {"f"};
    for (int i = 0; i < schema.num_fields(); ++i) {
        options.column_types[positional_name(i)] = schema.field(i)->type();
    }
    return options;
}

/**
 * Arrow reports conversion failures by column index ("In CSV column #1: ...");
 * add the column name.
 */
std::string describe_failure(const std::string& source, const arrow::Status& status,
                             const arrow::Schema& schema) {
    static const std::regex column_index("CSV column #([0-9]+)");
    std::string message = source + ": " + status.message();
    std::smatch match;
    std::string arrow_message = status.message();
    if (std::regex_search(arrow_message, match, column_index)) {
        int index = std::stoi(match[1].str());
        if (index < schema.num_fields()) {
            message += " (column '" + schema.field(index)->name() + "')";
        }
    }
    return message;
}

}  // namespace

UnloadReader::UnloadReader(std::shared_ptr<arrow::Schema> schema)
    : schema_(std::move(schema)) {}

std::shared_ptr<arrow::RecordBatch> UnloadReader::read(const std::vector<uint8_t>& bytes,
                                                       const std::string& source) const {
    if (bytes.empty()) {
        auto empty = arrow::RecordBatch::MakeEmpty(schema_);
        if (!empty.ok()) {
            throw StagingIOError(source + ": " + empty.status().ToString());
        }
        return *empty;
    }

    auto read_options = arrow::csv::ReadOptions::Defaults();
    read_options.use_threads = false;
    if (schema_->num_fields() == 0) {
        read_options.autogenerate_column_names = true;
    } else {
        // Explicit names pin the column count of every record, the first included.
        for (int i = 0; i < schema_->num_fields(); ++i) {
            read_options.column_names.push_back(positional_name(i));
        }
    }

    auto input = std::make_shared<arrow::io::BufferReader>(
        arrow::Buffer::FromString(std::string(bytes.begin(), bytes.end())));

    auto reader = arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, read_options,
                                                unload_parse_options(), unload_convert_options(*schema_));
    if (!reader.ok()) {
        throw StagingIOError(describe_failure(source, reader.status(), *schema_));
    }
    auto read = (*reader)->Read();
    if (!read.ok()) {
        throw StagingIOError(describe_failure(source, read.status(), *schema_));
    }
    auto table = *read;

    if (schema_->num_fields() == 0) {
        return arrow::RecordBatch::Make(schema_, table->num_rows(), std::vector<std::shared_ptr<arrow::Array>>{});
    }

    auto combined = table->CombineChunks();
    if (!combined.ok()) {
        throw StagingIOError(source + ": " + combined.status().ToString());
    }

    std::vector<std::shared_ptr<arrow::Array>> columns;
    for (int i = 0; i < schema_->num_fields(); ++i) {
        const auto& field = schema_->field(i);
        const auto& column = (*combined)->column(i);
        if (!field->nullable() && column->null_count() > 0) {
            throw StagingIOError(source + ": column " + std::to_string(i + 1) + " ('" + field->name() +
                                 "'): NULL in a non-nullable column");
        }
        if (column->num_chunks() == 0) {
            auto empty = arrow::MakeEmptyArray(field->type());
            if (!empty.ok()) {
                throw StagingIOError(source + ": " + empty.status().ToString());
            }
            columns.push_back(*empty);
        } else {
            columns.push_back(column->chunk(0));
        }
    }
    return arrow::RecordBatch::Make(schema_, (*combined)->num_rows(), columns);
}

}  // namespace rsbridge
