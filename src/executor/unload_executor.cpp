#include "rsbridge/unload_executor.hpp"
#include "rsbridge/errors.hpp"
#include "rsbridge/sql_generator.hpp"
#include "rsbridge/staging_path.hpp"

#include <stdexcept>

#include <arrow/api.h>

namespace rsbridge {

bool is_data_file(const std::string& uri) {
    std::string name = uri;
    while (!name.empty() && name.back() == '/') {
        name.pop_back();
    }
    auto slash = name.rfind('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    return !name.empty() && name[0] != '_' && name[0] != '.';
}

UnloadedRowSource::UnloadedRowSource(std::shared_ptr<ObjectStore> store,
                                     std::shared_ptr<arrow::Schema> schema,
                                     std::vector<std::string> partitions)
    : store_(std::move(store)),
      reader_(std::move(schema)),
      partitions_(std::move(partitions)) {}

std::shared_ptr<arrow::RecordBatch> UnloadedRowSource::read_partition(size_t index) const {
    if (index >= partitions_.size()) {
        throw std::out_of_range("Partition " + std::to_string(index) + " out of range (" +
                                std::to_string(partitions_.size()) + " partitions)");
    }
    const auto& uri = partitions_[index];
    return reader_.read(store_->read_file(uri), uri);
}

std::shared_ptr<arrow::Table> UnloadedRowSource::collect() const {
    std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
    batches.reserve(partitions_.size());
    for (size_t i = 0; i < partitions_.size(); ++i) {
        batches.push_back(read_partition(i));
    }

    auto result = arrow::Table::FromRecordBatches(schema(), batches);
    if (!result.ok()) {
        throw std::runtime_error("Failed to assemble unloaded table: " + result.status().ToString());
    }
    return *result;
}

UnloadExecutor::UnloadExecutor(std::shared_ptr<WarehouseGateway> gateway, ObjectStoreFactory storage)
    : gateway_(std::move(gateway)), storage_(std::move(storage)) {}

UnloadedRowSource UnloadExecutor::unload(const Parameters& params,
                                         const std::shared_ptr<arrow::Schema>& schema,
                                         const std::vector<std::string>& columns,
                                         const std::vector<Filter>& filters,
                                         const std::string& destination) const {
    check_streaming_scheme(destination);

    arrow::FieldVector projected;
    for (const auto& column : columns) {
        auto field = schema->GetFieldByName(column);
        if (!field) {
            throw ConfigurationError("Column '" + column + "' does not exist in " +
                                     params.source_expression());
        }
        projected.push_back(field);
    }
    auto projected_schema = arrow::schema(projected);

    std::string location = as_directory(destination);
    std::string statement = sql::unload_query(params.source_expression(), columns, filters,
                                              params.credentials(), to_warehouse_uri(location));

    gateway_->with_connection(params, [&](WarehouseConnection& connection) {
        gateway_->execute(connection, statement);
    });

    auto store = storage_(params.temp_root(), params.credentials());
    std::vector<std::string> partitions;
    for (const auto& child : store->list_children(location)) {
        if (is_data_file(child)) {
            partitions.push_back(child);
        }
    }

    return UnloadedRowSource(std::move(store), projected_schema, std::move(partitions));
}

}  // namespace rsbridge
