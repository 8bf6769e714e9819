#ifndef RSBRIDGE_UNLOAD_EXECUTOR_HPP
#define RSBRIDGE_UNLOAD_EXECUTOR_HPP

#include <memory>
#include <string>
#include <vector>

#include <arrow/record_batch.h>
#include <arrow/table.h>

#include "filters.hpp"
#include "gateway.hpp"
#include "object_store.hpp"
#include "parameters.hpp"
#include "unload_reader.hpp"

namespace rsbridge {

/**
 * Lazy, partitioned view over the files an UNLOAD wrote. Each partition is
 * one file and is fetched and decoded only when read. Order across
 * partitions is unspecified.
 *
 * read_partition() is const and may be called concurrently when the object
 * store tolerates concurrent reads.
 */
class UnloadedRowSource {
public:
    UnloadedRowSource(std::shared_ptr<ObjectStore> store,
                      std::shared_ptr<arrow::Schema> schema,
                      std::vector<std::string> partitions);

    const std::shared_ptr<arrow::Schema>& schema() const { return reader_.schema(); }
    const std::vector<std::string>& partitions() const { return partitions_; }
    size_t num_partitions() const { return partitions_.size(); }

    /**
     * @throws std::out_of_range for a bad index
     * @throws StagingIOError if the file cannot be read or decoded
     */
    std::shared_ptr<arrow::RecordBatch> read_partition(size_t index) const;

    /**
     * Read every partition into one table.
     */
    std::shared_ptr<arrow::Table> collect() const;

private:
    std::shared_ptr<ObjectStore> store_;
    UnloadReader reader_;
    std::vector<std::string> partitions_;
};

/**
 * Read path: pushes the projection and the renderable filters into an
 * UNLOAD statement and exposes the unloaded files as a row source.
 */
class UnloadExecutor {
public:
    UnloadExecutor(std::shared_ptr<WarehouseGateway> gateway, ObjectStoreFactory storage);

    /**
     * @param schema Schema of the whole source relation
     * @param columns Projected columns, in output order
     * @param filters Predicates; those that cannot be rendered are not pushed down
     * @param destination Fresh staging sub-path (engine-side URI)
     *
     * @throws ConfigurationError if a projected column is not in `schema`
     * @throws WarehouseStatementError if the warehouse rejects the UNLOAD
     */
    UnloadedRowSource unload(const Parameters& params,
                             const std::shared_ptr<arrow::Schema>& schema,
                             const std::vector<std::string>& columns,
                             const std::vector<Filter>& filters,
                             const std::string& destination) const;

private:
    std::shared_ptr<WarehouseGateway> gateway_;
    ObjectStoreFactory storage_;
};

/**
 * Whether a listed object is a data file rather than a marker or manifest
 * (names starting with '_' or '.').
 */
bool is_data_file(const std::string& uri);

}  // namespace rsbridge

#endif  // RSBRIDGE_UNLOAD_EXECUTOR_HPP
