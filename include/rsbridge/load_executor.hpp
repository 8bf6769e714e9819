#ifndef RSBRIDGE_LOAD_EXECUTOR_HPP
#define RSBRIDGE_LOAD_EXECUTOR_HPP

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <arrow/record_batch.h>

#include "gateway.hpp"
#include "object_store.hpp"
#include "parameters.hpp"

namespace rsbridge {

/**
 * States of a load. Staged loads walk
 *   Start -> StagingTableCreated -> DataCopied -> Verified -> Swapped|Merged -> Cleanup -> Done
 * direct loads skip the staging-table states, and any failure goes
 *   ... -> Aborting -> Cleanup -> Failed
 */
enum class LoadState {
    Start,
    StagingTableCreated,
    DataCopied,
    Verified,
    Swapped,
    Merged,
    Cleanup,
    Done,
    Aborting,
    Failed
};

const char* to_string(LoadState state);

/**
 * Cooperative cancellation flag, checked between load steps.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * Write path: stages the batches as files, then loads them into the target
 * table through COPY, a staging table and an atomic swap or merge.
 */
class LoadExecutor {
public:
    LoadExecutor(std::shared_ptr<WarehouseGateway> gateway, ObjectStoreFactory storage);

    /**
     * Write `batches` into the configured table.
     *
     * @param batches Rows to write; each batch becomes one staged file
     * @param schema Schema shared by all batches (with maxlength metadata)
     * @param mode Behavior when the target already exists
     * @param cancel Optional token; a cancelled load still cleans up
     *
     * @throws ConfigurationError before any I/O (query source, ambiguous
     *         columns, bad maxlength, batch schema mismatch)
     * @throws SchemaMappingError before any I/O for an unmapped column type
     * @throws TableExistsError for ErrorIfExists against an existing table
     * @throws StagingIOError if the batches cannot be staged; no warehouse
     *         statement runs in that case
     * @throws WarehouseStatementError / LoadVerificationError after cleanup
     * @throws OperationCancelled after cleanup
     */
    void save(const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches,
              const std::shared_ptr<arrow::Schema>& schema,
              SaveMode mode,
              const Parameters& params,
              const CancellationToken* cancel = nullptr);

    /** Every state entered by the last save(), in order. */
    const std::vector<LoadState>& transitions() const { return transitions_; }

    LoadState state() const { return transitions_.empty() ? LoadState::Start : transitions_.back(); }

private:
    struct Plan;

    void transition(LoadState state);
    void check_cancelled(const CancellationToken* cancel, const TableName& table) const;

    std::string stage_batches(const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches,
                              const std::shared_ptr<arrow::Schema>& schema,
                              const Parameters& params) const;

    void run_actions(WarehouseConnection& connection,
                     const std::vector<std::string>& templates,
                     const TableName& table) const;

    void copy_and_verify(WarehouseConnection& connection,
                         const std::string& table,
                         const std::string& source_uri,
                         const Parameters& params);

    std::vector<Row> load_errors(WarehouseConnection& connection) const;

    void load_direct(WarehouseConnection& connection, const Plan& plan, const Parameters& params,
                     const CancellationToken* cancel);
    void load_staged(WarehouseConnection& connection, const Plan& plan, const Parameters& params,
                     const CancellationToken* cancel);

    std::shared_ptr<WarehouseGateway> gateway_;
    ObjectStoreFactory storage_;
    std::vector<LoadState> transitions_;
};

}  // namespace rsbridge

#endif  // RSBRIDGE_LOAD_EXECUTOR_HPP
