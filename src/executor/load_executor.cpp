#include "rsbridge/load_executor.hpp"
#include "rsbridge/errors.hpp"
#include "rsbridge/sql_generator.hpp"
#include "rsbridge/staging_path.hpp"
#include "rsbridge/writer_interface.hpp"

#include <cstdio>
#include <exception>
#include <iostream>
#include <sstream>

namespace rsbridge {

const char* to_string(LoadState state) {
    switch (state) {
        case LoadState::Start:
            return "Start";
        case LoadState::StagingTableCreated:
            return "StagingTableCreated";
        case LoadState::DataCopied:
            return "DataCopied";
        case LoadState::Verified:
            return "Verified";
        case LoadState::Swapped:
            return "Swapped";
        case LoadState::Merged:
            return "Merged";
        case LoadState::Cleanup:
            return "Cleanup";
        case LoadState::Done:
            return "Done";
        case LoadState::Aborting:
            return "Aborting";
        case LoadState::Failed:
            return "Failed";
    }
    return "Unknown";
}

struct LoadExecutor::Plan {
    TableName table;
    std::shared_ptr<arrow::Schema> schema;
    SaveMode mode;
    bool target_exists = false;
    std::string staged_uri;
};

namespace {

std::string describe_load_errors(const std::vector<Row>& rows) {
    std::ostringstream out;
    for (const auto& row : rows) {
        auto cell = [&row](size_t i) { return i < row.size() && row[i] ? *row[i] : std::string(); };
        out << "\n  " << cell(0) << ":" << cell(1) << " column '" << cell(2) << "' (" << cell(3)
            << ") value '" << cell(4) << "': " << cell(5);
    }
    return out.str();
}

std::string part_name(size_t index, const char* extension) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "part-%05zu", index);
    return std::string(buffer) + extension;
}

}  // namespace

LoadExecutor::LoadExecutor(std::shared_ptr<WarehouseGateway> gateway, ObjectStoreFactory storage)
    : gateway_(std::move(gateway)), storage_(std::move(storage)) {}

void LoadExecutor::transition(LoadState state) {
    transitions_.push_back(state);
    if (gateway_->verbose()) {
        std::cout << "Load state: " << to_string(state) << std::endl;
    }
}

void LoadExecutor::check_cancelled(const CancellationToken* cancel, const TableName& table) const {
    if (cancel && cancel->cancelled()) {
        throw OperationCancelled("Load into " + table.to_string() + " was cancelled");
    }
}

std::string LoadExecutor::stage_batches(const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches,
                                        const std::shared_ptr<arrow::Schema>& schema,
                                        const Parameters& params) const {
    auto store = storage_(params.temp_root(), params.credentials());

    if (auto days = params.temp_dir_expiration_days()) {
        try {
            auto root = StorageUri::parse(params.temp_root());
            std::string prefix = root.path;
            while (!prefix.empty() && prefix.front() == '/') {
                prefix.erase(prefix.begin());
            }
            store->configure_lifecycle_rule(root.authority, prefix, *days);
        } catch (const std::exception& e) {
            std::cerr << "Warning: could not configure staging lifecycle rule: " << e.what() << std::endl;
        }
    }

    StagingPathAllocator allocator(params.temp_root());
    std::string path = allocator.allocate();

    try {
        size_t count = batches.empty() ? 1 : batches.size();
        for (size_t i = 0; i < count; ++i) {
            auto writer = make_staging_writer(params.temp_format(), schema);
            if (!batches.empty()) {
                writer->write_batch(batches[i]);
            }
            store->put_file(path + part_name(i, writer->file_extension()), writer->finish());
        }
    } catch (const std::exception& e) {
        // Partial files are left to the lifecycle rule of the temp dir.
        if (dynamic_cast<const StagingIOError*>(&e)) {
            throw;
        }
        throw StagingIOError("Failed to stage data at " + path + ": " + e.what());
    }

    return path;
}

void LoadExecutor::run_actions(WarehouseConnection& connection,
                               const std::vector<std::string>& templates,
                               const TableName& table) const {
    for (const auto& action : sql::expand_actions(templates, table.to_string())) {
        gateway_->execute(connection, action);
    }
}

std::vector<Row> LoadExecutor::load_errors(WarehouseConnection& connection) const {
    std::vector<Row> rows;
    gateway_->query(connection, sql::load_errors_query(), [&rows](const Row& row) { rows.push_back(row); });
    return rows;
}

void LoadExecutor::copy_and_verify(WarehouseConnection& connection,
                                   const std::string& table,
                                   const std::string& source_uri,
                                   const Parameters& params) {
    std::string copy = sql::copy_query(table, source_uri, params.credentials(), params.temp_format(),
                                       params.extra_copy_options());
    try {
        gateway_->execute(connection, copy);
    } catch (const WarehouseStatementError& e) {
        // Enrich the failure with the load-error log when it can be read.
        std::vector<Row> rows;
        try {
            rows = load_errors(connection);
        } catch (const std::exception& log_error) {
            std::cerr << "Warning: could not read load errors: " << log_error.what() << std::endl;
        }
        if (rows.empty()) {
            throw;
        }
        throw WarehouseStatementError(std::string(e.what()) + describe_load_errors(rows),
                                      sql::redact_credentials(e.sql()), e.sqlstate());
    }
    transition(LoadState::DataCopied);

    // COPY can report success and still have rejected rows.
    auto rows = load_errors(connection);
    if (!rows.empty()) {
        throw LoadVerificationError("COPY into " + table + " reported " + std::to_string(rows.size()) +
                                        " load error(s):" + describe_load_errors(rows),
                                    sql::redact_credentials(copy));
    }
    transition(LoadState::Verified);
}

void LoadExecutor::load_direct(WarehouseConnection& connection, const Plan& plan, const Parameters& params,
                               const CancellationToken* cancel) {
    std::exception_ptr failure;
    try {
        check_cancelled(cancel, plan.table);
        run_actions(connection, params.pre_actions(), plan.table);
        gateway_->execute(connection,
                          sql::create_table_sql(*plan.schema, plan.table.to_string(), params.dist_style(),
                                                params.dist_key(), params.sort_key_spec()));
        check_cancelled(cancel, plan.table);
        copy_and_verify(connection, plan.table.to_string(), plan.staged_uri, params);
        run_actions(connection, params.post_actions(), plan.table);
    } catch (const std::exception&) {
        transition(LoadState::Aborting);
        failure = std::current_exception();
    }

    transition(LoadState::Cleanup);
    if (failure) {
        transition(LoadState::Failed);
        std::rethrow_exception(failure);
    }
    transition(LoadState::Done);
}

void LoadExecutor::load_staged(WarehouseConnection& connection, const Plan& plan, const Parameters& params,
                               const CancellationToken* cancel) {
    TableName staging = plan.table.with_suffix("_staging_" + generate_identifier_suffix());

    std::exception_ptr failure;
    try {
        check_cancelled(cancel, plan.table);
        run_actions(connection, params.pre_actions(), plan.table);

        gateway_->execute(connection, sql::drop_table_sql(staging.to_string()));
        gateway_->execute(connection,
                          sql::create_table_sql(*plan.schema, staging.to_string(), params.dist_style(),
                                                params.dist_key(), params.sort_key_spec()));
        transition(LoadState::StagingTableCreated);
        check_cancelled(cancel, plan.table);

        copy_and_verify(connection, staging.to_string(), plan.staged_uri, params);
        // Post-actions see the staging table, so a failing one leaves the target untouched.
        run_actions(connection, params.post_actions(), staging);
        check_cancelled(cancel, plan.table);

        if (plan.mode == SaveMode::Append) {
            gateway_->execute_atomically(connection, sql::append_statements(plan.table, staging));
            transition(LoadState::Merged);
        } else if (plan.target_exists) {
            gateway_->execute_atomically(connection,
                                         sql::swap_statements(plan.table, staging, generate_identifier_suffix()));
            transition(LoadState::Swapped);
        } else {
            gateway_->execute(connection, sql::rename_table_sql(staging, plan.table));
            transition(LoadState::Swapped);
        }
    } catch (const std::exception&) {
        transition(LoadState::Aborting);
        failure = std::current_exception();
    }

    transition(LoadState::Cleanup);
    try {
        gateway_->execute(connection, sql::drop_table_sql(staging.to_string()));
    } catch (const std::exception& e) {
        std::cerr << "Warning: failed to drop staging table " << staging.to_string() << ": " << e.what()
                  << std::endl;
    }

    if (failure) {
        transition(LoadState::Failed);
        std::rethrow_exception(failure);
    }
    transition(LoadState::Done);
}

void LoadExecutor::save(const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches,
                        const std::shared_ptr<arrow::Schema>& schema,
                        SaveMode mode,
                        const Parameters& params,
                        const CancellationToken* cancel) {
    transitions_.clear();

    // Everything that can be rejected up front is rejected before any I/O.
    const TableName& table = params.require_table();
    sql::create_table_sql(*schema, table.to_string(), params.dist_style(), params.dist_key(),
                          params.sort_key_spec());
    for (const auto& batch : batches) {
        if (!batch->schema()->Equals(*schema, false)) {
            throw ConfigurationError("Batch schema " + batch->schema()->ToString() +
                                     " does not match the schema being written");
        }
    }

    bool staged = mode == SaveMode::Overwrite ||
                  (mode == SaveMode::Append && params.use_staging_table().value_or(false));
    if (mode == SaveMode::Overwrite && params.use_staging_table() == false) {
        std::cerr << "Warning: usestagingtable=false is ignored for Overwrite; "
                  << "the table is replaced through a staging table" << std::endl;
    }

    transition(LoadState::Start);

    gateway_->with_connection(params, [&](WarehouseConnection& connection) {
        Plan plan{table, schema, mode};

        if (mode != SaveMode::Append) {
            try {
                plan.target_exists = gateway_->table_exists(connection, table.to_string());
            } catch (const std::exception&) {
                transition(LoadState::Failed);
                throw;
            }
        }
        if (plan.target_exists && mode == SaveMode::ErrorIfExists) {
            transition(LoadState::Failed);
            throw TableExistsError(table.to_string());
        }
        if (plan.target_exists && mode == SaveMode::Ignore) {
            transition(LoadState::Done);
            return;
        }

        try {
            check_cancelled(cancel, table);
            plan.staged_uri = to_warehouse_uri(stage_batches(batches, schema, params));
        } catch (const std::exception&) {
            transition(LoadState::Failed);
            throw;
        }

        if (staged) {
            load_staged(connection, plan, params, cancel);
        } else {
            load_direct(connection, plan, params, cancel);
        }
    });
}

}  // namespace rsbridge
