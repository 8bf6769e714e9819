#ifndef RSBRIDGE_RELATION_HPP
#define RSBRIDGE_RELATION_HPP

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <arrow/record_batch.h>

#include "filters.hpp"
#include "gateway.hpp"
#include "load_executor.hpp"
#include "object_store.hpp"
#include "parameters.hpp"
#include "unload_executor.hpp"

namespace rsbridge {

/**
 * What an engine may ask of a relation.
 */
enum class Capability {
    PrunedFilteredScan,
    Insertable
};

/**
 * Scan with column pruning and filter pushdown.
 */
class PrunedFilteredScan {
public:
    virtual ~PrunedFilteredScan() = default;

    /**
     * @param columns Columns to return, in order; may be empty
     * @param filters Predicates the engine will re-apply to the result
     */
    virtual UnloadedRowSource build_scan(const std::vector<std::string>& columns,
                                         const std::vector<Filter>& filters) = 0;

    /**
     * The subset of `filters` that build_scan() cannot push down.
     */
    virtual std::vector<Filter> unhandled_filters(const std::vector<Filter>& filters) const = 0;
};

class InsertableRelation {
public:
    virtual ~InsertableRelation() = default;

    /**
     * Append the batches, or replace the table contents when `overwrite`.
     */
    virtual void insert(const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches, bool overwrite) = 0;
};

/**
 * A relation declares its capabilities up front and hands out the matching
 * interface; unsupported capabilities yield nullptr.
 */
class BaseRelation {
public:
    virtual ~BaseRelation() = default;

    virtual std::shared_ptr<arrow::Schema> schema() const = 0;
    virtual const std::set<Capability>& capabilities() const = 0;

    bool supports(Capability capability) const { return capabilities().count(capability) > 0; }

    virtual PrunedFilteredScan* as_scan() { return nullptr; }
    virtual InsertableRelation* as_insertable() { return nullptr; }
};

/**
 * A warehouse table or query, scanned through UNLOAD and written through
 * COPY.
 */
class RedshiftRelation : public BaseRelation, public PrunedFilteredScan, public InsertableRelation {
public:
    RedshiftRelation(Parameters params,
                     std::shared_ptr<arrow::Schema> schema,
                     std::shared_ptr<WarehouseGateway> gateway,
                     ObjectStoreFactory storage);

    std::shared_ptr<arrow::Schema> schema() const override { return schema_; }
    const std::set<Capability>& capabilities() const override;

    PrunedFilteredScan* as_scan() override { return this; }
    InsertableRelation* as_insertable() override { return this; }

    UnloadedRowSource build_scan(const std::vector<std::string>& columns,
                                 const std::vector<Filter>& filters) override;
    std::vector<Filter> unhandled_filters(const std::vector<Filter>& filters) const override;

    void insert(const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches, bool overwrite) override;

    const Parameters& parameters() const { return params_; }

    /** State transitions of the most recent insert. */
    const std::vector<LoadState>& load_transitions() const { return loader_.transitions(); }

private:
    Parameters params_;
    std::shared_ptr<arrow::Schema> schema_;
    UnloadExecutor unloader_;
    LoadExecutor loader_;
};

/**
 * Entry point used by the engine. The warehouse driver and the storage
 * factory are injected, so tests can substitute fakes.
 */
class DataSource {
public:
    /**
     * @param verbose Trace warehouse statements (credentials redacted)
     */
    DataSource(std::shared_ptr<WarehouseDriver> driver, ObjectStoreFactory storage, bool verbose = false);

    /**
     * Relation for reading. Without a schema, the schema is resolved by
     * describing the table or query in the warehouse.
     *
     * @throws ConfigurationError for invalid options
     */
    std::shared_ptr<BaseRelation> create_relation(const std::map<std::string, std::string>& options,
                                                  std::shared_ptr<arrow::Schema> schema = nullptr);

    /**
     * Write `batches` according to `mode`, then return a relation over the
     * written table.
     */
    std::shared_ptr<BaseRelation> create_relation(const std::map<std::string, std::string>& options,
                                                  SaveMode mode,
                                                  const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches,
                                                  const std::shared_ptr<arrow::Schema>& schema);

private:
    std::shared_ptr<WarehouseGateway> gateway_;
    ObjectStoreFactory storage_;
};

}  // namespace rsbridge

#endif  // RSBRIDGE_RELATION_HPP
