#include "rsbridge/relation.hpp"
#include "rsbridge/errors.hpp"
#include "rsbridge/sql_generator.hpp"
#include "rsbridge/staging_path.hpp"

namespace rsbridge {

RedshiftRelation::RedshiftRelation(Parameters params,
                                   std::shared_ptr<arrow::Schema> schema,
                                   std::shared_ptr<WarehouseGateway> gateway,
                                   ObjectStoreFactory storage)
    : params_(std::move(params)),
      schema_(std::move(schema)),
      unloader_(gateway, storage),
      loader_(gateway, storage) {}

const std::set<Capability>& RedshiftRelation::capabilities() const {
    static const std::set<Capability> kCapabilities = {
        Capability::PrunedFilteredScan,
        Capability::Insertable,
    };
    return kCapabilities;
}

UnloadedRowSource RedshiftRelation::build_scan(const std::vector<std::string>& columns,
                                               const std::vector<Filter>& filters) {
    StagingPathAllocator allocator(params_.temp_root());
    return unloader_.unload(params_, schema_, columns, filters, allocator.allocate());
}

std::vector<Filter> RedshiftRelation::unhandled_filters(const std::vector<Filter>& filters) const {
    std::vector<Filter> unhandled;
    for (const auto& filter : filters) {
        if (!sql::build_filter_expression(filter)) {
            unhandled.push_back(filter);
        }
    }
    return unhandled;
}

void RedshiftRelation::insert(const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches, bool overwrite) {
    loader_.save(batches, schema_, overwrite ? SaveMode::Overwrite : SaveMode::Append, params_);
}

DataSource::DataSource(std::shared_ptr<WarehouseDriver> driver, ObjectStoreFactory storage, bool verbose)
    : gateway_(std::make_shared<WarehouseGateway>(std::move(driver), verbose)),
      storage_(std::move(storage)) {
    if (!storage_) {
        throw ConfigurationError("An object store factory is required");
    }
}

std::shared_ptr<BaseRelation> DataSource::create_relation(const std::map<std::string, std::string>& options,
                                                          std::shared_ptr<arrow::Schema> schema) {
    Parameters params = Parameters::merge(options);
    if (!schema) {
        schema = gateway_->with_connection(params, [&](WarehouseConnection& connection) {
            return gateway_->resolve_schema(connection, params.source_expression());
        });
    }
    return std::make_shared<RedshiftRelation>(std::move(params), std::move(schema), gateway_, storage_);
}

std::shared_ptr<BaseRelation> DataSource::create_relation(
    const std::map<std::string, std::string>& options,
    SaveMode mode,
    const std::vector<std::shared_ptr<arrow::RecordBatch>>& batches,
    const std::shared_ptr<arrow::Schema>& schema) {
    Parameters params = Parameters::merge(options);
    LoadExecutor loader(gateway_, storage_);
    loader.save(batches, schema, mode, params);
    return std::make_shared<RedshiftRelation>(std::move(params), schema, gateway_, storage_);
}

}  // namespace rsbridge
