#ifndef RSBRIDGE_OBJECT_STORE_HPP
#define RSBRIDGE_OBJECT_STORE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "parameters.hpp"

namespace rsbridge {

/**
 * Storage capability used for staging data between the engine and the
 * warehouse. URIs are full "scheme://authority/path" strings.
 *
 * Implementations report failures as StagingIOError.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /**
     * Create or replace the object at `uri`.
     */
    virtual void put_file(const std::string& uri, const std::vector<uint8_t>& bytes) = 0;

    virtual std::vector<uint8_t> read_file(const std::string& uri) = 0;

    /**
     * Direct children of a directory-like prefix, as full URIs, sorted.
     * A prefix with no children yields an empty list.
     */
    virtual std::vector<std::string> list_children(const std::string& uri) = 0;

    /**
     * Remove `uri` and everything below it. Missing paths are not an error.
     */
    virtual void delete_recursive(const std::string& uri) = 0;

    /**
     * Expire objects under `prefix` of `bucket` after the given number of
     * days. Stores without lifecycle support may ignore the request.
     */
    virtual void configure_lifecycle_rule(const std::string& bucket,
                                          const std::string& prefix,
                                          int expire_after_days) = 0;
};

/**
 * Creates the store serving a staging root.
 */
using ObjectStoreFactory =
    std::function<std::shared_ptr<ObjectStore>(const std::string& root_uri, const Credentials& credentials)>;

/**
 * ObjectStore over the local filesystem for file:// URIs.
 */
class LocalObjectStore : public ObjectStore {
public:
    void put_file(const std::string& uri, const std::vector<uint8_t>& bytes) override;
    std::vector<uint8_t> read_file(const std::string& uri) override;
    std::vector<std::string> list_children(const std::string& uri) override;
    void delete_recursive(const std::string& uri) override;

    /** No-op: local files have no lifecycle policy. */
    void configure_lifecycle_rule(const std::string& bucket,
                                  const std::string& prefix,
                                  int expire_after_days) override;

    /**
     * Filesystem path of a file:// URI.
     * @throws ConfigurationError for any other scheme
     */
    static std::string to_local_path(const std::string& uri);
};

/**
 * Factory serving file:// roots with LocalObjectStore.
 * @throws ConfigurationError for other schemes
 */
ObjectStoreFactory local_object_store_factory();

}  // namespace rsbridge

#endif  // RSBRIDGE_OBJECT_STORE_HPP
