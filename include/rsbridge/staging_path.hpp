#ifndef RSBRIDGE_STAGING_PATH_HPP
#define RSBRIDGE_STAGING_PATH_HPP

#include <optional>
#include <string>

#include "parameters.hpp"

namespace rsbridge {

/**
 * Components of a staging URI: scheme://[user:secret@]authority/path
 */
struct StorageUri {
    std::string scheme;
    std::string user_info;
    std::string authority;
    std::string path;

    /**
     * Parse a URI string.
     * @throws ConfigurationError if there is no "scheme://" prefix
     */
    static StorageUri parse(const std::string& uri);

    /** Reassemble, dropping the user-info part. */
    std::string to_string() const;
};

/**
 * Reject storage schemes that are block-oriented rather than streaming.
 * Hadoop-style "s3://" is the block filesystem; "s3n://" and "s3a://" are
 * the streaming ones.
 *
 * @throws ConfigurationError whose message names the Block FileSystem
 */
void check_streaming_scheme(const std::string& uri);

/**
 * URI as the warehouse expects it in UNLOAD / COPY: s3n and s3a become s3,
 * embedded credentials are removed.
 */
std::string to_warehouse_uri(const std::string& uri);

/**
 * Credentials embedded as "ACCESS_KEY:SECRET@" in the URI, if any.
 */
std::optional<Credentials> credentials_from_uri(const std::string& uri);

/**
 * Ensure a single trailing '/'.
 */
std::string as_directory(const std::string& uri);

/**
 * Random RFC 4122 UUID string (libuuid).
 */
std::string generate_uuid();

/**
 * UUID without hyphens; safe inside unquoted SQL identifiers.
 */
std::string generate_identifier_suffix();

/**
 * Hands out a fresh, never reused sub-directory of the staging root for
 * each read or write operation.
 */
class StagingPathAllocator {
public:
    explicit StagingPathAllocator(const std::string& root_uri);

    /**
     * @return "<root>/<uuid>/"
     */
    std::string allocate() const;

    const std::string& root() const { return root_; }

private:
    std::string root_;
};

}  // namespace rsbridge

#endif  // RSBRIDGE_STAGING_PATH_HPP
