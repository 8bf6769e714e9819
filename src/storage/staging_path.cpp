#include "rsbridge/staging_path.hpp"
#include "rsbridge/errors.hpp"

#include <algorithm>
#include <cctype>

#include <uuid/uuid.h>

namespace rsbridge {

StorageUri StorageUri::parse(const std::string& uri) {
    auto scheme_end = uri.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw ConfigurationError("Invalid storage URI (expected scheme://...): " + uri);
    }

    StorageUri result;
    result.scheme = uri.substr(0, scheme_end);
    std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string rest = uri.substr(scheme_end + 3);
    auto path_start = rest.find('/');
    std::string authority = path_start == std::string::npos ? rest : rest.substr(0, path_start);
    result.path = path_start == std::string::npos ? "" : rest.substr(path_start);

    // Secrets may contain '@' only if URL-encoded, so the last '@' ends the user-info.
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        result.user_info = authority.substr(0, at);
        result.authority = authority.substr(at + 1);
    } else {
        result.authority = authority;
    }
    return result;
}

std::string StorageUri::to_string() const {
    return scheme + "://" + authority + path;
}

void check_streaming_scheme(const std::string& uri) {
    auto parsed = StorageUri::parse(uri);
    if (parsed.scheme == "s3") {
        throw ConfigurationError(
            "Staging directory " + parsed.to_string() + " uses the S3 Block FileSystem (s3://), "
            "which is not supported. Use the streaming s3n:// or s3a:// scheme instead.");
    }
}

std::string to_warehouse_uri(const std::string& uri) {
    auto parsed = StorageUri::parse(uri);
    if (parsed.scheme == "s3n" || parsed.scheme == "s3a") {
        parsed.scheme = "s3";
    }
    return parsed.to_string();
}

std::optional<Credentials> credentials_from_uri(const std::string& uri) {
    auto parsed = StorageUri::parse(uri);
    auto colon = parsed.user_info.find(':');
    if (parsed.user_info.empty() || colon == std::string::npos) {
        return std::nullopt;
    }
    Credentials creds;
    creds.access_key_id = parsed.user_info.substr(0, colon);
    creds.secret_access_key = parsed.user_info.substr(colon + 1);
    return creds;
}

std::string as_directory(const std::string& uri) {
    std::string result = uri;
    auto scheme_end = result.find("://");
    size_t keep = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    while (result.size() > keep && result.back() == '/') {
        result.pop_back();
    }
    return result + "/";
}

std::string generate_uuid() {
    uuid_t uuid;
    uuid_generate(uuid);
    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);
    return std::string(uuid_str);
}

std::string generate_identifier_suffix() {
    std::string uuid = generate_uuid();
    uuid.erase(std::remove(uuid.begin(), uuid.end(), '-'), uuid.end());
    return uuid;
}

StagingPathAllocator::StagingPathAllocator(const std::string& root_uri)
    : root_(as_directory(root_uri)) {
    check_streaming_scheme(root_);
}

std::string StagingPathAllocator::allocate() const {
    return root_ + generate_uuid() + "/";
}

}  // namespace rsbridge
