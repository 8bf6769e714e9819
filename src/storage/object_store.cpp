#include "rsbridge/object_store.hpp"
#include "rsbridge/errors.hpp"
#include "rsbridge/staging_path.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace rsbridge {

std::string LocalObjectStore::to_local_path(const std::string& uri) {
    auto parsed = StorageUri::parse(uri);
    if (parsed.scheme != "file") {
        throw ConfigurationError("LocalObjectStore only serves file:// URIs, got: " + uri);
    }
    if (parsed.path.empty()) {
        return "/";
    }
    return parsed.path;
}

void LocalObjectStore::put_file(const std::string& uri, const std::vector<uint8_t>& bytes) {
    fs::path path(to_local_path(uri));
    try {
        fs::create_directories(path.parent_path());
    } catch (const std::exception& e) {
        throw StagingIOError(std::string("Failed to create directory for ") + uri + ": " + e.what());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw StagingIOError("Failed to open file for writing: " + uri);
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        throw StagingIOError("Failed to write file: " + uri);
    }
}

std::vector<uint8_t> LocalObjectStore::read_file(const std::string& uri) {
    std::ifstream in(to_local_path(uri), std::ios::binary);
    if (!in.is_open()) {
        throw StagingIOError("Failed to open file for reading: " + uri);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw StagingIOError("Failed to read file: " + uri);
    }
    return bytes;
}

std::vector<std::string> LocalObjectStore::list_children(const std::string& uri) {
    fs::path dir(to_local_path(uri));
    std::vector<std::string> children;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return children;
    }

    std::string prefix = as_directory(uri);
    try {
        for (const auto& entry : fs::directory_iterator(dir)) {
            children.push_back(prefix + entry.path().filename().string());
        }
    } catch (const fs::filesystem_error& e) {
        throw StagingIOError("Failed to list " + uri + ": " + e.what());
    }
    std::sort(children.begin(), children.end());
    return children;
}

void LocalObjectStore::delete_recursive(const std::string& uri) {
    std::error_code ec;
    fs::remove_all(to_local_path(uri), ec);
    if (ec) {
        throw StagingIOError("Failed to delete " + uri + ": " + ec.message());
    }
}

void LocalObjectStore::configure_lifecycle_rule(const std::string& /*bucket*/,
                                                const std::string& /*prefix*/,
                                                int /*expire_after_days*/) {}

ObjectStoreFactory local_object_store_factory() {
    return [](const std::string& root_uri, const Credentials& /*credentials*/) -> std::shared_ptr<ObjectStore> {
        // Validates the scheme up front.
        LocalObjectStore::to_local_path(root_uri);
        return std::make_shared<LocalObjectStore>();
    };
}

}  // namespace rsbridge
