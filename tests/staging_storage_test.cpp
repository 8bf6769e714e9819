#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>

#include "rsbridge/errors.hpp"
#include "rsbridge/object_store.hpp"
#include "rsbridge/staging_path.hpp"

namespace rsbridge {
namespace test {

namespace fs = std::filesystem;

// =====================================================================
// StagingPathTest: URI handling and path allocation
// =====================================================================

TEST(StagingPathTest, ParseUri) {
    auto uri = StorageUri::parse("S3N://AK:SK@bucket/temp/dir");
    EXPECT_EQ(uri.scheme, "s3n");
    EXPECT_EQ(uri.user_info, "AK:SK");
    EXPECT_EQ(uri.authority, "bucket");
    EXPECT_EQ(uri.path, "/temp/dir");
    EXPECT_EQ(uri.to_string(), "s3n://bucket/temp/dir");

    auto bare = StorageUri::parse("s3a://bucket");
    EXPECT_EQ(bare.authority, "bucket");
    EXPECT_EQ(bare.path, "");

    EXPECT_THROW(StorageUri::parse("bucket/temp"), ConfigurationError);
}

TEST(StagingPathTest, StreamingSchemes) {
    EXPECT_NO_THROW(check_streaming_scheme("s3n://bucket/x"));
    EXPECT_NO_THROW(check_streaming_scheme("s3a://bucket/x"));
    EXPECT_NO_THROW(check_streaming_scheme("file:///tmp/x"));
    try {
        check_streaming_scheme("s3://bucket/x");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("S3 Block FileSystem (s3://)"), std::string::npos);
    }
}

TEST(StagingPathTest, WarehouseUri) {
    EXPECT_EQ(to_warehouse_uri("s3n://bucket/temp/"), "s3://bucket/temp/");
    EXPECT_EQ(to_warehouse_uri("s3a://AK:SK@bucket/temp/"), "s3://bucket/temp/");
    EXPECT_EQ(to_warehouse_uri("file:///tmp/x/"), "file:///tmp/x/");
}

TEST(StagingPathTest, CredentialsFromUri) {
    auto creds = credentials_from_uri("s3n://AK:SK@bucket/temp");
    ASSERT_TRUE(creds.has_value());
    EXPECT_EQ(creds->access_key_id, "AK");
    EXPECT_EQ(creds->secret_access_key, "SK");

    EXPECT_FALSE(credentials_from_uri("s3n://bucket/temp").has_value());
    EXPECT_FALSE(credentials_from_uri("s3n://AK@bucket/temp").has_value());
}

TEST(StagingPathTest, AsDirectory) {
    EXPECT_EQ(as_directory("s3n://bucket/temp"), "s3n://bucket/temp/");
    EXPECT_EQ(as_directory("s3n://bucket/temp//"), "s3n://bucket/temp/");
    EXPECT_EQ(as_directory("file:///"), "file:///");
}

TEST(StagingPathTest, AllocatedPathsAreUniqueChildrenOfTheRoot) {
    StagingPathAllocator allocator("s3n://bucket/temp");
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string path = allocator.allocate();
        EXPECT_EQ(path.rfind("s3n://bucket/temp/", 0), 0u) << path;
        EXPECT_EQ(path.back(), '/');
        EXPECT_TRUE(seen.insert(path).second) << "duplicate " << path;
    }
}

TEST(StagingPathTest, AllocatorRejectsBlockScheme) {
    EXPECT_THROW(StagingPathAllocator("s3://bucket/temp"), ConfigurationError);
}

TEST(StagingPathTest, IdentifierSuffix) {
    std::string suffix = generate_identifier_suffix();
    EXPECT_EQ(suffix.size(), 32u);
    EXPECT_EQ(suffix.find('-'), std::string::npos);
    EXPECT_NE(suffix, generate_identifier_suffix());
}

// =====================================================================
// LocalObjectStoreTest: file:// store in a scratch directory
// =====================================================================

class LocalObjectStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::string root;
    LocalObjectStore store;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("rsbridge_store_test_" + generate_identifier_suffix());
        fs::create_directories(test_dir);
        root = "file://" + test_dir.string() + "/";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }
};

TEST_F(LocalObjectStoreTest, PutAndRead) {
    std::vector<uint8_t> bytes = {1, 2, 3, 0, 255};
    store.put_file(root + "a/b/part-00000.avro", bytes);
    EXPECT_TRUE(fs::exists(test_dir / "a" / "b" / "part-00000.avro"));
    EXPECT_EQ(store.read_file(root + "a/b/part-00000.avro"), bytes);
}

TEST_F(LocalObjectStoreTest, ListChildrenIsSorted) {
    store.put_file(root + "out/0001_part_00", {});
    store.put_file(root + "out/0000_part_00", {});
    store.put_file(root + "out/_SUCCESS", {});

    auto children = store.list_children(root + "out");
    ASSERT_EQ(children.size(), 3u);
    EXPECT_EQ(children[0], root + "out/0000_part_00");
    EXPECT_EQ(children[1], root + "out/0001_part_00");
    EXPECT_EQ(children[2], root + "out/_SUCCESS");

    EXPECT_TRUE(store.list_children(root + "missing/").empty());
}

TEST_F(LocalObjectStoreTest, DeleteRecursive) {
    store.put_file(root + "tmp/x/one", {1});
    store.put_file(root + "tmp/x/two", {2});
    store.delete_recursive(root + "tmp/x/");
    EXPECT_FALSE(fs::exists(test_dir / "tmp" / "x"));
    EXPECT_NO_THROW(store.delete_recursive(root + "tmp/x/"));
}

TEST_F(LocalObjectStoreTest, ReadingAMissingFileFails) {
    EXPECT_THROW(store.read_file(root + "nope"), StagingIOError);
}

TEST_F(LocalObjectStoreTest, FactoryOnlyServesFileUris) {
    auto factory = local_object_store_factory();
    EXPECT_NE(factory(root, Credentials{}), nullptr);
    EXPECT_THROW(factory("s3n://bucket/temp/", Credentials{}), ConfigurationError);
}

}  // namespace test
}  // namespace rsbridge
