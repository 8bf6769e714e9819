#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include <arrow/api.h>

#include "fake_warehouse.hpp"
#include "rsbridge/errors.hpp"
#include "rsbridge/staging_path.hpp"
#include "rsbridge/unload_executor.hpp"
#include "unload_test_support.hpp"

namespace rsbridge {
namespace test {

class UnloadExecutorTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeWarehouseDriver> driver = std::make_shared<FakeWarehouseDriver>();
    std::shared_ptr<MemoryObjectStore> store = std::make_shared<MemoryObjectStore>();
    std::shared_ptr<WarehouseGateway> gateway = std::make_shared<WarehouseGateway>(driver);
    UnloadExecutor executor{gateway, factory_for(store)};
    Parameters params = test_parameters();
    std::string destination = "s3n://test-bucket/temp/run-1";

    std::shared_ptr<arrow::Schema> schema = arrow::schema({
        arrow::field("testbyte", arrow::int8()),
        arrow::field("testbool", arrow::boolean()),
        arrow::field("teststring", arrow::utf8()),
        arrow::field("testdouble", arrow::float64()),
    });

    FakeWarehouseState& state() { return *driver->state; }
};

TEST_F(UnloadExecutorTest, UnloadsIntoTheWarehouseFormOfTheDestination) {
    fake_unload_output(state(), store, {"1|t\n"});
    executor.unload(params, schema, {"testbyte", "testbool"}, {}, destination);

    ASSERT_EQ(state().statements.size(), 1u);
    EXPECT_EQ(state().statements[0],
              "UNLOAD ('SELECT \"testbyte\", \"testbool\" FROM test_table ') "
              "TO 's3://test-bucket/temp/run-1/' "
              "WITH CREDENTIALS 'aws_access_key_id=test1;aws_secret_access_key=test2' "
              "ESCAPE NULL AS '@NULL@'");
    EXPECT_EQ(state().opened, 1);
    EXPECT_EQ(state().closed, 1);
}

TEST_F(UnloadExecutorTest, PartitionsSkipMarkers) {
    fake_unload_output(state(), store, {"1|t\n1|f\n", "0|@NULL@\n"});
    auto source = executor.unload(params, schema, {"testbyte", "testbool"}, {}, destination);

    ASSERT_EQ(source.num_partitions(), 2u);
    EXPECT_EQ(source.partitions()[0], "s3n://test-bucket/temp/run-1/0000_part_00");
    EXPECT_EQ(source.partitions()[1], "s3n://test-bucket/temp/run-1/0001_part_00");
    EXPECT_EQ(source.schema()->num_fields(), 2);
    EXPECT_EQ(source.schema()->field(0)->name(), "testbyte");

    auto second = source.read_partition(1);
    ASSERT_EQ(second->num_rows(), 1);
    EXPECT_TRUE(second->column(1)->IsNull(0));

    auto table = source.collect();
    EXPECT_EQ(table->num_rows(), 3);
    EXPECT_EQ(table->num_columns(), 2);

    EXPECT_THROW(source.read_partition(2), std::out_of_range);
}

TEST_F(UnloadExecutorTest, ProjectionOrderFollowsRequest) {
    fake_unload_output(state(), store, {"caf\\|e|2\n"});
    auto source = executor.unload(params, schema, {"teststring", "testbyte"}, {}, destination);
    auto batch = source.read_partition(0);
    EXPECT_EQ(std::static_pointer_cast<arrow::StringArray>(batch->column(0))->GetString(0), "caf|e");
    EXPECT_EQ(std::static_pointer_cast<arrow::Int8Array>(batch->column(1))->Value(0), 2);
}

TEST_F(UnloadExecutorTest, EmptyProjectionCountsRows) {
    fake_unload_output(state(), store, {"1\n1\n", "1\n"});
    auto source = executor.unload(params, schema, {}, {}, destination);

    EXPECT_NE(state().statements[0].find("SELECT 1 FROM test_table"), std::string::npos);
    auto table = source.collect();
    EXPECT_EQ(table->num_columns(), 0);
    EXPECT_EQ(table->num_rows(), 3);
}

TEST_F(UnloadExecutorTest, NoOutputFilesMeansNoRows) {
    auto source = executor.unload(params, schema, {"testbyte"}, {}, destination);
    EXPECT_EQ(source.num_partitions(), 0u);
    EXPECT_EQ(source.collect()->num_rows(), 0);
}

TEST_F(UnloadExecutorTest, UnsupportedFiltersAreNotPushedDown) {
    fake_unload_output(state(), store, {});
    std::vector<Filter> filters = {
        Filter::greater_than("testdouble", std::numeric_limits<double>::quiet_NaN()),
        Filter::equal_to("teststring", std::string("x")),
    };
    executor.unload(params, schema, {"testbyte"}, filters, destination);
    EXPECT_NE(state().statements[0].find("FROM test_table WHERE \"teststring\" = \\'x\\')"), std::string::npos)
        << state().statements[0];
    EXPECT_EQ(state().statements[0].find("testdouble"), std::string::npos);
}

TEST_F(UnloadExecutorTest, UnknownColumnIsRejectedBeforeConnecting) {
    try {
        executor.unload(params, schema, {"testbyte", "nope"}, {}, destination);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("'nope'"), std::string::npos);
    }
    EXPECT_EQ(state().opened, 0);
}

TEST_F(UnloadExecutorTest, BlockSchemeDestinationIsRejected) {
    EXPECT_THROW(executor.unload(params, schema, {"testbyte"}, {}, "s3://test-bucket/temp/run-1/"),
                 ConfigurationError);
    EXPECT_TRUE(state().statements.empty());
}

TEST_F(UnloadExecutorTest, UnloadFailurePropagates) {
    state().fail_on("^UNLOAD");
    EXPECT_THROW(executor.unload(params, schema, {"testbyte"}, {}, destination), WarehouseStatementError);
    EXPECT_EQ(state().closed, 1);
}

TEST_F(UnloadExecutorTest, MalformedOutputSurfacesOnRead) {
    fake_unload_output(state(), store, {"1|t|extra\n"});
    auto source = executor.unload(params, schema, {"testbyte", "testbool"}, {}, destination);
    EXPECT_THROW(source.read_partition(0), StagingIOError);
}

TEST(DataFileTest, MarkersAreNotData) {
    EXPECT_TRUE(is_data_file("s3n://b/t/0000_part_00"));
    EXPECT_FALSE(is_data_file("s3n://b/t/_SUCCESS"));
    EXPECT_FALSE(is_data_file("s3n://b/t/.hidden"));
    EXPECT_FALSE(is_data_file("s3n://b/t/_temporary/"));
}

}  // namespace test
}  // namespace rsbridge
