#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <arrow/api.h>

#include "fake_warehouse.hpp"
#include "rsbridge/errors.hpp"
#include "rsbridge/gateway.hpp"
#include "rsbridge/type_mapper.hpp"

namespace rsbridge {
namespace test {

class GatewayTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeWarehouseDriver> driver = std::make_shared<FakeWarehouseDriver>();
    WarehouseGateway gateway{driver};
    Parameters params = test_parameters({{"querytimeout", "45"}});

    FakeWarehouseState& state() { return *driver->state; }
};

TEST_F(GatewayTest, ConnectionClosedOnceOnSuccess) {
    int result = gateway.with_connection(params, [&](WarehouseConnection& connection) {
        gateway.execute(connection, "SELECT 1");
        return 7;
    });
    EXPECT_EQ(result, 7);
    EXPECT_EQ(state().opened, 1);
    EXPECT_EQ(state().closed, 1);
    EXPECT_EQ(state().last_options.query_timeout_seconds, 45);
}

TEST_F(GatewayTest, ConnectionClosedOnceOnFailure) {
    state().fail_on("^DROP");
    EXPECT_THROW(gateway.with_connection(params,
                                         [&](WarehouseConnection& connection) {
                                             gateway.execute(connection, "DROP TABLE x");
                                         }),
                 WarehouseStatementError);
    EXPECT_EQ(state().opened, 1);
    EXPECT_EQ(state().closed, 1);
}

TEST_F(GatewayTest, ConnectFailurePropagates) {
    state().fail_connect = true;
    EXPECT_THROW(gateway.with_connection(params, [](WarehouseConnection&) {}), WarehouseStatementError);
    EXPECT_EQ(state().closed, 0);
}

TEST_F(GatewayTest, GuardCloseIsIdempotent) {
    {
        ConnectionGuard guard(driver->connect("url", ConnectionOptions{}));
        guard.close();
        guard.close();
    }
    EXPECT_EQ(state().closed, 1);
}

TEST_F(GatewayTest, NullDriverIsRejected) {
    EXPECT_THROW(WarehouseGateway(nullptr), ConfigurationError);
}

TEST_F(GatewayTest, AtomicBlockOnMultiStatementConnection) {
    gateway.with_connection(params, [&](WarehouseConnection& connection) {
        gateway.execute_atomically(connection, {"ALTER TABLE a RENAME TO b", "DROP TABLE c"});
    });
    ASSERT_EQ(state().statements.size(), 1u);
    EXPECT_EQ(state().statements[0], "BEGIN;\nALTER TABLE a RENAME TO b;\nDROP TABLE c;\nEND;");
}

TEST_F(GatewayTest, AtomicBlockFailureRollsBack) {
    state().fail_on("^BEGIN;");
    gateway.with_connection(params, [&](WarehouseConnection& connection) {
        EXPECT_THROW(gateway.execute_atomically(connection, {"ALTER TABLE a RENAME TO b", "DROP TABLE c"}),
                     WarehouseStatementError);
        // The session accepts statements again.
        EXPECT_NO_THROW(gateway.execute(connection, "DROP TABLE IF EXISTS s"));
    });
    ASSERT_EQ(state().statements.size(), 3u);
    EXPECT_EQ(state().statements[1], "ROLLBACK");
    EXPECT_EQ(state().statements[2], "DROP TABLE IF EXISTS s");
    EXPECT_EQ(state().refused_while_aborted, 0);
}

TEST_F(GatewayTest, ExplicitTransactionCommits) {
    state().multi_statement = false;
    gateway.with_connection(params, [&](WarehouseConnection& connection) {
        gateway.execute_atomically(connection, {"ALTER TABLE a RENAME TO b", "DROP TABLE c"});
    });
    EXPECT_EQ(state().statements,
              (std::vector<std::string>{"BEGIN", "ALTER TABLE a RENAME TO b", "DROP TABLE c", "COMMIT"}));
}

TEST_F(GatewayTest, ExplicitTransactionRollsBack) {
    state().multi_statement = false;
    state().fail_on("^DROP TABLE c$");
    EXPECT_THROW(gateway.with_connection(params,
                                         [&](WarehouseConnection& connection) {
                                             gateway.execute_atomically(
                                                 connection, {"ALTER TABLE a RENAME TO b", "DROP TABLE c"});
                                         }),
                 WarehouseStatementError);
    EXPECT_EQ(state().statements,
              (std::vector<std::string>{"BEGIN", "ALTER TABLE a RENAME TO b", "DROP TABLE c", "ROLLBACK"}));
    EXPECT_EQ(state().closed, 1);
}

TEST_F(GatewayTest, TableExists) {
    state().existing_tables.insert("public.present");
    gateway.with_connection(params, [&](WarehouseConnection& connection) {
        EXPECT_TRUE(gateway.table_exists(connection, "public.present"));
        EXPECT_FALSE(gateway.table_exists(connection, "public.absent"));
    });
    EXPECT_EQ(state().queries,
              (std::vector<std::string>{"SELECT 1 FROM public.present LIMIT 1",
                                        "SELECT 1 FROM public.absent LIMIT 1"}));
}

TEST_F(GatewayTest, TableExistsPropagatesOtherErrors) {
    state().fail_on("^SELECT 1 FROM public.locked");
    EXPECT_THROW(gateway.with_connection(params,
                                         [&](WarehouseConnection& connection) {
                                             return gateway.table_exists(connection, "public.locked");
                                         }),
                 WarehouseStatementError);
    EXPECT_EQ(state().closed, 1);
}

TEST_F(GatewayTest, ResolveSchema) {
    state().description = {
        ColumnDescription{"id", "bigint", -1, -1, false},
        ColumnDescription{"name", "character varying", 64},
        ColumnDescription{"amount", "numeric", 12, 2},
    };
    auto schema = gateway.with_connection(params, [&](WarehouseConnection& connection) {
        return gateway.resolve_schema(connection, "(select * from t)");
    });
    ASSERT_EQ(schema->num_fields(), 3);
    EXPECT_FALSE(schema->field(0)->nullable());
    EXPECT_TRUE(schema->field(0)->type()->Equals(arrow::int64()));
    EXPECT_EQ(max_length(*schema->field(1)), 64);
    EXPECT_TRUE(schema->field(2)->type()->Equals(arrow::decimal128(12, 2)));
    EXPECT_EQ(state().described, (std::vector<std::string>{"SELECT * FROM (select * from t) WHERE 1 = 0"}));
}

TEST_F(GatewayTest, ResolveSchemaRejectsUnknownTypes) {
    state().description = {ColumnDescription{"shape", "geometry"}};
    EXPECT_THROW(gateway.with_connection(params,
                                         [&](WarehouseConnection& connection) {
                                             return gateway.resolve_schema(connection, "t");
                                         }),
                 SchemaMappingError);
    EXPECT_EQ(state().closed, 1);
}

}  // namespace test
}  // namespace rsbridge
