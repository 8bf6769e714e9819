#ifndef RSBRIDGE_TESTS_TEST_BATCHES_HPP
#define RSBRIDGE_TESTS_TEST_BATCHES_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <arrow/api.h>

namespace rsbridge {
namespace test {

inline void check_ok(const arrow::Status& status) {
    if (!status.ok()) {
        throw std::runtime_error("Arrow error in test fixture: " + status.ToString());
    }
}

/**
 * id BIGINT NOT NULL, name TEXT, score DOUBLE, born DATE, seen TIMESTAMP
 */
inline std::shared_ptr<arrow::Schema> people_schema() {
    return arrow::schema({
        arrow::field("id", arrow::int64(), false),
        arrow::field("name", arrow::utf8()),
        arrow::field("score", arrow::float64()),
        arrow::field("born", arrow::date32()),
        arrow::field("seen", arrow::timestamp(arrow::TimeUnit::MICRO)),
    });
}

/**
 * Three rows: a complete one, one with every nullable column null, and one
 * whose name needs quoting.
 */
inline std::shared_ptr<arrow::RecordBatch> people_batch() {
    arrow::Int64Builder id_builder;
    arrow::StringBuilder name_builder;
    arrow::DoubleBuilder score_builder;
    arrow::Date32Builder born_builder;
    arrow::TimestampBuilder seen_builder(arrow::timestamp(arrow::TimeUnit::MICRO), arrow::default_memory_pool());

    check_ok(id_builder.AppendValues(std::vector<int64_t>{1, 2, 3}));

    check_ok(name_builder.Append("alice"));
    check_ok(name_builder.AppendNull());
    check_ok(name_builder.Append("bo\"b, jr"));

    check_ok(score_builder.Append(1.5));
    check_ok(score_builder.AppendNull());
    check_ok(score_builder.Append(-2.0));

    check_ok(born_builder.Append(0));
    check_ok(born_builder.AppendNull());
    check_ok(born_builder.Append(11016));

    check_ok(seen_builder.Append(1500000));
    check_ok(seen_builder.AppendNull());
    check_ok(seen_builder.Append(0));

    std::shared_ptr<arrow::Array> id_array;
    std::shared_ptr<arrow::Array> name_array;
    std::shared_ptr<arrow::Array> score_array;
    std::shared_ptr<arrow::Array> born_array;
    std::shared_ptr<arrow::Array> seen_array;
    check_ok(id_builder.Finish(&id_array));
    check_ok(name_builder.Finish(&name_array));
    check_ok(score_builder.Finish(&score_array));
    check_ok(born_builder.Finish(&born_array));
    check_ok(seen_builder.Finish(&seen_array));

    return arrow::RecordBatch::Make(people_schema(), 3,
                                    {id_array, name_array, score_array, born_array, seen_array});
}

/**
 * Single int32 column "testint" with the given values.
 */
inline std::shared_ptr<arrow::RecordBatch> int_batch(const std::vector<int32_t>& values,
                                                     const std::string& name = "testint") {
    arrow::Int32Builder builder;
    check_ok(builder.AppendValues(values));
    std::shared_ptr<arrow::Array> array;
    check_ok(builder.Finish(&array));
    return arrow::RecordBatch::Make(arrow::schema({arrow::field(name, arrow::int32())}),
                                    static_cast<int64_t>(values.size()), {array});
}

}  // namespace test
}  // namespace rsbridge

#endif  // RSBRIDGE_TESTS_TEST_BATCHES_HPP
