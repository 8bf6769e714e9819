#ifndef RSBRIDGE_FILTERS_HPP
#define RSBRIDGE_FILTERS_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace rsbridge {

/** Calendar date as days since 1970-01-01. */
struct Date {
    int32_t days = 0;
};

/** Wall-clock timestamp as microseconds since 1970-01-01 00:00:00. */
struct Timestamp {
    int64_t micros = 0;
};

using Literal = std::variant<bool, int32_t, int64_t, float, double, std::string, Date, Timestamp>;

enum class FilterKind {
    EqualTo,
    NotEqualTo,
    GreaterThan,
    GreaterThanOrEqual,
    LessThan,
    LessThanOrEqual,
    IsNull,
    IsNotNull,
    In,
    And,
    Or,
    Not,
    StringStartsWith,
    StringEndsWith,
    StringContains
};

/**
 * Predicate handed to a scan by the engine.
 *
 * Leaf filters reference one column and carry their operand(s) in `values`;
 * And/Or carry two children, Not carries one. The engine re-applies every
 * filter after reading, so a filter the SQL generator cannot render is
 * simply not pushed down.
 */
struct Filter {
    FilterKind kind = FilterKind::EqualTo;
    std::string column;
    std::vector<Literal> values;
    std::vector<Filter> children;

    static Filter compare(FilterKind kind, std::string column, Literal value) {
        Filter f;
        f.kind = kind;
        f.column = std::move(column);
        f.values.push_back(std::move(value));
        return f;
    }

    static Filter equal_to(std::string column, Literal value) {
        return compare(FilterKind::EqualTo, std::move(column), std::move(value));
    }
    static Filter not_equal_to(std::string column, Literal value) {
        return compare(FilterKind::NotEqualTo, std::move(column), std::move(value));
    }
    static Filter greater_than(std::string column, Literal value) {
        return compare(FilterKind::GreaterThan, std::move(column), std::move(value));
    }
    static Filter greater_than_or_equal(std::string column, Literal value) {
        return compare(FilterKind::GreaterThanOrEqual, std::move(column), std::move(value));
    }
    static Filter less_than(std::string column, Literal value) {
        return compare(FilterKind::LessThan, std::move(column), std::move(value));
    }
    static Filter less_than_or_equal(std::string column, Literal value) {
        return compare(FilterKind::LessThanOrEqual, std::move(column), std::move(value));
    }

    static Filter is_null(std::string column) {
        Filter f;
        f.kind = FilterKind::IsNull;
        f.column = std::move(column);
        return f;
    }
    static Filter is_not_null(std::string column) {
        Filter f;
        f.kind = FilterKind::IsNotNull;
        f.column = std::move(column);
        return f;
    }

    static Filter in(std::string column, std::vector<Literal> values) {
        Filter f;
        f.kind = FilterKind::In;
        f.column = std::move(column);
        f.values = std::move(values);
        return f;
    }

    static Filter both(Filter left, Filter right) {
        Filter f;
        f.kind = FilterKind::And;
        f.children.push_back(std::move(left));
        f.children.push_back(std::move(right));
        return f;
    }
    static Filter either(Filter left, Filter right) {
        Filter f;
        f.kind = FilterKind::Or;
        f.children.push_back(std::move(left));
        f.children.push_back(std::move(right));
        return f;
    }
    static Filter negate(Filter child) {
        Filter f;
        f.kind = FilterKind::Not;
        f.children.push_back(std::move(child));
        return f;
    }

    static Filter starts_with(std::string column, std::string prefix) {
        return compare(FilterKind::StringStartsWith, std::move(column), std::move(prefix));
    }
    static Filter ends_with(std::string column, std::string suffix) {
        return compare(FilterKind::StringEndsWith, std::move(column), std::move(suffix));
    }
    static Filter contains(std::string column, std::string fragment) {
        return compare(FilterKind::StringContains, std::move(column), std::move(fragment));
    }
};

}  // namespace rsbridge

#endif  // RSBRIDGE_FILTERS_HPP
