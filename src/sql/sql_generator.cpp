#include "rsbridge/sql_generator.hpp"
#include "rsbridge/errors.hpp"
#include "rsbridge/type_mapper.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <regex>
#include <sstream>
#include <unordered_map>

#include <arrow/type.h>

namespace rsbridge {
namespace sql {

namespace {

template <typename T>
std::optional<std::string> render_floating(T value) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        return std::nullopt;
    }
    std::string text(buffer, end);
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

struct LiteralRenderer {
    std::optional<std::string> operator()(bool value) const { return value ? "true" : "false"; }
    std::optional<std::string> operator()(int32_t value) const { return std::to_string(value); }
    std::optional<std::string> operator()(int64_t value) const { return std::to_string(value); }
    std::optional<std::string> operator()(float value) const { return render_floating(value); }
    std::optional<std::string> operator()(double value) const { return render_floating(value); }
    std::optional<std::string> operator()(const std::string& value) const {
        return quote_string_literal(value);
    }
    std::optional<std::string> operator()(const Date& value) const {
        return quote_string_literal(format_date(value.days));
    }
    std::optional<std::string> operator()(const Timestamp& value) const {
        return quote_string_literal(format_timestamp(value.micros));
    }
};

const char* comparison_operator(FilterKind kind) {
    switch (kind) {
        case FilterKind::EqualTo:
            return "=";
        case FilterKind::NotEqualTo:
            return "!=";
        case FilterKind::GreaterThan:
            return ">";
        case FilterKind::GreaterThanOrEqual:
            return ">=";
        case FilterKind::LessThan:
            return "<";
        case FilterKind::LessThanOrEqual:
            return "<=";
        default:
            return nullptr;
    }
}

// LIKE patterns are only pushed down when the operand has no wildcard or
// escape characters of its own.
std::optional<std::string> render_like(const Filter& filter, const char* before, const char* after) {
    if (filter.values.size() != 1) {
        return std::nullopt;
    }
    const auto* text = std::get_if<std::string>(&filter.values.front());
    if (!text || text->find_first_of("%_\\") != std::string::npos) {
        return std::nullopt;
    }
    return quote_identifier(filter.column) + " LIKE " +
           quote_string_literal(std::string(before) + *text + after);
}

std::string lower(const std::string& value) {
    std::string result = value;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // namespace

std::string quote_identifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted += c;
        }
    }
    quoted += '"';
    return quoted;
}

std::string quote_string_literal(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string escape_for_unload(const std::string& sql) {
    std::string escaped;
    escaped.reserve(sql.size() + 16);
    for (char c : sql) {
        if (c == '\\') {
            escaped += "\\\\";
        } else if (c == '\'') {
            escaped += "\\'";
        } else {
            escaped += c;
        }
    }
    return escaped;
}

std::optional<std::string> render_literal(const Literal& literal) {
    return std::visit(LiteralRenderer{}, literal);
}

std::optional<std::string> build_filter_expression(const Filter& filter) {
    switch (filter.kind) {
        case FilterKind::EqualTo:
        case FilterKind::NotEqualTo:
        case FilterKind::GreaterThan:
        case FilterKind::GreaterThanOrEqual:
        case FilterKind::LessThan:
        case FilterKind::LessThanOrEqual: {
            if (filter.values.size() != 1) {
                return std::nullopt;
            }
            auto value = render_literal(filter.values.front());
            if (!value) {
                return std::nullopt;
            }
            return quote_identifier(filter.column) + " " + comparison_operator(filter.kind) + " " + *value;
        }
        case FilterKind::IsNull:
            return quote_identifier(filter.column) + " IS NULL";
        case FilterKind::IsNotNull:
            return quote_identifier(filter.column) + " IS NOT NULL";
        case FilterKind::In: {
            if (filter.values.empty()) {
                return std::nullopt;
            }
            std::string list;
            for (const auto& literal : filter.values) {
                auto value = render_literal(literal);
                if (!value) {
                    return std::nullopt;
                }
                if (!list.empty()) {
                    list += ", ";
                }
                list += *value;
            }
            return quote_identifier(filter.column) + " IN (" + list + ")";
        }
        case FilterKind::And:
        case FilterKind::Or: {
            if (filter.children.size() != 2) {
                return std::nullopt;
            }
            auto left = build_filter_expression(filter.children[0]);
            auto right = build_filter_expression(filter.children[1]);
            if (!left || !right) {
                return std::nullopt;
            }
            const char* op = filter.kind == FilterKind::And ? " AND " : " OR ";
            return "(" + *left + op + *right + ")";
        }
        case FilterKind::Not: {
            if (filter.children.size() != 1) {
                return std::nullopt;
            }
            auto child = build_filter_expression(filter.children[0]);
            if (!child) {
                return std::nullopt;
            }
            return "(NOT " + *child + ")";
        }
        case FilterKind::StringStartsWith:
            return render_like(filter, "", "%");
        case FilterKind::StringEndsWith:
            return render_like(filter, "%", "");
        case FilterKind::StringContains:
            return render_like(filter, "%", "%");
    }
    return std::nullopt;
}

std::string build_where_clause(const std::vector<Filter>& filters) {
    std::string clause;
    for (const auto& filter : filters) {
        auto expression = build_filter_expression(filter);
        if (!expression) {
            continue;
        }
        clause += clause.empty() ? "WHERE " : " AND ";
        clause += *expression;
    }
    return clause;
}

std::string unload_query(const std::string& source_expr,
                         const std::vector<std::string>& columns,
                         const std::vector<Filter>& filters,
                         const Credentials& credentials,
                         const std::string& destination) {
    std::string column_list;
    for (const auto& column : columns) {
        if (!column_list.empty()) {
            column_list += ", ";
        }
        column_list += quote_identifier(column);
    }
    if (column_list.empty()) {
        column_list = "1";
    }

    std::string select = "SELECT " + column_list + " FROM " + source_expr + " " +
                         build_where_clause(filters);

    return "UNLOAD ('" + escape_for_unload(select) + "') TO " + quote_string_literal(destination) +
           " WITH CREDENTIALS " + quote_string_literal(credentials.to_clause()) +
           " ESCAPE NULL AS " + quote_string_literal(kNullMarker);
}

void check_no_ambiguous_columns(const arrow::Schema& schema) {
    std::unordered_map<std::string, std::string> seen;
    for (const auto& field : schema.fields()) {
        auto [it, inserted] = seen.emplace(lower(field->name()), field->name());
        if (!inserted) {
            throw ConfigurationError(
                "Columns '" + it->second + "' and '" + field->name() +
                "' are ambiguous: the warehouse treats column names case-insensitively");
        }
    }
}

std::string schema_to_column_definitions(const arrow::Schema& schema) {
    std::string definitions;
    for (const auto& field : schema.fields()) {
        if (!definitions.empty()) {
            definitions += ", ";
        }
        definitions += quote_identifier(field->name()) + " " + to_warehouse_type(*field);
        if (!field->nullable()) {
            definitions += " NOT NULL";
        }
    }
    return definitions;
}

std::string create_table_sql(const arrow::Schema& schema,
                             const std::string& table,
                             const std::optional<std::string>& dist_style,
                             const std::optional<std::string>& dist_key,
                             const std::optional<std::string>& sort_key_spec) {
    check_no_ambiguous_columns(schema);

    std::string sql = "CREATE TABLE IF NOT EXISTS " + table + " (" +
                      schema_to_column_definitions(schema) + ")";
    if (dist_style) {
        sql += " DISTSTYLE " + *dist_style;
    }
    if (dist_key) {
        sql += " DISTKEY (" + quote_identifier(*dist_key) + ")";
    }
    if (sort_key_spec) {
        sql += " " + *sort_key_spec;
    }
    return sql;
}

std::string copy_query(const std::string& table,
                       const std::string& source_uri,
                       const Credentials& credentials,
                       TempFormat format,
                       const std::string& extra_copy_options) {
    std::string sql = "COPY " + table + " FROM " + quote_string_literal(source_uri) +
                      " CREDENTIALS " + quote_string_literal(credentials.to_clause());
    switch (format) {
        case TempFormat::Avro:
            sql += " FORMAT AS AVRO 'auto'";
            break;
        case TempFormat::Csv:
            sql += " FORMAT AS CSV NULL AS " + quote_string_literal(kNullMarker);
            break;
    }
    sql += " DATEFORMAT 'YYYY-MM-DD' TIMEFORMAT 'YYYY-MM-DD HH:MI:SS'";
    if (!extra_copy_options.empty()) {
        sql += " " + extra_copy_options;
    }
    return sql;
}

std::string drop_table_sql(const std::string& table) {
    return "DROP TABLE IF EXISTS " + table;
}

std::string rename_table_sql(const TableName& from, const TableName& to) {
    return "ALTER TABLE " + from.to_string() + " RENAME TO " + to.unqualified();
}

std::vector<std::string> swap_statements(const TableName& target,
                                         const TableName& staging,
                                         const std::string& backup_suffix) {
    TableName backup = target.with_suffix("_backup_" + backup_suffix);
    return {
        rename_table_sql(target, backup),
        rename_table_sql(staging, target),
        "DROP TABLE " + backup.to_string(),
    };
}

std::string transaction_sql(const TableName& target,
                            const TableName& staging,
                            const std::string& backup_suffix) {
    return as_transaction_block(swap_statements(target, staging, backup_suffix));
}

std::vector<std::string> append_statements(const TableName& target, const TableName& staging) {
    return {"INSERT INTO " + target.to_string() + " SELECT * FROM " + staging.to_string()};
}

std::string append_transaction_sql(const TableName& target, const TableName& staging) {
    return as_transaction_block(append_statements(target, staging));
}

std::string as_transaction_block(const std::vector<std::string>& statements) {
    std::string block = "BEGIN;\n";
    for (const auto& statement : statements) {
        block += statement + ";\n";
    }
    block += "END;";
    return block;
}

std::string table_exists_query(const std::string& table) {
    return "SELECT 1 FROM " + table + " LIMIT 1";
}

std::string describe_query(const std::string& source_expr) {
    return "SELECT * FROM " + source_expr + " WHERE 1 = 0";
}

std::string load_errors_query() {
    return "SELECT TRIM(filename), line_number, TRIM(colname), TRIM(type), "
           "TRIM(raw_field_value), TRIM(err_reason) "
           "FROM stl_load_errors WHERE query = pg_last_copy_id() "
           "ORDER BY starttime DESC";
}

std::vector<std::string> expand_actions(const std::vector<std::string>& templates,
                                        const std::string& table) {
    std::vector<std::string> actions;
    actions.reserve(templates.size());
    for (const auto& action : templates) {
        std::string expanded;
        size_t pos = 0;
        while (true) {
            auto next = action.find("%s", pos);
            if (next == std::string::npos) {
                expanded += action.substr(pos);
                break;
            }
            expanded += action.substr(pos, next - pos) + table;
            pos = next + 2;
        }
        actions.push_back(expanded);
    }
    return actions;
}

std::string redact_credentials(const std::string& sql) {
    static const std::regex secrets(
        "(aws_access_key_id=|aws_secret_access_key=|token=)[^;'\\\\]*");
    return std::regex_replace(sql, secrets, "$1***");
}

}  // namespace sql
}  // namespace rsbridge
