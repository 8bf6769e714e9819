#include "rsbridge/parameters.hpp"
#include "rsbridge/errors.hpp"
#include "rsbridge/staging_path.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace rsbridge {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

// Defaults sit underneath whatever the user passes.
const std::map<std::string, std::string>& default_parameters() {
    static const std::map<std::string, std::string> defaults = {
        {"tempformat", "AVRO"},
        {"preactions", ""},
        {"postactions", ""},
        {"extracopyoptions", ""},
    };
    return defaults;
}

std::optional<std::string> lookup(const std::map<std::string, std::string>& values,
                                  const std::string& key) {
    auto it = values.find(key);
    if (it == values.end() || trim(it->second).empty()) {
        return std::nullopt;
    }
    return it->second;
}

bool parse_bool(const std::string& key, const std::string& value) {
    std::string lowered = to_lower(trim(value));
    if (lowered == "true") {
        return true;
    }
    if (lowered == "false") {
        return false;
    }
    throw ConfigurationError("Parameter '" + key + "' must be true or false, got: " + value);
}

int parse_positive_int(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(trim(value), &consumed);
        if (consumed != trim(value).size() || parsed <= 0) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigurationError("Parameter '" + key + "' must be a positive integer, got: " + value);
    }
}

std::vector<std::string> split_actions(const std::string& value) {
    std::vector<std::string> actions;
    std::istringstream stream(value);
    std::string action;
    while (std::getline(stream, action, ';')) {
        action = trim(action);
        if (!action.empty()) {
            actions.push_back(action);
        }
    }
    return actions;
}

}  // namespace

SaveMode parse_save_mode(const std::string& name) {
    std::string lowered = to_lower(trim(name));
    if (lowered == "append") return SaveMode::Append;
    if (lowered == "overwrite") return SaveMode::Overwrite;
    if (lowered == "errorifexists" || lowered == "error") return SaveMode::ErrorIfExists;
    if (lowered == "ignore") return SaveMode::Ignore;
    throw ConfigurationError("Unknown save mode: " + name);
}

const char* to_string(SaveMode mode) {
    switch (mode) {
        case SaveMode::Append:
            return "Append";
        case SaveMode::Overwrite:
            return "Overwrite";
        case SaveMode::ErrorIfExists:
            return "ErrorIfExists";
        case SaveMode::Ignore:
            return "Ignore";
    }
    return "Unknown";
}

TableName TableName::parse(const std::string& name) {
    std::string trimmed = trim(name);
    if (trimmed.empty()) {
        throw ConfigurationError("Table name must not be empty");
    }

    bool in_quotes = false;
    size_t split = std::string::npos;
    for (size_t i = 0; i < trimmed.size(); ++i) {
        if (trimmed[i] == '"') {
            in_quotes = !in_quotes;
        } else if (trimmed[i] == '.' && !in_quotes) {
            split = i;
        }
    }

    if (split == std::string::npos) {
        return TableName("", trimmed);
    }
    if (split == 0 || split + 1 == trimmed.size()) {
        throw ConfigurationError("Malformed table name: " + name);
    }
    return TableName(trimmed.substr(0, split), trimmed.substr(split + 1));
}

std::string TableName::to_string() const {
    return schema_.empty() ? table_ : schema_ + "." + table_;
}

TableName TableName::with_suffix(const std::string& suffix) const {
    // A quoted name keeps its quotes around the suffixed identifier.
    if (table_.size() >= 2 && table_.front() == '"' && table_.back() == '"') {
        return TableName(schema_, table_.substr(0, table_.size() - 1) + suffix + "\"");
    }
    return TableName(schema_, table_ + suffix);
}

std::string Credentials::to_clause() const {
    std::string clause = "aws_access_key_id=" + access_key_id +
                         ";aws_secret_access_key=" + secret_access_key;
    if (!session_token.empty()) {
        clause += ";token=" + session_token;
    }
    return clause;
}

Parameters Parameters::merge(const std::map<std::string, std::string>& user_parameters) {
    Parameters params;

    params.values_ = default_parameters();
    for (const auto& [key, value] : user_parameters) {
        params.values_[to_lower(key)] = value;
    }
    const auto& values = params.values_;

    auto temp_root = lookup(values, "tempdir");
    if (!temp_root) {
        throw ConfigurationError("Parameter 'tempdir' is required for staging data in object storage");
    }
    auto url = lookup(values, "url");
    if (!url) {
        throw ConfigurationError("Parameter 'url' is required (JDBC-style URL of the warehouse)");
    }

    auto table = lookup(values, "dbtable");
    auto query = lookup(values, "query");
    if (table && query) {
        throw ConfigurationError("Parameters 'dbtable' and 'query' are mutually exclusive; set only one");
    }
    if (!table && !query) {
        throw ConfigurationError("Either parameter 'dbtable' or parameter 'query' is required");
    }

    check_streaming_scheme(*temp_root);

    params.url_ = trim(*url);
    params.temp_root_ = as_directory(trim(*temp_root));
    if (table) {
        std::string name = trim(*table);
        // A parenthesized dbtable is a subquery, not a table.
        if (name.front() == '(' && name.back() == ')') {
            params.query_ = trim(name.substr(1, name.size() - 2));
        } else {
            params.table_ = TableName::parse(name);
        }
    } else {
        params.query_ = trim(*query);
    }

    if (auto staging = lookup(values, "usestagingtable")) {
        params.use_staging_table_ = parse_bool("usestagingtable", *staging);
    }

    if (auto style = lookup(values, "diststyle")) {
        std::string upper = to_upper(trim(*style));
        if (upper != "EVEN" && upper != "KEY" && upper != "ALL" && upper != "AUTO") {
            throw ConfigurationError("Parameter 'diststyle' must be one of EVEN, KEY, ALL, AUTO, got: " + *style);
        }
        params.dist_style_ = upper;
    }
    if (auto key = lookup(values, "distkey")) {
        if (params.dist_style_ && *params.dist_style_ != "KEY") {
            throw ConfigurationError("Parameter 'distkey' requires diststyle KEY, got: " + *params.dist_style_);
        }
        params.dist_key_ = trim(*key);
    }
    if (auto spec = lookup(values, "sortkeyspec")) {
        params.sort_key_spec_ = trim(*spec);
    }

    params.pre_actions_ = split_actions(values.at("preactions"));
    params.post_actions_ = split_actions(values.at("postactions"));
    params.extra_copy_options_ = trim(values.at("extracopyoptions"));

    std::string format = to_upper(trim(values.at("tempformat")));
    if (format == "AVRO") {
        params.temp_format_ = TempFormat::Avro;
    } else if (format == "CSV") {
        params.temp_format_ = TempFormat::Csv;
    } else {
        throw ConfigurationError("Parameter 'tempformat' must be AVRO or CSV, got: " + values.at("tempformat"));
    }

    if (auto timeout = lookup(values, "querytimeout")) {
        params.query_timeout_seconds_ = parse_positive_int("querytimeout", *timeout);
    }
    if (auto days = lookup(values, "tempdirexpirationdays")) {
        params.temp_dir_expiration_days_ = parse_positive_int("tempdirexpirationdays", *days);
    }

    auto access_key = lookup(values, "aws_access_key_id");
    auto secret_key = lookup(values, "aws_secret_access_key");
    if (access_key && secret_key) {
        params.credentials_.access_key_id = trim(*access_key);
        params.credentials_.secret_access_key = trim(*secret_key);
        if (auto token = lookup(values, "temporary_aws_session_token")) {
            params.credentials_.session_token = trim(*token);
        }
    } else if (access_key || secret_key) {
        throw ConfigurationError(
            "Parameters 'aws_access_key_id' and 'aws_secret_access_key' must be set together");
    } else if (auto from_uri = credentials_from_uri(params.temp_root_)) {
        params.credentials_ = *from_uri;
    } else {
        throw ConfigurationError(
            "No credentials for 'tempdir': set 'aws_access_key_id' and 'aws_secret_access_key' "
            "or embed them in the tempdir URI");
    }

    return params;
}

std::string Parameters::source_expression() const {
    if (table_) {
        return table_->to_string();
    }
    return "(" + *query_ + ")";
}

const TableName& Parameters::require_table() const {
    if (!table_) {
        throw ConfigurationError(
            "Writes need a target table: set 'dbtable' (the 'query' parameter is only valid for reads)");
    }
    return *table_;
}

}  // namespace rsbridge
