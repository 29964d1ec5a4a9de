#include "serialization/schema_reader.hpp"
#include "serialization/file_io.hpp"
#include "core/database_type.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace schemagraph {

namespace {

// ============================================================================
// JSON helpers
// ============================================================================

[[nodiscard]] inline bool has_key(const json& node, const std::string& key) {
    return node.is_object() && node.contains(key) && !node[key].is_null();
}

/**
 * @brief String member, empty when absent. A present non-string member is
 *        recorded as a problem.
 */
std::string get_string(const json& node, const std::string& key,
                       const std::string& where, std::vector<std::string>& problems) {
    if (!has_key(node, key)) {
        return "";
    }
    const auto& value = node[key];
    if (!value.is_string()) {
        problems.push_back(std::format("{}: '{}' must be a string", where, key));
        return "";
    }
    return value.get<std::string>();
}

bool get_bool(const json& node, const std::string& key, bool default_value,
              const std::string& where, std::vector<std::string>& problems) {
    if (!has_key(node, key)) {
        return default_value;
    }
    const auto& value = node[key];
    if (!value.is_boolean()) {
        problems.push_back(std::format("{}: '{}' must be a boolean", where, key));
        return default_value;
    }
    return value.get<bool>();
}

/** @brief Array member, or nullptr (absent, or recorded as a problem) */
const json* get_array(const json& node, const std::string& key,
                      const std::string& where, std::vector<std::string>& problems) {
    if (!has_key(node, key)) {
        return nullptr;
    }
    const auto& value = node[key];
    if (!value.is_array()) {
        problems.push_back(std::format("{}: '{}' must be an array", where, key));
        return nullptr;
    }
    return &value;
}

// ============================================================================
// Sections
// ============================================================================

ColumnDescription parse_column(const json& node, const std::string& where,
                               std::vector<std::string>& problems) {
    ColumnDescription col;
    if (!node.is_object()) {
        problems.push_back(std::format("{} must be an object", where));
        return col;
    }
    col.name = get_string(node, "name", where, problems);
    col.type = get_string(node, "type", where, problems);
    col.nullable = get_bool(node, "nullable", true, where, problems);

    const char* pk_key = has_key(node, "is_primary_key") ? "is_primary_key" : "primary_key";
    col.is_primary_key = get_bool(node, pk_key, false, where, problems);
    return col;
}

DeclaredForeignKey parse_foreign_key(const json& node, const std::string& where,
                                     std::vector<std::string>& problems) {
    DeclaredForeignKey fk;
    if (!node.is_object()) {
        problems.push_back(std::format("{} must be an object", where));
        return fk;
    }
    fk.column = get_string(node, "column", where, problems);
    fk.references_table = get_string(node, "references_table", where, problems);
    fk.references_column = get_string(node, "references_column", where, problems);
    return fk;
}

TableDescription parse_table(const json& node, const std::string& where,
                             std::vector<std::string>& problems) {
    TableDescription table;
    if (!node.is_object()) {
        problems.push_back(std::format("{} must be an object", where));
        return table;
    }
    table.name = get_string(node, "name", where, problems);

    const std::string label = table.name.empty() ? where : std::format("table '{}'", table.name);

    if (const json* columns = get_array(node, "columns", label, problems)) {
        table.columns.reserve(columns->size());
        for (size_t i = 0; i < columns->size(); ++i) {
            table.columns.push_back(parse_column((*columns)[i],
                std::format("{}: columns[{}]", label, i), problems));
        }
    }

    if (has_key(node, "primary_key")) {
        auto pk = get_string(node, "primary_key", label, problems);
        if (!pk.empty()) {
            table.primary_key = std::move(pk);
        }
    }

    if (const json* fks = get_array(node, "foreign_keys", label, problems)) {
        table.foreign_keys.reserve(fks->size());
        for (size_t i = 0; i < fks->size(); ++i) {
            table.foreign_keys.push_back(parse_foreign_key((*fks)[i],
                std::format("{}: foreign_keys[{}]", label, i), problems));
        }
    }

    return table;
}

std::string join_problems(const std::vector<std::string>& problems) {
    std::string joined;
    for (const auto& p : problems) {
        if (!joined.empty()) joined += "; ";
        joined += p;
    }
    return joined;
}

} // anonymous namespace

Result<SchemaDescription> parse_schema_description(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return Result<SchemaDescription>::error(ErrorCategory::INVALID_SCHEMA,
            std::format("malformed schema document: {}", e.what()));
    }

    if (!root.is_object()) {
        return Result<SchemaDescription>::error(ErrorCategory::INVALID_SCHEMA,
            "schema document must be a JSON object");
    }

    std::vector<std::string> problems;
    SchemaDescription schema;
    schema.database = get_string(root, "database", "schema", problems);

    if (has_key(root, "database_type")) {
        auto type_name = get_string(root, "database_type", "schema", problems);
        if (!type_name.empty()) {
            try {
                (void)parse_database_type(type_name);
                schema.database_type = std::move(type_name);
            } catch (const std::runtime_error& e) {
                problems.push_back(std::format("schema: {}", e.what()));
            }
        }
    }

    if (!has_key(root, "tables")) {
        problems.emplace_back("schema: missing 'tables' array");
    } else if (const json* tables = get_array(root, "tables", "schema", problems)) {
        schema.tables.reserve(tables->size());
        for (size_t i = 0; i < tables->size(); ++i) {
            schema.tables.push_back(parse_table((*tables)[i], std::format("tables[{}]", i), problems));
        }
    }

    if (!problems.empty()) {
        return Result<SchemaDescription>::error(ErrorCategory::INVALID_SCHEMA, join_problems(problems));
    }
    return Result<SchemaDescription>::ok(std::move(schema));
}

Result<SchemaDescription> read_schema_file(const std::string& path) {
    auto content = io::read_text_file(path);
    if (content.is_error()) {
        return Result<SchemaDescription>::error(content.error_category(), content.error_message());
    }
    return parse_schema_description(content.value());
}

} // namespace schemagraph
