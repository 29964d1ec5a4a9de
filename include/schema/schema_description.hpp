#pragma once

#include <optional>
#include <string>
#include <vector>

namespace schemagraph {

// ============================================================================
// Raw schema description, as handed over by the extraction tooling
//
// Nothing here is validated yet; SchemaModel::build() does that.
// ============================================================================

struct ColumnDescription {
    std::string name;
    std::string type;           // Vendor type as reported ("VARCHAR(100)")
    bool nullable = true;
    bool is_primary_key = false;
};

struct DeclaredForeignKey {
    std::string column;
    std::string references_table;
    std::string references_column;

    bool operator==(const DeclaredForeignKey&) const = default;
};

struct TableDescription {
    std::string name;
    std::vector<ColumnDescription> columns;
    std::optional<std::string> primary_key;
    std::vector<DeclaredForeignKey> foreign_keys;
};

struct SchemaDescription {
    std::string database;
    std::optional<std::string> database_type;   // "postgresql", "mysql", ...
    std::vector<TableDescription> tables;
};

} // namespace schemagraph
