#pragma once

#include "core/database_type.hpp"
#include "core/type_class.hpp"
#include "schema/schema_description.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace schemagraph {

class IDialect;

// ============================================================================
// Normalized schema types
// ============================================================================

struct ColumnInfo {
    std::string name;
    std::string declared_type;      // As reported, e.g. "VARCHAR(100)"
    TypeClass type_class = TypeClass::OTHER;
    bool nullable = true;
    bool is_primary_key = false;
};

struct TableInfo {
    std::string name;
    std::vector<ColumnInfo> columns;
    std::unordered_map<std::string, size_t> column_index; // name -> index
    std::optional<std::string> primary_key;                // Designated key column
    std::vector<DeclaredForeignKey> foreign_keys;

    const ColumnInfo* find_column(const std::string& col_name) const {
        auto it = column_index.find(col_name);
        if (it != column_index.end() && it->second < columns.size()) {
            return &columns[it->second];
        }
        return nullptr;
    }

    const ColumnInfo* primary_key_column() const {
        return primary_key ? find_column(*primary_key) : nullptr;
    }

    bool has_declared_foreign_key(const std::string& col_name) const;
};

/**
 * @brief Immutable, validated view of one extracted schema
 *
 * Built once per extraction request via build(); every accessor is const, so
 * a SchemaModel can be shared between concurrent readers freely.
 *
 * Invariants enforced by build():
 * - every table has a non-empty, unique name
 * - every column has a non-empty name, unique within its table, and a type
 * - a table-level primary key names an existing column
 * - a declared foreign key's source column exists in its table
 *
 * Primary key resolution: the table-level primary_key wins; otherwise the
 * first column flagged is_primary_key is the designated key.
 */
class SchemaModel {
public:
    using TableMap = std::map<std::string, TableInfo>;

    SchemaModel() = default;

    /**
     * @brief Validate a raw description and normalize its column types
     * @param description Raw schema as extracted
     * @param dialect Type vocabulary used to derive each column's TypeClass
     * @throws InvalidSchemaError listing every violated invariant
     */
    [[nodiscard]] static SchemaModel build(const SchemaDescription& description,
                                           const IDialect& dialect);

    [[nodiscard]] const std::string& database() const { return database_; }
    [[nodiscard]] DatabaseType database_type() const { return database_type_; }

    /** @brief All tables, ordered by name */
    [[nodiscard]] const TableMap& tables() const { return tables_; }

    /** @return Table, or nullptr if not part of this schema */
    [[nodiscard]] const TableInfo* find_table(const std::string& name) const;

    [[nodiscard]] bool has_table(const std::string& name) const {
        return find_table(name) != nullptr;
    }

    [[nodiscard]] size_t table_count() const { return tables_.size(); }
    [[nodiscard]] size_t column_count() const;
    [[nodiscard]] size_t declared_foreign_key_count() const;

private:
    std::string database_;
    DatabaseType database_type_ = DatabaseType::GENERIC;
    TableMap tables_;
};

} // namespace schemagraph
