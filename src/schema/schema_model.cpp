#include "schema/schema_model.hpp"
#include "dialect/idialect.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>
#include <numeric>

namespace schemagraph {

bool TableInfo::has_declared_foreign_key(const std::string& col_name) const {
    return std::any_of(foreign_keys.begin(), foreign_keys.end(),
        [&col_name](const DeclaredForeignKey& fk) { return fk.column == col_name; });
}

// ============================================================================
// Construction
// ============================================================================

namespace {

/**
 * @brief Normalize one table, appending a message to @p problems for every
 *        invariant it breaks. Always returns a (possibly partial) table.
 */
TableInfo build_table(const TableDescription& desc, const IDialect& dialect,
                      std::vector<std::string>& problems) {
    TableInfo table;
    table.name = desc.name;
    table.columns.reserve(desc.columns.size());

    for (size_t i = 0; i < desc.columns.size(); ++i) {
        const auto& col_desc = desc.columns[i];

        if (col_desc.name.empty()) {
            problems.push_back(std::format("table '{}': columns[{}] is missing a name", desc.name, i));
            continue;
        }
        if (col_desc.type.empty()) {
            problems.push_back(std::format("table '{}': column '{}' is missing a type",
                desc.name, col_desc.name));
            continue;
        }

        const auto [it, inserted] = table.column_index.try_emplace(col_desc.name, table.columns.size());
        if (!inserted) {
            problems.push_back(std::format("table '{}': duplicate column name '{}'",
                desc.name, col_desc.name));
            continue;
        }

        ColumnInfo col;
        col.name = col_desc.name;
        col.declared_type = col_desc.type;
        col.type_class = dialect.classify(col_desc.type);
        col.nullable = col_desc.nullable;
        col.is_primary_key = col_desc.is_primary_key;
        table.columns.emplace_back(std::move(col));
    }

    // Designated primary key: explicit table-level key first, then the first
    // flagged column
    if (desc.primary_key && !desc.primary_key->empty()) {
        const auto it = table.column_index.find(*desc.primary_key);
        if (it == table.column_index.end()) {
            problems.push_back(std::format("table '{}': primary key '{}' is not a column",
                desc.name, *desc.primary_key));
        } else {
            table.columns[it->second].is_primary_key = true;
            table.primary_key = *desc.primary_key;
        }
    } else {
        const auto pk = std::find_if(table.columns.begin(), table.columns.end(),
            [](const ColumnInfo& c) { return c.is_primary_key; });
        if (pk != table.columns.end()) {
            table.primary_key = pk->name;
        }
    }

    table.foreign_keys.reserve(desc.foreign_keys.size());
    for (size_t i = 0; i < desc.foreign_keys.size(); ++i) {
        const auto& fk = desc.foreign_keys[i];
        if (fk.column.empty() || fk.references_table.empty() || fk.references_column.empty()) {
            problems.push_back(std::format("table '{}': foreign_keys[{}] is incomplete", desc.name, i));
            continue;
        }
        if (!table.column_index.contains(fk.column)) {
            problems.push_back(std::format("table '{}': foreign key column '{}' is not a column",
                desc.name, fk.column));
            continue;
        }
        // Declared keys form a set; a repeated entry adds nothing
        if (std::find(table.foreign_keys.begin(), table.foreign_keys.end(), fk) != table.foreign_keys.end()) {
            continue;
        }
        table.foreign_keys.push_back(fk);
    }

    return table;
}

} // anonymous namespace

SchemaModel SchemaModel::build(const SchemaDescription& description, const IDialect& dialect) {
    SchemaModel model;
    model.database_ = description.database;
    model.database_type_ = dialect.type();

    std::vector<std::string> problems;

    for (size_t i = 0; i < description.tables.size(); ++i) {
        const auto& table_desc = description.tables[i];

        if (table_desc.name.empty()) {
            problems.push_back(std::format("tables[{}] is missing a name", i));
            continue;
        }
        if (model.tables_.contains(table_desc.name)) {
            problems.push_back(std::format("duplicate table name '{}'", table_desc.name));
            continue;
        }

        model.tables_.emplace(table_desc.name, build_table(table_desc, dialect, problems));
    }

    if (!problems.empty()) {
        throw InvalidSchemaError(std::move(problems));
    }

    return model;
}

// ============================================================================
// Queries
// ============================================================================

const TableInfo* SchemaModel::find_table(const std::string& name) const {
    const auto it = tables_.find(name);
    return it != tables_.end() ? &it->second : nullptr;
}

size_t SchemaModel::column_count() const {
    return std::accumulate(tables_.begin(), tables_.end(), size_t{0},
        [](size_t sum, const auto& entry) { return sum + entry.second.columns.size(); });
}

size_t SchemaModel::declared_foreign_key_count() const {
    return std::accumulate(tables_.begin(), tables_.end(), size_t{0},
        [](size_t sum, const auto& entry) { return sum + entry.second.foreign_keys.size(); });
}

} // namespace schemagraph
