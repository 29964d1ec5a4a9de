#pragma once

#include "core/types.hpp"
#include "dialect/dialect_registry.hpp"
#include "schema/schema_description.hpp"
#include "schema/schema_model.hpp"

#include <string>
#include <vector>

namespace schemagraph::fixtures {

inline ColumnDescription column(std::string name, std::string type, bool is_pk = false) {
    ColumnDescription c;
    c.name = std::move(name);
    c.type = std::move(type);
    c.nullable = !is_pk;
    c.is_primary_key = is_pk;
    return c;
}

inline DeclaredForeignKey foreign_key(std::string col, std::string table, std::string target_col) {
    return DeclaredForeignKey{std::move(col), std::move(table), std::move(target_col)};
}

inline TableDescription table(std::string name,
                              std::vector<ColumnDescription> columns,
                              std::vector<DeclaredForeignKey> fks = {}) {
    TableDescription t;
    t.name = std::move(name);
    t.columns = std::move(columns);
    t.foreign_keys = std::move(fks);
    return t;
}

inline SchemaDescription description(std::vector<TableDescription> tables,
                                     std::string database = "testdb") {
    SchemaDescription d;
    d.database = std::move(database);
    d.tables = std::move(tables);
    return d;
}

inline SchemaModel make_schema(std::vector<TableDescription> tables,
                               DatabaseType type = DatabaseType::POSTGRESQL) {
    const auto registry = DialectRegistry::with_builtin_dialects();
    const auto dialect = registry.create(type);
    return SchemaModel::build(description(std::move(tables)), *dialect);
}

/**
 * customers(customer_id PK), orders(order_id PK, customer_id),
 * products(product_id PK), order_items(item_id PK, order_id, product_id)
 */
inline std::vector<TableDescription> shop_tables() {
    return {
        table("customers", {column("customer_id", "integer", true), column("email", "varchar(255)")}),
        table("orders", {column("order_id", "integer", true), column("customer_id", "integer")}),
        table("products", {column("product_id", "integer", true), column("title", "text")}),
        table("order_items", {column("item_id", "integer", true),
                              column("order_id", "integer"),
                              column("product_id", "integer")}),
    };
}

inline const Relationship* find_fk(const RelationshipMap& map,
                                   const std::string& table_name,
                                   const std::string& column_name) {
    const auto it = map.find(table_name);
    if (it == map.end()) return nullptr;
    for (const auto& rel : it->second.foreign_keys) {
        if (rel.source_column == column_name) return &rel;
    }
    return nullptr;
}

inline size_t total_fk_count(const RelationshipMap& map) {
    size_t n = 0;
    for (const auto& [name, entry] : map) n += entry.foreign_keys.size();
    return n;
}

} // namespace schemagraph::fixtures
