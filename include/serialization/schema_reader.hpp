#pragma once

#include "core/error.hpp"
#include "schema/schema_description.hpp"
#include <string>

namespace schemagraph {

/**
 * @brief Parse a schema description document
 *
 * Layout:
 *   { "database": "shop", "database_type": "postgresql",
 *     "tables": [ { "name": "orders",
 *                   "columns": [ {"name": "id", "type": "integer",
 *                                 "nullable": false, "is_primary_key": true} ],
 *                   "primary_key": "id",
 *                   "foreign_keys": [ {"column": "customer_id",
 *                                      "references_table": "customers",
 *                                      "references_column": "id"} ] } ] }
 *
 * "primary_key" on a column is accepted for "is_primary_key"; "nullable"
 * defaults to true. Only the document's shape is checked here (wrong JSON
 * types, unknown database_type); name and key invariants are
 * SchemaModel::build's job.
 *
 * @return Description, or INVALID_SCHEMA naming every shape problem found
 */
[[nodiscard]] Result<SchemaDescription> parse_schema_description(const std::string& json_text);

/** @brief read_text_file() + parse_schema_description() */
[[nodiscard]] Result<SchemaDescription> read_schema_file(const std::string& path);

} // namespace schemagraph
