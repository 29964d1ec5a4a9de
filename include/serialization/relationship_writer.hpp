#pragma once

#include "core/types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace schemagraph {

/**
 * @brief Relationship map as YAML, keyed by table name:
 *
 *   orders:
 *     primary_key: order_id
 *     foreign_keys:
 *       - column: customer_id
 *         references: "customers.customer_id"
 *         confidence: 0.98
 *
 * Confidence is rounded to two decimals; a missing primary key is ~ (null).
 */
[[nodiscard]] std::string relationships_to_yaml(const RelationshipMap& relationships);

/**
 * @brief Same document as JSON, with "basis" on every foreign key and
 *        "dangling": true on dangling declared ones
 */
[[nodiscard]] nlohmann::json relationships_to_json(const RelationshipMap& relationships);

} // namespace schemagraph
