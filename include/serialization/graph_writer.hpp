#pragma once

#include "graph/schema_graph.hpp"
#include <nlohmann/json.hpp>

namespace schemagraph {

/**
 * @brief Node-link JSON for graph renderers
 *
 *   { "directed": true, "multigraph": true, "graph": {},
 *     "nodes": [ {"id", "column_count", "primary_key", "placeholder"} ],
 *     "edges": [ {"source", "target", "source_column", "target_column",
 *                 "confidence", "basis"[, "dangling"]} ] }
 *
 * Nodes are ordered by id; edges keep the graph's order.
 */
[[nodiscard]] nlohmann::json graph_to_node_link_json(const SchemaGraph& graph);

} // namespace schemagraph
