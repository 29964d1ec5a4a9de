#pragma once

#include "core/types.hpp"
#include "graph/schema_graph.hpp"
#include "schema/schema_model.hpp"

namespace schemagraph {

/**
 * @brief Turns a SchemaModel plus relationship map into a SchemaGraph
 *
 * Rules:
 * - one node per table; an edge endpoint missing from the schema gets a
 *   placeholder node
 * - one edge per EdgeKey: a declared relationship replaces an inferred one,
 *   otherwise the higher confidence wins (first seen on a tie)
 * - declared edges always carry confidence 1.0
 * - self edges survive only when DECLARED or HIERARCHICAL
 *
 * Stateless: build() works on a local graph and returns it only once
 * complete, so nothing carries over between calls.
 */
class SchemaGraphBuilder {
public:
    [[nodiscard]] SchemaGraph build(const SchemaModel& schema,
                                    const RelationshipMap& relationships) const;

private:
    static void add_edge(SchemaGraph& graph, GraphEdge edge);
    static void ensure_node(SchemaGraph& graph, const std::string& table);
};

/** @brief SchemaGraphBuilder{}.build(schema, relationships) */
[[nodiscard]] SchemaGraph build_schema_graph(const SchemaModel& schema,
                                             const RelationshipMap& relationships);

} // namespace schemagraph
