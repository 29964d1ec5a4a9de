#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace schemagraph {

struct GraphNode {
    std::string id;                         // Table name
    size_t column_count = 0;
    std::optional<std::string> primary_key;
    bool placeholder = false;               // Endpoint not present in the schema

    bool operator==(const GraphNode&) const = default;
};

struct GraphEdge {
    std::string source;                     // Source table
    std::string target;                     // Target table
    std::string source_column;
    std::string target_column;
    double confidence = 0.0;
    Basis basis = Basis::PATTERN_MATCH;
    bool dangling = false;

    [[nodiscard]] bool is_self_loop() const { return source == target; }

    bool operator==(const GraphEdge&) const = default;
};

// (source table, source column, target table, target column)
using EdgeKey = std::tuple<std::string, std::string, std::string, std::string>;

[[nodiscard]] inline EdgeKey edge_key(const GraphEdge& e) {
    return {e.source, e.source_column, e.target, e.target_column};
}

/**
 * @brief Directed multigraph of tables (nodes) and relationships (edges)
 *
 * Read-only once returned by SchemaGraphBuilder; at most one edge per
 * EdgeKey. Edges keep insertion order, which the builder makes match the
 * relationship map's order.
 */
class SchemaGraph {
public:
    using NodeMap = std::map<std::string, GraphNode>;

    SchemaGraph() = default;

    [[nodiscard]] const NodeMap& nodes() const { return nodes_; }
    [[nodiscard]] const std::vector<GraphEdge>& edges() const { return edges_; }

    [[nodiscard]] size_t node_count() const { return nodes_.size(); }
    [[nodiscard]] size_t edge_count() const { return edges_.size(); }

    [[nodiscard]] const GraphNode* find_node(const std::string& id) const;
    [[nodiscard]] const GraphEdge* find_edge(const std::string& source, const std::string& source_column,
                                             const std::string& target, const std::string& target_column) const;

    /** @brief Edges leaving @p table (its foreign keys) */
    [[nodiscard]] std::vector<const GraphEdge*> outgoing(const std::string& table) const;

    /** @brief Edges arriving at @p table (references to it) */
    [[nodiscard]] std::vector<const GraphEdge*> incoming(const std::string& table) const;

    /**
     * @brief Directed cycle detection
     * @param include_self_loops When false, hierarchical self-references do
     *        not count as cycles
     */
    [[nodiscard]] bool has_cycle(bool include_self_loops = false) const;

private:
    friend class SchemaGraphBuilder;

    NodeMap nodes_;
    std::vector<GraphEdge> edges_;
    std::map<EdgeKey, size_t> edge_index_;  // key -> position in edges_
};

} // namespace schemagraph
