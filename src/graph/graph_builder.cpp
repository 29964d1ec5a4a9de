#include "graph/graph_builder.hpp"

namespace schemagraph {

namespace {

bool keeps_self_edge(Basis basis) {
    switch (basis) {
        case Basis::DECLARED:
        case Basis::HIERARCHICAL:
            return true;
        case Basis::EXACT_MATCH:
        case Basis::PATTERN_MATCH:
            return false;
    }
    return false;
}

} // anonymous namespace

void SchemaGraphBuilder::ensure_node(SchemaGraph& graph, const std::string& table) {
    if (graph.nodes_.contains(table)) {
        return;
    }
    GraphNode node;
    node.id = table;
    node.placeholder = true;
    graph.nodes_.emplace(table, std::move(node));
}

void SchemaGraphBuilder::add_edge(SchemaGraph& graph, GraphEdge edge) {
    const EdgeKey key = edge_key(edge);
    const auto it = graph.edge_index_.find(key);
    if (it == graph.edge_index_.end()) {
        graph.edge_index_.emplace(key, graph.edges_.size());
        graph.edges_.push_back(std::move(edge));
        return;
    }

    GraphEdge& existing = graph.edges_[it->second];
    if (existing.basis == Basis::DECLARED) {
        return;
    }
    if (edge.basis == Basis::DECLARED || edge.confidence > existing.confidence) {
        existing = std::move(edge);
    }
}

SchemaGraph SchemaGraphBuilder::build(const SchemaModel& schema,
                                      const RelationshipMap& relationships) const {
    SchemaGraph graph;

    for (const auto& [name, table] : schema.tables()) {
        GraphNode node;
        node.id = name;
        node.column_count = table.columns.size();
        node.primary_key = table.primary_key;
        graph.nodes_.emplace(name, std::move(node));
    }

    for (const auto& [table_name, entry] : relationships) {
        for (const auto& rel : entry.foreign_keys) {
            if (rel.is_self_reference() && !keeps_self_edge(rel.basis)) {
                continue;
            }

            GraphEdge edge;
            edge.source = rel.source_table;
            edge.target = rel.target_table;
            edge.source_column = rel.source_column;
            edge.target_column = rel.target_column;
            edge.confidence = rel.basis == Basis::DECLARED ? 1.0 : rel.confidence;
            edge.basis = rel.basis;
            edge.dangling = rel.dangling;

            ensure_node(graph, edge.source);
            ensure_node(graph, edge.target);
            add_edge(graph, std::move(edge));
        }
    }

    return graph;
}

SchemaGraph build_schema_graph(const SchemaModel& schema, const RelationshipMap& relationships) {
    return SchemaGraphBuilder{}.build(schema, relationships);
}

} // namespace schemagraph
