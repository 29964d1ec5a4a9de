#include "serialization/graph_writer.hpp"

using json = nlohmann::json;

namespace schemagraph {

json graph_to_node_link_json(const SchemaGraph& graph) {
    json nodes = json::array();
    for (const auto& [id, node] : graph.nodes()) {
        nodes.push_back({
            {"id", node.id},
            {"column_count", node.column_count},
            {"primary_key", node.primary_key ? json(*node.primary_key) : json(nullptr)},
            {"placeholder", node.placeholder},
        });
    }

    json edges = json::array();
    for (const auto& edge : graph.edges()) {
        json e = {
            {"source", edge.source},
            {"target", edge.target},
            {"source_column", edge.source_column},
            {"target_column", edge.target_column},
            {"confidence", edge.confidence},
            {"basis", basis_to_string(edge.basis)},
        };
        if (edge.dangling) {
            e["dangling"] = true;
        }
        edges.push_back(std::move(e));
    }

    return {
        {"directed", true},
        {"multigraph", true},
        {"graph", json::object()},
        {"nodes", std::move(nodes)},
        {"edges", std::move(edges)},
    };
}

} // namespace schemagraph
