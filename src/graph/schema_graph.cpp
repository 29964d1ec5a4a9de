#include "graph/schema_graph.hpp"

#include <cstdint>
#include <unordered_map>

namespace schemagraph {

const GraphNode* SchemaGraph::find_node(const std::string& id) const {
    const auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const GraphEdge* SchemaGraph::find_edge(const std::string& source, const std::string& source_column,
                                        const std::string& target, const std::string& target_column) const {
    const auto it = edge_index_.find(EdgeKey{source, source_column, target, target_column});
    return it != edge_index_.end() ? &edges_[it->second] : nullptr;
}

std::vector<const GraphEdge*> SchemaGraph::outgoing(const std::string& table) const {
    std::vector<const GraphEdge*> result;
    for (const auto& edge : edges_) {
        if (edge.source == table) result.push_back(&edge);
    }
    return result;
}

std::vector<const GraphEdge*> SchemaGraph::incoming(const std::string& table) const {
    std::vector<const GraphEdge*> result;
    for (const auto& edge : edges_) {
        if (edge.target == table) result.push_back(&edge);
    }
    return result;
}

bool SchemaGraph::has_cycle(bool include_self_loops) const {
    std::unordered_map<std::string, std::vector<const std::string*>> adjacency;
    for (const auto& edge : edges_) {
        if (edge.is_self_loop()) {
            if (include_self_loops) return true;
            continue;
        }
        adjacency[edge.source].push_back(&edge.target);
    }

    // Iterative three-colour DFS
    enum class Mark : uint8_t { WHITE, GREY, BLACK };
    std::unordered_map<std::string, Mark> marks;
    for (const auto& [id, node] : nodes_) {
        marks[id] = Mark::WHITE;
    }

    struct Frame {
        const std::string* node;
        size_t next_child;
    };

    for (const auto& [root, node] : nodes_) {
        if (marks[root] != Mark::WHITE) continue;

        std::vector<Frame> stack{{&root, 0}};
        marks[root] = Mark::GREY;

        while (!stack.empty()) {
            auto& frame = stack.back();
            const auto adj = adjacency.find(*frame.node);
            if (adj == adjacency.end() || frame.next_child >= adj->second.size()) {
                marks[*frame.node] = Mark::BLACK;
                stack.pop_back();
                continue;
            }

            const std::string* child = adj->second[frame.next_child++];
            const Mark child_mark = marks[*child];
            if (child_mark == Mark::GREY) {
                return true;
            }
            if (child_mark == Mark::WHITE) {
                marks[*child] = Mark::GREY;
                stack.push_back({child, 0});
            }
        }
    }
    return false;
}

} // namespace schemagraph
