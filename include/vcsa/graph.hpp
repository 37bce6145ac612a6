#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace vcsa {

// Dense vertex index in [0, vertex_count()).
using VertexId = int;

// Undirected edge; u == v is a self-loop.
struct GraphEdge {
    VertexId u = 0;
    VertexId v = 0;
};

// Simple undirected graph with labelled vertices. No multi-edges.
class Graph {
public:
    Graph() = default;

    // Returns the existing id when `label` is already present.
    VertexId add_vertex(const std::string& label);

    // Both return false (and change nothing) for an edge that already exists.
    bool add_edge(const std::string& a, const std::string& b);
    bool add_edge_ids(VertexId u, VertexId v);

    int vertex_count() const { return static_cast<int>(labels_.size()); }
    int edge_count() const { return static_cast<int>(edges_.size()); }
    bool empty() const { return labels_.empty(); }

    const std::vector<GraphEdge>& edges() const { return edges_; }
    const GraphEdge& edge(int e) const;

    // Self-loops count twice.
    int degree(VertexId v) const;

    // Edge ids touching `v`, each listed once (a self-loop appears once).
    const std::vector<int>& incident_edges(VertexId v) const;

    const std::string& label(VertexId v) const;
    std::optional<VertexId> find(const std::string& label) const;
    bool has_edge(VertexId u, VertexId v) const;

private:
    void check_vertex(VertexId v) const;

    std::vector<std::string> labels_;
    std::unordered_map<std::string, VertexId> ids_;
    std::vector<GraphEdge> edges_;
    std::vector<std::vector<int>> incident_;
    std::vector<int> degree_;
    std::unordered_set<std::uint64_t> edge_keys_;
};

}  // namespace vcsa
