#include "vcsa/graph.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace vcsa {
namespace {

std::uint64_t pack_edge_key(VertexId u, VertexId v) {
    const std::uint64_t lo = static_cast<std::uint32_t>(std::min(u, v));
    const std::uint64_t hi = static_cast<std::uint32_t>(std::max(u, v));
    return (lo << 32) | hi;
}

}  // namespace

VertexId Graph::add_vertex(const std::string& label) {
    auto it = ids_.find(label);
    if (it != ids_.end()) {
        return it->second;
    }
    const VertexId id = static_cast<VertexId>(labels_.size());
    labels_.push_back(label);
    ids_.emplace(label, id);
    incident_.emplace_back();
    degree_.push_back(0);
    return id;
}

bool Graph::add_edge(const std::string& a, const std::string& b) {
    const VertexId u = add_vertex(a);
    const VertexId v = add_vertex(b);
    return add_edge_ids(u, v);
}

bool Graph::add_edge_ids(VertexId u, VertexId v) {
    check_vertex(u);
    check_vertex(v);
    if (!edge_keys_.insert(pack_edge_key(u, v)).second) {
        return false;
    }

    const int e = static_cast<int>(edges_.size());
    edges_.push_back(GraphEdge{u, v});
    incident_[static_cast<size_t>(u)].push_back(e);
    degree_[static_cast<size_t>(u)] += 1;
    if (u != v) {
        incident_[static_cast<size_t>(v)].push_back(e);
    }
    degree_[static_cast<size_t>(v)] += 1;
    return true;
}

const GraphEdge& Graph::edge(int e) const {
    if (e < 0 || e >= edge_count()) {
        throw std::out_of_range("Graph: edge id out of range: " + std::to_string(e));
    }
    return edges_[static_cast<size_t>(e)];
}

int Graph::degree(VertexId v) const {
    check_vertex(v);
    return degree_[static_cast<size_t>(v)];
}

const std::vector<int>& Graph::incident_edges(VertexId v) const {
    check_vertex(v);
    return incident_[static_cast<size_t>(v)];
}

const std::string& Graph::label(VertexId v) const {
    check_vertex(v);
    return labels_[static_cast<size_t>(v)];
}

std::optional<VertexId> Graph::find(const std::string& label) const {
    auto it = ids_.find(label);
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Graph::has_edge(VertexId u, VertexId v) const {
    check_vertex(u);
    check_vertex(v);
    return edge_keys_.count(pack_edge_key(u, v)) != 0;
}

void Graph::check_vertex(VertexId v) const {
    if (v < 0 || v >= vertex_count()) {
        throw std::out_of_range("Graph: vertex id out of range: " + std::to_string(v));
    }
}

}  // namespace vcsa
