#include "vcsa/cover_state.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace vcsa {

int count_covered(const Graph& graph, const std::vector<VertexId>& members) {
    std::vector<char> mark(static_cast<size_t>(graph.vertex_count()), 0);
    for (VertexId v : members) {
        if (v < 0 || v >= graph.vertex_count()) {
            throw std::out_of_range("count_covered: vertex id out of range: " + std::to_string(v));
        }
        mark[static_cast<size_t>(v)] = 1;
    }
    int covered = 0;
    for (const auto& e : graph.edges()) {
        if (mark[static_cast<size_t>(e.u)] || mark[static_cast<size_t>(e.v)]) {
            covered++;
        }
    }
    return covered;
}

CoverState::CoverState(const Graph& graph, const std::vector<VertexId>& members)
    : graph_(&graph),
      pos_(static_cast<size_t>(graph.vertex_count()), -1),
      hits_(static_cast<size_t>(graph.edge_count()), 0) {
    members_.reserve(members.size());
    for (VertexId v : members) {
        if (v < 0 || v >= graph.vertex_count()) {
            throw std::invalid_argument("CoverState: vertex id out of range: " + std::to_string(v));
        }
        if (contains(v)) {
            throw std::invalid_argument("CoverState: duplicate member " + std::to_string(v));
        }
        insert(v);
    }
}

CoverState CoverState::random(const Graph& graph, int size, std::mt19937_64& rng) {
    const int n = graph.vertex_count();
    if (size < 0 || size > n) {
        throw std::invalid_argument("CoverState::random: size must be in [0," + std::to_string(n) + "]");
    }
    std::vector<VertexId> ids(static_cast<size_t>(n));
    std::iota(ids.begin(), ids.end(), 0);
    for (int i = 0; i < size; ++i) {
        std::uniform_int_distribution<int> pick(i, n - 1);
        std::swap(ids[static_cast<size_t>(i)], ids[static_cast<size_t>(pick(rng))]);
    }
    ids.resize(static_cast<size_t>(size));
    return CoverState(graph, ids);
}

void CoverState::check_swap(VertexId out, VertexId in) const {
    const int n = graph_->vertex_count();
    if (out < 0 || out >= n || in < 0 || in >= n) {
        throw std::invalid_argument("CoverState: swap vertex id out of range: " + std::to_string(out) + " -> " +
                                    std::to_string(in));
    }
    if (!contains(out) || contains(in)) {
        throw std::invalid_argument("CoverState: swap needs a member out and a non-member in");
    }
}

int CoverState::covered_after_swap(VertexId out, VertexId in) const {
    check_swap(out, in);
    int lost = 0;
    for (int e : graph_->incident_edges(out)) {
        if (hits_[static_cast<size_t>(e)] != 1) {
            continue;
        }
        const GraphEdge& ed = graph_->edge(e);
        const VertexId other = (ed.u == out) ? ed.v : ed.u;
        if (other != in) {
            lost++;
        }
    }
    int gained = 0;
    for (int e : graph_->incident_edges(in)) {
        if (hits_[static_cast<size_t>(e)] == 0) {
            gained++;
        }
    }
    return covered_ - lost + gained;
}

void CoverState::swap(VertexId out, VertexId in) {
    check_swap(out, in);
    erase(out);
    insert(in);
}

std::vector<VertexId> CoverState::sorted_members() const {
    std::vector<VertexId> out = members_;
    std::sort(out.begin(), out.end());
    return out;
}

void CoverState::insert(VertexId v) {
    pos_[static_cast<size_t>(v)] = static_cast<int>(members_.size());
    members_.push_back(v);
    for (int e : graph_->incident_edges(v)) {
        if (hits_[static_cast<size_t>(e)]++ == 0) {
            covered_++;
        }
    }
}

void CoverState::erase(VertexId v) {
    // Swap-with-last keeps members_ dense.
    const int p = pos_[static_cast<size_t>(v)];
    const VertexId last = members_.back();
    members_[static_cast<size_t>(p)] = last;
    pos_[static_cast<size_t>(last)] = p;
    members_.pop_back();
    pos_[static_cast<size_t>(v)] = -1;
    for (int e : graph_->incident_edges(v)) {
        if (--hits_[static_cast<size_t>(e)] == 0) {
            covered_--;
        }
    }
}

}  // namespace vcsa
