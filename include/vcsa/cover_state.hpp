#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "vcsa/graph.hpp"

namespace vcsa {

// Number of edges with at least one endpoint in `members` (full recount, O(M)).
// Ids outside the graph throw std::out_of_range.
int count_covered(const Graph& graph, const std::vector<VertexId>& members);

// Fixed-size candidate cover with an incrementally maintained covered-edge count.
//
// Per edge it keeps how many of its distinct endpoints are members (0, 1 or 2),
// so a swap only touches the edges incident to the two swapped vertices.
class CoverState {
public:
    // `members` must be distinct valid vertex ids.
    CoverState(const Graph& graph, const std::vector<VertexId>& members);

    // Uniform random `size`-subset of the graph's vertices.
    static CoverState random(const Graph& graph, int size, std::mt19937_64& rng);

    int size() const { return static_cast<int>(members_.size()); }
    int covered() const { return covered_; }
    const std::vector<VertexId>& members() const { return members_; }
    // False for ids outside the graph.
    bool contains(VertexId v) const {
        return v >= 0 && static_cast<size_t>(v) < pos_.size() && pos_[static_cast<size_t>(v)] >= 0;
    }

    // Covered-edge count after replacing `out` (a member) with `in` (a non-member),
    // without modifying the state.
    int covered_after_swap(VertexId out, VertexId in) const;

    // Replaces member `out` with non-member `in`. Cardinality is preserved.
    void swap(VertexId out, VertexId in);

    // Members in ascending id order.
    std::vector<VertexId> sorted_members() const;

    const Graph& graph() const { return *graph_; }

private:
    void check_swap(VertexId out, VertexId in) const;
    void insert(VertexId v);
    void erase(VertexId v);

    const Graph* graph_ = nullptr;
    std::vector<VertexId> members_;
    std::vector<int> pos_;              // index into members_, -1 when not a member
    std::vector<std::uint8_t> hits_;    // member endpoints per edge
    int covered_ = 0;
};

}  // namespace vcsa
