#include "vcsa/move_generator.hpp"

#include <vector>

namespace vcsa {
namespace {

std::optional<VertexId> pick_max_degree(const CoverState& state) {
    const Graph& g = state.graph();
    std::optional<VertexId> best;
    int best_deg = -1;
    for (VertexId v = 0; v < g.vertex_count(); ++v) {
        if (state.contains(v)) {
            continue;
        }
        const int d = g.degree(v);
        if (d > best_deg) {
            best_deg = d;
            best = v;
        }
    }
    return best;
}

std::optional<VertexId> pick_uniform(const CoverState& state, std::mt19937_64& rng) {
    const Graph& g = state.graph();
    const int free_count = g.vertex_count() - state.size();
    if (free_count <= 0) {
        return std::nullopt;
    }
    // k-th non-member in id order.
    std::uniform_int_distribution<int> pick(0, free_count - 1);
    int k = pick(rng);
    for (VertexId v = 0; v < g.vertex_count(); ++v) {
        if (state.contains(v)) {
            continue;
        }
        if (k == 0) {
            return v;
        }
        --k;
    }
    return std::nullopt;
}

}  // namespace

std::optional<SwapMove> propose_swap(const CoverState& state, MovePolicy policy, std::mt19937_64& rng) {
    if (state.size() == 0 || state.size() >= state.graph().vertex_count()) {
        return std::nullopt;
    }

    std::uniform_int_distribution<int> pick_out(0, state.size() - 1);
    const VertexId out = state.members()[static_cast<size_t>(pick_out(rng))];

    std::optional<VertexId> in;
    switch (policy) {
    case MovePolicy::kDegreeBiased:
        in = pick_max_degree(state);
        break;
    case MovePolicy::kUniform:
        in = pick_uniform(state, rng);
        break;
    }
    if (!in) {
        return std::nullopt;
    }
    return SwapMove{out, *in};
}

}  // namespace vcsa
