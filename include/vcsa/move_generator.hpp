#pragma once

#include <optional>
#include <random>

#include "vcsa/cover_state.hpp"
#include "vcsa/graph.hpp"

namespace vcsa {

enum class MovePolicy {
    kDegreeBiased = 0,  // add the highest-degree non-member (first in id order on ties)
    kUniform = 1,       // add a uniformly random non-member
};

struct SwapMove {
    VertexId out = 0;
    VertexId in = 0;
};

// Proposes one swap: `out` uniform over the members, `in` per `policy` over the
// non-members. Returns nullopt when every vertex is already a member.
std::optional<SwapMove> propose_swap(
    const CoverState& state,
    MovePolicy policy,
    std::mt19937_64& rng
);

}  // namespace vcsa
