#pragma once

#include <cstdint>
#include <vector>

#include "vcsa/graph.hpp"
#include "vcsa/vertex_cover_search.hpp"

namespace vcsa {

struct MultiStartOptions {
    int runs = 1;
    int threads = 0;  // <= 0: OpenMP default
};

struct MultiStartResult {
    SearchResult best;
    int best_run = 0;
    std::vector<SearchResult> runs;
};

// Seed of run `run` derived from the base seed.
std::uint64_t run_seed(std::uint64_t base_seed, int run);

// Independent annealing runs (one seed each), parallel across OpenMP threads when
// available. The best run is the highest coverage, ties to the lowest run index,
// so the outcome does not depend on the thread count.
MultiStartResult multi_start_search(
    const Graph& graph,
    const SearchOptions& base,
    const MultiStartOptions& ms = {}
);

}  // namespace vcsa
