#include "vcsa/multi_start.hpp"

#include <stdexcept>
#include <string>

#if defined(_OPENMP)
#include <omp.h>
#endif

namespace vcsa {
namespace {

// Team size for the restart loop; 0 keeps the OpenMP default.
int team_size(int requested) {
#if defined(_OPENMP)
    return requested > 0 ? requested : omp_get_max_threads();
#else
    (void)requested;
    return 1;
#endif
}

}  // namespace

std::uint64_t run_seed(std::uint64_t base_seed, int run) {
    return base_seed + static_cast<std::uint64_t>(run) * 1000003ULL;
}

MultiStartResult multi_start_search(const Graph& graph, const SearchOptions& base, const MultiStartOptions& ms) {
    if (ms.runs <= 0) {
        throw std::invalid_argument("multi_start_search: runs must be > 0");
    }
    validate_search_options(graph, base);

    MultiStartResult out;
    out.runs.resize(static_cast<size_t>(ms.runs));
    std::vector<std::string> errors(static_cast<size_t>(ms.runs));

    const int threads = team_size(ms.threads);
    (void)threads;

#pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (int r = 0; r < ms.runs; ++r) {
        SearchOptions opt = base;
        opt.seed = run_seed(base.seed, r);
        if (ms.runs > 1) {
            opt.log_prefix = "[run " + std::to_string(r) + "]";
        }
        try {
            out.runs[static_cast<size_t>(r)] = search_vertex_cover(graph, opt);
        } catch (const std::exception& e) {
            errors[static_cast<size_t>(r)] = e.what();
        }
    }

    for (int r = 0; r < ms.runs; ++r) {
        if (!errors[static_cast<size_t>(r)].empty()) {
            throw std::runtime_error("run " + std::to_string(r) + " failed: " + errors[static_cast<size_t>(r)]);
        }
    }

    int best_run = 0;
    for (int r = 1; r < ms.runs; ++r) {
        if (out.runs[static_cast<size_t>(r)].best_covered > out.runs[static_cast<size_t>(best_run)].best_covered) {
            best_run = r;
        }
    }
    out.best_run = best_run;
    out.best = out.runs[static_cast<size_t>(best_run)];
    return out;
}

}  // namespace vcsa
