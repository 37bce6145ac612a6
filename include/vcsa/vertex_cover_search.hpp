#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "vcsa/annealing_schedule.hpp"
#include "vcsa/cover_state.hpp"
#include "vcsa/graph.hpp"
#include "vcsa/move_generator.hpp"

namespace vcsa {

// Score the acceptance test compares a candidate against.
enum class DeltaReference {
    kBest = 0,     // new - best-ever (default)
    kCurrent = 1,  // new - current (textbook annealing)
};

enum class EvaluatorMode {
    kIncremental = 0,  // swap delta from incident edges only
    kFullRecount = 1,  // rescan every edge for each candidate
};

enum class StopReason {
    kRunning = 0,
    kMaxIterations = 1,
    kStagnation = 2,
    kTimeLimit = 3,
    kCancelled = 4,
};

struct SearchOptions {
    int max_node = 0;  // cover size, required

    double initial_temp = 1500.0;
    double cooling_rate = 0.9;
    int max_iteration = 1500;

    // Stop after this many accepted moves without a new best. nullopt disables.
    std::optional<int> early_stop = 150;

    MovePolicy move_policy = MovePolicy::kDegreeBiased;
    CoolingLaw cooling_law = CoolingLaw::kGeometricDecay;
    DeltaReference delta_reference = DeltaReference::kBest;

    // Also count rejected moves toward stagnation.
    bool count_rejections = false;

    EvaluatorMode evaluator = EvaluatorMode::kIncremental;

    std::uint64_t seed = 1;

    // Checked once per iteration. 0 disables the wall-clock limit.
    double time_limit_sec = 0.0;
    const std::atomic<bool>* cancel = nullptr;

    // If > 0, print progress every k iterations to stderr.
    int log_every = 0;
    std::string log_prefix = "[vc]";
};

// Degree-biased moves, decaying geometric cooling (rate 0.9), early stop after 150.
SearchOptions improved_search_options(int max_node);

// Uniform moves, plain geometric cooling (rate 0.95), no early stop.
SearchOptions baseline_search_options(int max_node);

enum class SearchErrorKind {
    kInvalidParameter = 0,
    kDegenerateGraph = 1,
};

class SearchError : public std::invalid_argument {
public:
    SearchError(SearchErrorKind kind, const std::string& what) : std::invalid_argument(what), kind_(kind) {}

    SearchErrorKind kind() const { return kind_; }

private:
    SearchErrorKind kind_;
};

// Throws SearchError when the graph or options cannot start a run.
void validate_search_options(const Graph& graph, const SearchOptions& opt);

struct SearchResult {
    std::vector<VertexId> best_members;  // ascending ids
    int best_covered = 0;

    int initial_covered = 0;
    int edge_count = 0;

    int iterations = 0;
    int proposed = 0;
    int accepted = 0;
    int improved = 0;
    int no_move = 0;

    StopReason stop_reason = StopReason::kRunning;
    double final_temperature = 0.0;
    double seconds = 0.0;
};

// One annealing run. Construction validates and draws the initial random
// cover; each step() performs a single iteration.
class AnnealingSearch {
public:
    AnnealingSearch(const Graph& graph, const SearchOptions& opt);

    // Returns false once the run has stopped (and performs no iteration then).
    bool step();
    void run();

    bool running() const { return stop_ == StopReason::kRunning; }
    StopReason stop_reason() const { return stop_; }

    const CoverState& current() const { return current_; }
    const std::vector<VertexId>& best_members() const { return best_members_; }
    int best_covered() const { return best_covered_; }
    int iteration() const { return iteration_; }
    int stagnation() const { return stagnation_; }
    double temperature() const { return schedule_.temperature(); }

    SearchResult result() const;

private:
    bool should_stop();
    int score_candidate(const SwapMove& mv) const;
    void finish(StopReason reason);
    void log_progress(bool done) const;

    const Graph* graph_;
    SearchOptions opt_;
    std::mt19937_64 rng_;
    CoverState current_;
    AnnealingSchedule schedule_;

    std::vector<VertexId> best_members_;
    int best_covered_ = 0;
    int initial_covered_ = 0;
    int stagnation_ = 0;
    int iteration_ = 0;
    StopReason stop_ = StopReason::kRunning;

    int proposed_ = 0;
    int accepted_ = 0;
    int improved_ = 0;
    int no_move_ = 0;

    std::chrono::steady_clock::time_point start_;
    double seconds_ = 0.0;
};

// Runs a full search: (best cover, covered edge count) plus run statistics.
SearchResult search_vertex_cover(const Graph& graph, const SearchOptions& opt);

std::vector<std::string> cover_labels(const Graph& graph, const std::vector<VertexId>& members);

const char* stop_reason_name(StopReason reason);

}  // namespace vcsa
