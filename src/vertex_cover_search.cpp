#include "vcsa/vertex_cover_search.hpp"

#include <cmath>
#include <iostream>
#include <mutex>
#include <string>

#include "vcsa/logging.hpp"

namespace vcsa {
namespace {

void fail(SearchErrorKind kind, const std::string& what) {
    throw SearchError(kind, "search_vertex_cover: " + what);
}

const SearchOptions& checked_options(const Graph& graph, const SearchOptions& opt) {
    validate_search_options(graph, opt);
    return opt;
}

double seconds_since(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration_cast<std::chrono::duration<double>>(std::chrono::steady_clock::now() - t0).count();
}

}  // namespace

SearchOptions improved_search_options(int max_node) {
    SearchOptions opt;
    opt.max_node = max_node;
    return opt;
}

SearchOptions baseline_search_options(int max_node) {
    SearchOptions opt;
    opt.max_node = max_node;
    opt.cooling_rate = 0.95;
    opt.cooling_law = CoolingLaw::kGeometric;
    opt.move_policy = MovePolicy::kUniform;
    opt.early_stop.reset();
    return opt;
}

void validate_search_options(const Graph& graph, const SearchOptions& opt) {
    if (graph.empty()) {
        fail(SearchErrorKind::kDegenerateGraph, "graph has no vertices");
    }
    if (opt.max_node <= 0 || opt.max_node > graph.vertex_count()) {
        fail(SearchErrorKind::kInvalidParameter,
             "max_node must be in [1," + std::to_string(graph.vertex_count()) + "], got " +
                 std::to_string(opt.max_node));
    }
    if (opt.max_iteration < 0) {
        fail(SearchErrorKind::kInvalidParameter, "max_iteration must be >= 0");
    }
    if (!std::isfinite(opt.initial_temp) || !(opt.initial_temp > 0.0)) {
        fail(SearchErrorKind::kInvalidParameter, "initial_temp must be finite and > 0");
    }
    if (!std::isfinite(opt.cooling_rate) || !(opt.cooling_rate > 0.0)) {
        fail(SearchErrorKind::kInvalidParameter, "cooling_rate must be finite and > 0");
    }
    if (opt.early_stop && *opt.early_stop < 0) {
        fail(SearchErrorKind::kInvalidParameter, "early_stop must be >= 0");
    }
    if (!(opt.time_limit_sec >= 0.0)) {
        fail(SearchErrorKind::kInvalidParameter, "time_limit_sec must be >= 0");
    }
}

AnnealingSearch::AnnealingSearch(const Graph& graph, const SearchOptions& opt)
    : graph_(&graph),
      opt_(checked_options(graph, opt)),
      rng_(opt_.seed),
      current_(CoverState::random(graph, opt_.max_node, rng_)),
      schedule_(opt_.initial_temp, opt_.cooling_rate, opt_.cooling_law, opt_.max_iteration),
      start_(std::chrono::steady_clock::now()) {
    best_members_ = current_.sorted_members();
    best_covered_ = current_.covered();
    initial_covered_ = best_covered_;
}

bool AnnealingSearch::step() {
    if (!running()) {
        return false;
    }
    if (should_stop()) {
        return false;
    }

    const auto mv = propose_swap(current_, opt_.move_policy, rng_);
    if (!mv) {
        no_move_++;
    } else {
        proposed_++;
        const int cand_covered = score_candidate(*mv);
        const int reference = (opt_.delta_reference == DeltaReference::kBest) ? best_covered_ : current_.covered();

        if (schedule_.accept(cand_covered - reference, rng_)) {
            accepted_++;
            current_.swap(mv->out, mv->in);
            if (cand_covered > best_covered_) {
                improved_++;
                best_covered_ = cand_covered;
                best_members_ = current_.sorted_members();
                stagnation_ = 0;
            } else {
                stagnation_++;
            }
        } else if (opt_.count_rejections) {
            stagnation_++;
        }
    }

    schedule_.cool(iteration_);
    iteration_++;

    if (opt_.log_every > 0 && (iteration_ % opt_.log_every) == 0) {
        log_progress(false);
    }
    return true;
}

void AnnealingSearch::run() {
    while (step()) {
    }
}

bool AnnealingSearch::should_stop() {
    if (opt_.cancel != nullptr && opt_.cancel->load(std::memory_order_relaxed)) {
        finish(StopReason::kCancelled);
        return true;
    }
    if (opt_.time_limit_sec > 0.0 && seconds_since(start_) >= opt_.time_limit_sec) {
        finish(StopReason::kTimeLimit);
        return true;
    }
    if (opt_.early_stop && stagnation_ >= *opt_.early_stop) {
        finish(StopReason::kStagnation);
        return true;
    }
    if (iteration_ >= opt_.max_iteration) {
        finish(StopReason::kMaxIterations);
        return true;
    }
    return false;
}

int AnnealingSearch::score_candidate(const SwapMove& mv) const {
    if (opt_.evaluator == EvaluatorMode::kIncremental) {
        return current_.covered_after_swap(mv.out, mv.in);
    }
    std::vector<VertexId> cand = current_.members();
    for (auto& v : cand) {
        if (v == mv.out) {
            v = mv.in;
            break;
        }
    }
    return count_covered(*graph_, cand);
}

void AnnealingSearch::finish(StopReason reason) {
    stop_ = reason;
    seconds_ = seconds_since(start_);
    if (opt_.log_every > 0) {
        log_progress(true);
    }
}

void AnnealingSearch::log_progress(bool done) const {
    const std::string prefix = opt_.log_prefix.empty() ? std::string("[vc]") : opt_.log_prefix;
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cerr << prefix << (done ? " done" : "") << " it=" << iteration_ << "/" << opt_.max_iteration
              << " T=" << schedule_.temperature() << " cur=" << current_.covered() << " best=" << best_covered_
              << "/" << graph_->edge_count() << " stagnation=" << stagnation_ << " proposed=" << proposed_
              << " accepted=" << accepted_ << " improved=" << improved_;
    if (done) {
        std::cerr << " stop=" << stop_reason_name(stop_) << " secs=" << seconds_;
    }
    std::cerr << "\n";
}

SearchResult AnnealingSearch::result() const {
    SearchResult res;
    res.best_members = best_members_;
    res.best_covered = best_covered_;
    res.initial_covered = initial_covered_;
    res.edge_count = graph_->edge_count();
    res.iterations = iteration_;
    res.proposed = proposed_;
    res.accepted = accepted_;
    res.improved = improved_;
    res.no_move = no_move_;
    res.stop_reason = stop_;
    res.final_temperature = schedule_.temperature();
    res.seconds = running() ? seconds_since(start_) : seconds_;
    return res;
}

SearchResult search_vertex_cover(const Graph& graph, const SearchOptions& opt) {
    AnnealingSearch search(graph, opt);
    search.run();
    return search.result();
}

std::vector<std::string> cover_labels(const Graph& graph, const std::vector<VertexId>& members) {
    std::vector<std::string> out;
    out.reserve(members.size());
    for (VertexId v : members) {
        out.push_back(graph.label(v));
    }
    return out;
}

const char* stop_reason_name(StopReason reason) {
    switch (reason) {
    case StopReason::kRunning:
        return "running";
    case StopReason::kMaxIterations:
        return "max_iteration";
    case StopReason::kStagnation:
        return "early_stop";
    case StopReason::kTimeLimit:
        return "time_limit";
    case StopReason::kCancelled:
        return "cancelled";
    }
    return "unknown";
}

}  // namespace vcsa
