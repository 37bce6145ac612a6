#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

#include "test_graphs.hpp"
#include "vcsa/cover_state.hpp"
#include "vcsa/vertex_cover_search.hpp"

namespace vcsa {
namespace {

SearchErrorKind error_kind(const Graph& g, const SearchOptions& opt) {
    try {
        search_vertex_cover(g, opt);
    } catch (const SearchError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected SearchError";
    return SearchErrorKind::kInvalidParameter;
}

TEST(SearchValidationTest, EmptyGraphIsDegenerate) {
    Graph g;
    EXPECT_EQ(error_kind(g, improved_search_options(1)), SearchErrorKind::kDegenerateGraph);
}

TEST(SearchValidationTest, RejectsOutOfRangeParameters) {
    const Graph g = test::cycle_graph(4);
    EXPECT_EQ(error_kind(g, improved_search_options(0)), SearchErrorKind::kInvalidParameter);
    EXPECT_EQ(error_kind(g, improved_search_options(5)), SearchErrorKind::kInvalidParameter);

    SearchOptions opt = improved_search_options(2);
    opt.initial_temp = 0.0;
    EXPECT_EQ(error_kind(g, opt), SearchErrorKind::kInvalidParameter);

    opt = improved_search_options(2);
    opt.max_iteration = -1;
    EXPECT_EQ(error_kind(g, opt), SearchErrorKind::kInvalidParameter);

    opt = improved_search_options(2);
    opt.cooling_rate = 0.0;
    EXPECT_EQ(error_kind(g, opt), SearchErrorKind::kInvalidParameter);

    const double inf = std::numeric_limits<double>::infinity();
    opt = improved_search_options(2);
    opt.initial_temp = inf;
    EXPECT_EQ(error_kind(g, opt), SearchErrorKind::kInvalidParameter);

    opt = improved_search_options(2);
    opt.cooling_rate = inf;
    EXPECT_EQ(error_kind(g, opt), SearchErrorKind::kInvalidParameter);

    opt = improved_search_options(2);
    opt.initial_temp = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(error_kind(g, opt), SearchErrorKind::kInvalidParameter);

    opt = improved_search_options(2);
    opt.early_stop = -3;
    EXPECT_EQ(error_kind(g, opt), SearchErrorKind::kInvalidParameter);

    EXPECT_THROW(search_vertex_cover(g, improved_search_options(9)), std::invalid_argument);
}

TEST(SearchOptionsTest, PresetsMatchTheTwoVariants) {
    const SearchOptions improved = improved_search_options(7);
    EXPECT_EQ(improved.max_node, 7);
    EXPECT_DOUBLE_EQ(improved.initial_temp, 1500.0);
    EXPECT_DOUBLE_EQ(improved.cooling_rate, 0.9);
    EXPECT_EQ(improved.max_iteration, 1500);
    ASSERT_TRUE(improved.early_stop.has_value());
    EXPECT_EQ(*improved.early_stop, 150);
    EXPECT_EQ(improved.move_policy, MovePolicy::kDegreeBiased);
    EXPECT_EQ(improved.cooling_law, CoolingLaw::kGeometricDecay);
    EXPECT_EQ(improved.delta_reference, DeltaReference::kBest);
    EXPECT_FALSE(improved.count_rejections);

    const SearchOptions baseline = baseline_search_options(7);
    EXPECT_DOUBLE_EQ(baseline.cooling_rate, 0.95);
    EXPECT_FALSE(baseline.early_stop.has_value());
    EXPECT_EQ(baseline.move_policy, MovePolicy::kUniform);
    EXPECT_EQ(baseline.cooling_law, CoolingLaw::kGeometric);
}

TEST(SearchScenarioTest, FourCycleFindsOppositeCorners) {
    const Graph g = test::cycle_graph(4);
    for (std::uint64_t seed = 1; seed <= 25; ++seed) {
        SearchOptions opt = improved_search_options(2);
        opt.max_iteration = 200;
        opt.seed = seed;
        const SearchResult res = search_vertex_cover(g, opt);
        ASSERT_EQ(res.best_covered, 4) << "seed " << seed;
        ASSERT_EQ(res.best_members.size(), 2u);
        EXPECT_FALSE(g.has_edge(res.best_members[0], res.best_members[1]));
    }
}

TEST(SearchScenarioTest, FourCycleWithBaselineAndCurrentDelta) {
    const Graph g = test::cycle_graph(4);
    for (std::uint64_t seed = 1; seed <= 10; ++seed) {
        SearchOptions base = baseline_search_options(2);
        base.max_iteration = 200;
        base.seed = seed;
        EXPECT_EQ(search_vertex_cover(g, base).best_covered, 4) << "seed " << seed;

        SearchOptions cur = improved_search_options(2);
        cur.max_iteration = 200;
        cur.delta_reference = DeltaReference::kCurrent;
        cur.seed = seed;
        EXPECT_EQ(search_vertex_cover(g, cur).best_covered, 4) << "seed " << seed;
    }
}

TEST(SearchScenarioTest, StarConvergesToCenter) {
    const Graph g = test::star_graph(5);
    const VertexId c = *g.find("c");
    for (std::uint64_t seed = 1; seed <= 10; ++seed) {
        SearchOptions opt = improved_search_options(1);
        opt.seed = seed;
        const SearchResult res = search_vertex_cover(g, opt);
        EXPECT_EQ(res.best_covered, 5);
        EXPECT_EQ(res.best_members, std::vector<VertexId>{c});

        SearchOptions base = baseline_search_options(1);
        base.seed = seed;
        EXPECT_EQ(search_vertex_cover(g, base).best_members, std::vector<VertexId>{c});
    }
}

TEST(SearchBoundaryTest, FullCoverNeverMoves) {
    const Graph g = test::random_graph(15, 0.3, 12);
    SearchOptions opt = improved_search_options(g.vertex_count());
    opt.max_iteration = 40;
    const SearchResult res = search_vertex_cover(g, opt);
    EXPECT_EQ(res.best_covered, g.edge_count());
    EXPECT_EQ(res.iterations, 40);
    EXPECT_EQ(res.no_move, 40);
    EXPECT_EQ(res.proposed, 0);
    EXPECT_EQ(res.stop_reason, StopReason::kMaxIterations);
}

TEST(SearchBoundaryTest, ZeroIterationsReturnsInitialCover) {
    const Graph g = test::random_graph(30, 0.15, 2);
    SearchOptions opt = improved_search_options(8);
    opt.max_iteration = 0;
    opt.seed = 77;
    const SearchResult res = search_vertex_cover(g, opt);

    std::mt19937_64 rng(77);
    const CoverState initial = CoverState::random(g, 8, rng);
    EXPECT_EQ(res.iterations, 0);
    EXPECT_EQ(res.best_members, initial.sorted_members());
    EXPECT_EQ(res.best_covered, initial.covered());
    EXPECT_EQ(res.best_covered, res.initial_covered);
    EXPECT_EQ(res.stop_reason, StopReason::kMaxIterations);
}

TEST(SearchPropertyTest, SameSeedSameOutcome) {
    const Graph g = test::random_graph(60, 0.08, 31);
    for (MovePolicy policy : {MovePolicy::kDegreeBiased, MovePolicy::kUniform}) {
        SearchOptions opt = improved_search_options(15);
        opt.move_policy = policy;
        opt.seed = 2024;
        const SearchResult a = search_vertex_cover(g, opt);
        const SearchResult b = search_vertex_cover(g, opt);
        EXPECT_EQ(a.best_members, b.best_members);
        EXPECT_EQ(a.best_covered, b.best_covered);
        EXPECT_EQ(a.iterations, b.iterations);
        EXPECT_EQ(a.accepted, b.accepted);
    }
}

TEST(SearchPropertyTest, FullRecountEvaluatorGivesIdenticalRuns) {
    const Graph g = test::random_graph(50, 0.1, 5);
    for (std::uint64_t seed : {1u, 9u, 123u}) {
        SearchOptions inc = baseline_search_options(12);
        inc.max_iteration = 400;
        inc.seed = seed;
        SearchOptions full = inc;
        full.evaluator = EvaluatorMode::kFullRecount;

        const SearchResult a = search_vertex_cover(g, inc);
        const SearchResult b = search_vertex_cover(g, full);
        EXPECT_EQ(a.best_members, b.best_members);
        EXPECT_EQ(a.best_covered, b.best_covered);
        EXPECT_EQ(a.accepted, b.accepted);
        EXPECT_EQ(a.improved, b.improved);
    }
}

// Cardinality, evaluator equivalence and best-score monotonicity at every step.
TEST(SearchPropertyTest, InvariantsHoldAtEveryStep) {
    for (std::uint64_t seed : {3u, 4u}) {
        Graph g = test::random_graph(45, 0.1, seed);
        g.add_edge_ids(0, 0);
        for (const SearchOptions& base : {improved_search_options(10), baseline_search_options(10)}) {
            SearchOptions opt = base;
            opt.max_iteration = 500;
            opt.seed = seed;
            AnnealingSearch search(g, opt);

            int last_best = search.best_covered();
            while (search.step()) {
                ASSERT_EQ(search.current().size(), 10);
                ASSERT_EQ(static_cast<int>(search.best_members().size()), 10);
                ASSERT_EQ(search.current().covered(), count_covered(g, search.current().members()));
                ASSERT_EQ(search.best_covered(), count_covered(g, search.best_members()));
                ASSERT_GE(search.best_covered(), last_best);
                ASSERT_LE(search.best_covered(), g.edge_count());
                ASSERT_GE(search.temperature(), 0.0);
                last_best = search.best_covered();
            }
            EXPECT_FALSE(search.running());
            EXPECT_FALSE(search.step());
        }
    }
}

TEST(SearchPropertyTest, ResultSnapshotTracksTheRunningSearch) {
    const Graph g = test::random_graph(30, 0.15, 8);
    SearchOptions opt = improved_search_options(8);
    opt.max_iteration = 300;
    opt.seed = 8;
    AnnealingSearch search(g, opt);

    for (int i = 0; i < 25 && search.step(); ++i) {
        const SearchResult snap = search.result();
        EXPECT_EQ(snap.stop_reason, StopReason::kRunning);
        EXPECT_EQ(snap.iterations, search.iteration());
        EXPECT_EQ(snap.proposed + snap.no_move, snap.iterations);
        EXPECT_LE(snap.improved, snap.accepted);
        EXPECT_LE(snap.accepted, snap.proposed);
        EXPECT_EQ(snap.best_covered, search.best_covered());
        EXPECT_EQ(snap.best_members, search.best_members());
        EXPECT_EQ(snap.edge_count, g.edge_count());
        EXPECT_DOUBLE_EQ(snap.final_temperature, search.temperature());
    }

    search.run();
    const SearchResult done = search.result();
    EXPECT_NE(done.stop_reason, StopReason::kRunning);
    EXPECT_EQ(done.stop_reason, search.stop_reason());
    EXPECT_GE(done.best_covered, done.initial_covered);
}

TEST(SearchStopTest, StagnationStopsAfterEarlyStopAcceptedMoves) {
    // No edges: every move ties the best and is accepted.
    const Graph g = test::isolated_vertices(10);
    SearchOptions opt = improved_search_options(3);
    const SearchResult res = search_vertex_cover(g, opt);
    EXPECT_EQ(res.stop_reason, StopReason::kStagnation);
    EXPECT_EQ(res.iterations, 150);
    EXPECT_EQ(res.accepted, 150);
    EXPECT_EQ(res.best_covered, 0);

    opt.early_stop.reset();
    opt.max_iteration = 300;
    const SearchResult open = search_vertex_cover(g, opt);
    EXPECT_EQ(open.stop_reason, StopReason::kMaxIterations);
    EXPECT_EQ(open.iterations, 300);
}

TEST(SearchStopTest, RejectionsCountOnlyWhenConfigured) {
    // Cold start on a star: once the center is held every proposal loses 4 edges and is rejected.
    const Graph g = test::star_graph(5);
    for (std::uint64_t seed = 1; seed <= 5; ++seed) {
        SearchOptions opt = improved_search_options(1);
        opt.initial_temp = 1e-9;
        opt.early_stop = 10;
        opt.max_iteration = 100;
        opt.seed = seed;

        const SearchResult plain = search_vertex_cover(g, opt);
        EXPECT_EQ(plain.stop_reason, StopReason::kMaxIterations);
        EXPECT_EQ(plain.best_covered, 5);

        opt.count_rejections = true;
        const SearchResult counted = search_vertex_cover(g, opt);
        EXPECT_EQ(counted.stop_reason, StopReason::kStagnation);
        EXPECT_EQ(counted.best_covered, 5);
        EXPECT_LE(counted.iterations, 11);
    }
}

TEST(SearchStopTest, CancellationFlagStopsBeforeFirstIteration) {
    const Graph g = test::cycle_graph(6);
    std::atomic<bool> cancel{true};
    SearchOptions opt = improved_search_options(3);
    opt.cancel = &cancel;
    const SearchResult res = search_vertex_cover(g, opt);
    EXPECT_EQ(res.stop_reason, StopReason::kCancelled);
    EXPECT_EQ(res.iterations, 0);
    EXPECT_EQ(res.best_covered, res.initial_covered);
}

TEST(SearchStopTest, TimeLimitStopsLongRuns) {
    const Graph g = test::cycle_graph(8);
    SearchOptions opt = baseline_search_options(8);
    opt.max_iteration = 1 << 30;
    opt.time_limit_sec = 0.05;
    const SearchResult res = search_vertex_cover(g, opt);
    EXPECT_EQ(res.stop_reason, StopReason::kTimeLimit);
    EXPECT_EQ(res.best_covered, 8);
    EXPECT_LT(res.iterations, 1 << 30);
}

TEST(SearchResultTest, LabelsFollowMembers) {
    const Graph g = test::star_graph(3);
    const auto labels = cover_labels(g, {*g.find("c"), *g.find("l2")});
    ASSERT_EQ(labels.size(), 2u);
    EXPECT_EQ(labels[0], "c");
    EXPECT_EQ(labels[1], "l2");
    EXPECT_STREQ(stop_reason_name(StopReason::kStagnation), "early_stop");
}

}  // namespace
}  // namespace vcsa
