#include <gtest/gtest.h>
#include <atsp/problem.h>
#include <atsp/shift_insert.h>
#include <atsp/solvers.h>
#include <atsp/three_opt.h>
#include <atsp/tour_state.h>
#include <algorithm>
#include <chrono>
#include <numeric>
#include <random>
#include <string>
#include <vector>

using atsp::Problem;
using atsp::TourState;
using atsp::node_cost_idx;

static Problem createRandomProblem(const size_t n, const uint64_t seed) {
    std::mt19937_64 rng{seed};
    std::uniform_int_distribution<int> dist(1, 100);
    std::vector<cost_t> matrix(n * n, 0);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (i != j) {
                matrix[i * n + j] = static_cast<cost_t>(dist(rng));
            }
        }
    }
    return Problem::FromDistanceMatrix(n, matrix);
}

static atsp::length_t bruteForceOptimum(const Problem &problem) {
    std::vector<node_cost_idx> order(problem.dimension());
    std::iota(order.begin(), order.end(), 0);
    atsp::length_t best = atsp::COST_POSITIVE_INFINITY;
    do {
        best = std::min(best, atsp::ComputeTourCost(order, problem));
    } while (std::next_permutation(order.begin() + 1, order.end()));
    return best;
}

// Asserts the invariants every complete tour must satisfy.
static void expectCompleteTour(const TourState &tour, const Problem &problem) {
    ASSERT_TRUE(tour.is_feasible());
    const auto &order = tour.get_order();
    ASSERT_EQ(order.size(), problem.dimension());
    EXPECT_EQ(order.front(), atsp::ANCHOR_CITY);

    std::vector<node_cost_idx> expected(problem.dimension());
    std::iota(expected.begin(), expected.end(), 0);
    EXPECT_TRUE(std::ranges::is_permutation(order, expected));

    EXPECT_NEAR(tour.get_distance(), atsp::ComputeTourCost(order, problem), 1e-3);
    EXPECT_NEAR(tour.lower_bound(), tour.get_distance(), 1e-3);
    EXPECT_LE(problem.lower_bound_at_empty_tour(), tour.get_distance() + 1e-3);
}

TEST(ConstructionTest, GreedyPicksSmallestBoundIncrease) {
    const Problem problem = Problem::FromDistanceMatrix(4, std::vector<cost_t>{
                                                            0, 1, 2, 3,
                                                            1, 0, 4, 5,
                                                            2, 4, 0, 6,
                                                            3, 5, 6, 0
                                                        });
    const TourState tour = atsp::GreedyConstruction(problem);
    expectCompleteTour(tour, problem);

    // (0, 1) and (0, 2) both raise the bound by 4; the lower city index wins
    EXPECT_EQ(tour.get_order()[1], 1);
    EXPECT_DOUBLE_EQ(tour.get_distance(), 14.0f);
}

TEST(ConstructionTest, AllConstructionsBuildCompleteTours) {
    for (const size_t n: {1, 2, 3, 7, 15}) {
        SCOPED_TRACE("n = " + std::to_string(n));
        const Problem problem = createRandomProblem(n, n);
        uint64_t seed = 42;

        expectCompleteTour(atsp::RandomConstruction(problem, seed), problem);
        expectCompleteTour(atsp::GreedyConstruction(problem), problem);
        expectCompleteTour(atsp::GreedyConstructionRandomTieBreak(problem, seed), problem);
        expectCompleteTour(atsp::GreedyRandomizedAdaptiveConstruction(problem, 0.3, seed), problem);
        expectCompleteTour(atsp::Grasp(problem, {.alpha = 0.2, .time_limit = std::chrono::milliseconds(5)}, seed),
                           problem);
        expectCompleteTour(atsp::BeamSearch(problem, 4), problem);
    }
}

TEST(ConstructionTest, GreedyIsDeterministic) {
    const Problem problem = createRandomProblem(20, 1);
    EXPECT_EQ(atsp::GreedyConstruction(problem).get_order(), atsp::GreedyConstruction(problem).get_order());
}

TEST(ConstructionTest, RandomConstructionFollowsSeed) {
    const Problem problem = createRandomProblem(20, 2);
    uint64_t seed_a = 9;
    uint64_t seed_b = 9;
    EXPECT_EQ(atsp::RandomConstruction(problem, seed_a).get_order(),
              atsp::RandomConstruction(problem, seed_b).get_order());
    EXPECT_EQ(seed_a, seed_b);
    EXPECT_NE(seed_a, 9u);
}

TEST(ConstructionTest, GraspBuildsAtLeastOneTour) {
    const Problem problem = createRandomProblem(10, 3);
    uint64_t seed = 4;
    const TourState tour = atsp::Grasp(problem, {.alpha = 0.5, .time_limit = std::chrono::milliseconds(0)}, seed);
    expectCompleteTour(tour, problem);
}

TEST(ConstructionTest, ZeroAlphaRestrictsToGreedyTies) {
    // alpha = 0 keeps exactly the arcs with the smallest bound increase
    const Problem problem = createRandomProblem(9, 4);
    uint64_t seed_tie_break = 5;
    uint64_t seed_adaptive = 5;
    const TourState tie_break = atsp::GreedyConstructionRandomTieBreak(problem, seed_tie_break);
    const TourState adaptive = atsp::GreedyRandomizedAdaptiveConstruction(problem, 0.0, seed_adaptive);
    EXPECT_EQ(tie_break.get_order(), adaptive.get_order());
    EXPECT_EQ(seed_tie_break, seed_adaptive);
}

TEST(ConstructionTest, WideBeamSearchIsExact) {
    // a beam wider than any level of the search tree keeps every partial tour
    for (uint64_t seed = 0; seed < 5; ++seed) {
        const Problem problem = createRandomProblem(7, 100 + seed);
        const TourState tour = atsp::BeamSearch(problem, 1000);
        expectCompleteTour(tour, problem);
        EXPECT_DOUBLE_EQ(tour.get_distance(), bruteForceOptimum(problem));
    }
}

TEST(LocalSearchTest, BestImprovementNeverWorsens) {
    const Problem problem = createRandomProblem(12, 6);
    uint64_t seed = 7;
    TourState tour = atsp::RandomConstruction(problem, seed);
    const atsp::length_t initial = tour.get_distance();

    const auto num_moves = atsp::LocalSearchBest(tour, atsp::ThreeOptEngine{});
    expectCompleteTour(tour, problem);
    EXPECT_LE(tour.get_distance(), initial);
    if (num_moves > 0) {
        EXPECT_LT(tour.get_distance(), initial);
    }
}

TEST(LocalSearchTest, MoveLimitIsRespected) {
    const Problem problem = createRandomProblem(15, 8);
    uint64_t seed = 9;
    TourState tour = atsp::RandomConstruction(problem, seed);

    EXPECT_LE(atsp::LocalSearchBest(tour, atsp::ShiftInsertEngine{}, 2), 2u);
    EXPECT_LE(atsp::LocalSearchFirst(tour, atsp::ThreeOptEngine{}, seed, 3), 3u);
    EXPECT_EQ(atsp::LocalSearchBest(tour, atsp::ThreeOptEngine{}, 0), 0u);
    expectCompleteTour(tour, problem);
}

TEST(LocalSearchTest, CombinedEnginesReachJointLocalOptimum) {
    const Problem problem = createRandomProblem(11, 10);
    uint64_t seed = 11;
    TourState tour = atsp::RandomConstruction(problem, seed);

    const atsp::ThreeOptEngine three_opt{};
    const atsp::ShiftInsertEngine shift_insert{};
    while (atsp::LocalSearchFirst(tour, three_opt, seed) + atsp::LocalSearchFirst(tour, shift_insert, seed) > 0) {
    }

    for (const auto &move: three_opt.local_moves(tour)) {
        EXPECT_LE(three_opt.objective_delta_of(tour, move), atsp::ImprovementThreshold(tour));
    }
    for (const auto &move: shift_insert.local_moves(tour)) {
        EXPECT_LE(shift_insert.objective_delta_of(tour, move), atsp::ImprovementThreshold(tour));
    }
    expectCompleteTour(tour, problem);
}

TEST(LocalSearchTest, AntColonyNeverWorsens) {
    const Problem problem = createRandomProblem(10, 12);
    TourState tour = atsp::GreedyConstruction(problem);
    const atsp::length_t initial = tour.get_distance();

    atsp::AntColonyEngine engine{problem, {.num_ants = 16}};
    uint64_t seed = 13;
    atsp::RunAntColony(tour, engine, 5, seed);

    expectCompleteTour(tour, problem);
    EXPECT_LE(tour.get_distance(), initial);
}

// Costs of a few million with fractional parts, where equally long reconnections must compare equal.
static Problem createLargeCostProblem(const size_t n, const uint64_t seed) {
    std::mt19937_64 rng{seed};
    const double bases[] = {1e6, 1e6 + 0.5, 3e6 + 0.25};
    std::uniform_int_distribution<int> pick_base(0, 2);
    std::uniform_int_distribution<int> pick_step(0, 7);
    std::vector<cost_t> matrix(n * n, 0);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (i != j) {
                matrix[i * n + j] = static_cast<cost_t>(bases[pick_base(rng)] + 0.125 * pick_step(rng));
            }
        }
    }
    return Problem::FromDistanceMatrix(n, matrix);
}

// Applies one best-improvement move at a time and checks every step shortens the tour by exactly its delta.
template<typename Engine>
static void expectExactDescent(TourState &tour, const Engine &engine, const Problem &problem) {
    constexpr uint64_t max_moves = 1000;
    uint64_t num_moves = 0;
    while (num_moves < max_moves) {
        const atsp::length_t before = tour.get_distance();
        if (atsp::LocalSearchBest(tour, engine, 1) == 0) {
            break;
        }
        ++num_moves;
        ASSERT_LT(tour.get_distance(), before);
        ASSERT_EQ(tour.get_distance(), atsp::ComputeTourCost(tour.get_order(), problem));
    }
    EXPECT_LT(num_moves, max_moves) << "local search did not converge";
    for (const auto &move: engine.local_moves(tour)) {
        EXPECT_LE(engine.objective_delta_of(tour, move), atsp::ImprovementThreshold(tour));
    }
}

TEST(LocalSearchTest, LargeCostsConverge) {
    const atsp::ThreeOptEngine three_opt{};
    const atsp::ShiftInsertEngine shift_insert{};
    for (uint64_t trial = 0; trial < 300; ++trial) {
        SCOPED_TRACE("trial = " + std::to_string(trial));
        const Problem problem = createLargeCostProblem(7, trial);
        uint64_t seed = trial;
        const TourState start = atsp::RandomConstruction(problem, seed);
        ASSERT_EQ(start.get_distance(), atsp::ComputeTourCost(start.get_order(), problem));

        TourState tour = start;
        expectExactDescent(tour, three_opt, problem);
        tour = start;
        expectExactDescent(tour, shift_insert, problem);

        tour = start;
        atsp::LocalSearchFirst(tour, three_opt, seed);
        EXPECT_EQ(tour.get_distance(), atsp::ComputeTourCost(tour.get_order(), problem));
    }
}

TEST(ConstructionTest, RandomTieBreakSpreadsOverEqualArcs) {
    // every arc costs the same, so every remaining city is a tie at every step
    const Problem problem = Problem::FromDistanceMatrix(5, std::vector<cost_t>(25, 0.1f));
    std::vector<int> second_city_counts(5, 0);
    uint64_t seed = 8;
    for (int run = 0; run < 200; ++run) {
        const TourState tour = atsp::GreedyConstructionRandomTieBreak(problem, seed);
        ++second_city_counts[tour.get_order()[1]];
    }
    EXPECT_EQ(second_city_counts[0], 0);
    for (node_cost_idx city = 1; city < 5; ++city) {
        EXPECT_GT(second_city_counts[city], 0) << "city " << city << " was never picked first";
    }
}
