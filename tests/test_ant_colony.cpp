#include <gtest/gtest.h>
#include <atsp/ant_colony.h>
#include <atsp/problem.h>
#include <atsp/solvers.h>
#include <atsp/tour_state.h>
#include <algorithm>
#include <atomic>
#include <numeric>
#include <random>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

using atsp::AntColonyEngine;
using atsp::AntColonyOptions;
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

// Helper function to find the optimal tour length by enumerating every tour.
static atsp::length_t bruteForceOptimum(const Problem &problem) {
    std::vector<node_cost_idx> order(problem.dimension());
    std::iota(order.begin(), order.end(), 0);
    atsp::length_t best = atsp::COST_POSITIVE_INFINITY;
    do {
        best = std::min(best, atsp::ComputeTourCost(order, problem));
    } while (std::next_permutation(order.begin() + 1, order.end()));
    return best;
}

static double totalPheromone(const atsp::PheromoneMatrix &pheromones) {
    double total = 0;
    const auto n = static_cast<node_cost_idx>(pheromones.dimension());
    for (node_cost_idx i = 0; i < n; ++i) {
        for (node_cost_idx j = 0; j < n; ++j) {
            total += pheromones.get_level(i, j);
        }
    }
    return total;
}

TEST(AntColonyTest, RejectsInvalidEvaporation) {
    const Problem problem = createRandomProblem(5, 1);
    EXPECT_THROW((void) AntColonyEngine(problem, AntColonyOptions{.evaporation = 0.0}), std::invalid_argument);
    EXPECT_THROW((void) AntColonyEngine(problem, AntColonyOptions{.evaporation = 1.0}), std::invalid_argument);
    EXPECT_NO_THROW((void) AntColonyEngine(problem, AntColonyOptions{.evaporation = 0.5}));
}

TEST(AntColonyTest, SampledToursAreAnchoredPermutations) {
    const Problem problem = createRandomProblem(9, 2);
    const atsp::PheromoneMatrix pheromones{problem.dimension()};
    const AntColonyOptions options{};
    std::mt19937_64 rng{5};

    std::vector<node_cost_idx> expected(problem.dimension());
    std::iota(expected.begin(), expected.end(), 0);

    for (int ant = 0; ant < 50; ++ant) {
        const auto tour = atsp::SampleAntTour(problem, pheromones, options, rng);
        ASSERT_EQ(tour.order.size(), problem.dimension());
        EXPECT_EQ(tour.order.front(), atsp::ANCHOR_CITY);
        EXPECT_TRUE(std::ranges::is_permutation(tour.order, expected));
        EXPECT_NEAR(tour.length, atsp::ComputeTourCost(tour.order, problem), 1e-3);
    }
}

TEST(AntColonyTest, RoundNeedsCompleteTour) {
    const Problem problem = createRandomProblem(5, 3);
    const AntColonyEngine engine{problem};
    const TourState tour = problem.empty_tour();
    uint64_t seed = 0;
    EXPECT_THROW((void) engine.local_moves(tour, seed), std::logic_error);
}

TEST(AntColonyTest, RoundDoesNotDependOnWorkerCount) {
    const Problem problem = createRandomProblem(12, 4);
    const TourState tour = atsp::GreedyConstruction(problem);

    const AntColonyEngine single{problem, {.num_ants = 37, .num_workers = 1}};
    const AntColonyEngine pooled{problem, {.num_ants = 37, .num_workers = 4}};

    uint64_t seed_single = 77;
    uint64_t seed_pooled = 77;
    const auto ants_single = single.local_moves(tour, seed_single);
    const auto ants_pooled = pooled.local_moves(tour, seed_pooled);

    EXPECT_EQ(seed_single, seed_pooled);
    ASSERT_EQ(ants_single.size(), 37u);
    ASSERT_EQ(ants_pooled.size(), 37u);
    for (size_t a = 0; a < ants_single.size(); ++a) {
        EXPECT_EQ(ants_single[a].order, ants_pooled[a].order);
        EXPECT_EQ(ants_single[a].length, ants_pooled[a].length);
    }
}

TEST(AntColonyTest, RoundsNeverLengthenTheTour) {
    const Problem problem = createRandomProblem(10, 5);
    uint64_t seed = 6;
    TourState tour = atsp::RandomConstruction(problem, seed);

    AntColonyEngine engine{problem, {.num_ants = 20}};
    for (int round = 0; round < 15; ++round) {
        const atsp::length_t before = tour.get_distance();
        const auto ants = engine.local_moves(tour, seed);
        const auto best = std::ranges::min_element(ants, {}, &atsp::ant_tour_t::length);
        const atsp::length_t delta = engine.objective_delta_of(tour, *best);

        engine.apply_move(tour, ants);
        EXPECT_LE(tour.get_distance(), before);
        EXPECT_DOUBLE_EQ(tour.get_distance(), std::min(before, best->length));
        EXPECT_DOUBLE_EQ(before - std::max(delta, 0.0), tour.get_distance());
        EXPECT_NEAR(tour.get_distance(), atsp::ComputeTourCost(tour.get_order(), problem), 1e-3);
        EXPECT_EQ(tour.get_order().front(), atsp::ANCHOR_CITY);
    }
}

TEST(AntColonyTest, DepositAndEvaporation) {
    const Problem problem = createRandomProblem(6, 6);
    const TourState initial = atsp::GreedyConstruction(problem);
    TourState tour = initial;

    AntColonyEngine engine{problem, {.num_ants = 4, .evaporation = 0.5, .deposit = 10.0}};
    EXPECT_DOUBLE_EQ(totalPheromone(engine.get_pheromones()), 0.0);

    uint64_t seed = 1;
    const auto ants = engine.local_moves(tour, seed);
    ASSERT_EQ(ants.size(), 4u);
    engine.apply_move(tour, ants);

    // the four ants and the current tour compete for two places, each kept tour lays
    // 10 / length on six edges, then half evaporates
    std::vector<atsp::length_t> lengths{initial.get_distance()};
    for (const auto &ant: ants) {
        lengths.push_back(ant.length);
    }
    std::ranges::sort(lengths);
    const double expected = 0.5 * 6 * (10.0 / lengths[0] + 10.0 / lengths[1]);
    EXPECT_NEAR(totalPheromone(engine.get_pheromones()), expected, 1e-9);
    EXPECT_DOUBLE_EQ(tour.get_distance(), lengths[0]);
}

TEST(AntColonyTest, SingleAntCompetesWithCurrentTour) {
    const Problem problem = createRandomProblem(6, 8);
    const TourState initial = atsp::GreedyConstruction(problem);
    TourState tour = initial;

    AntColonyEngine engine{problem, {.num_ants = 1, .evaporation = 0.5, .deposit = 10.0}};
    uint64_t seed = 4;
    const auto ants = engine.local_moves(tour, seed);
    ASSERT_EQ(ants.size(), 1u);
    engine.apply_move(tour, ants);

    // only the shorter of the two is reinforced
    const atsp::length_t kept = std::min(ants[0].length, initial.get_distance());
    EXPECT_NEAR(totalPheromone(engine.get_pheromones()), 0.5 * 6 * 10.0 / kept, 1e-9);
    EXPECT_DOUBLE_EQ(tour.get_distance(), kept);
}

TEST(AntColonyTest, WorkersRunInlineWhenThreadsAreRefused) {
    std::vector<std::atomic<int>> runs(6);
    size_t started = 0;
    const auto start_two = [&started](auto &&task) {
        if (started == 2) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        ++started;
        return std::thread(std::forward<decltype(task)>(task));
    };

    atsp::RunWorkers(6, [&runs](const size_t worker) { ++runs[worker]; }, start_two);
    for (const auto &count: runs) {
        EXPECT_EQ(count.load(), 1);
    }
}

TEST(AntColonyTest, WorkerFailureJoinsStartedThreads) {
    std::atomic<int> finished{0};
    size_t started = 0;
    const auto start_three = [&started](auto &&task) {
        if (started == 3) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        ++started;
        return std::thread(std::forward<decltype(task)>(task));
    };
    const auto work = [&finished](const size_t worker) {
        if (worker == 3) {
            throw std::runtime_error("worker 3 failed");
        }
        ++finished;
    };

    EXPECT_THROW(atsp::RunWorkers(5, work, start_three), std::runtime_error);
    // the three started workers finished before the exception left
    EXPECT_EQ(finished.load(), 3);
}

TEST(AntColonyTest, RandomizedMovesHoldTheWholeRound) {
    const Problem problem = createRandomProblem(6, 7);
    const TourState tour = atsp::GreedyConstruction(problem);
    const AntColonyEngine engine{problem, {.num_ants = 8}};

    uint64_t seed = 2;
    auto moves = engine.randomized_local_moves(tour, seed);
    EXPECT_EQ(moves.count_left(), 8u);
    size_t count = 0;
    while (const auto ant = moves.next()) {
        EXPECT_EQ(ant->order.size(), problem.dimension());
        ++count;
    }
    EXPECT_EQ(count, 8u);
}

TEST(AntColonyTest, FindsCheapCycle) {
    // 0 -> 3 -> 1 -> 5 -> 2 -> 4 -> 0 costs 1 per edge, every other edge costs 50
    const std::vector<node_cost_idx> cycle{0, 3, 1, 5, 2, 4};
    std::vector<cost_t> matrix(36, 50);
    for (size_t i = 0; i < cycle.size(); ++i) {
        matrix[cycle[i] * 6 + cycle[(i + 1) % cycle.size()]] = 1;
    }
    const Problem problem = Problem::FromDistanceMatrix(6, matrix);

    TourState tour = problem.empty_tour();
    for (node_cost_idx city = 1; city < 6; ++city) {
        tour.add({tour.last_city(), city});
    }

    AntColonyEngine engine{problem, {.num_ants = 50}};
    uint64_t seed = 3;
    atsp::RunAntColony(tour, engine, 10, seed);

    EXPECT_DOUBLE_EQ(tour.get_distance(), 6.0f);
    EXPECT_DOUBLE_EQ(tour.get_distance(), bruteForceOptimum(problem));
    EXPECT_EQ(tour.get_order(), cycle);
}
