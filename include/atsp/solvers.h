#pragma once

#include <atsp/ant_colony.h>
#include <atsp/tour_state.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>

namespace atsp {
    /// Relative slack under which two lengths or bound deltas count as equal.
    constexpr length_t RELATIVE_TOLERANCE = 1e-9;

    /// The smallest delta that counts as an improvement of tour. Scales with the tour length.
    [[nodiscard]] inline length_t ImprovementThreshold(const TourState &tour) {
        return RELATIVE_TOLERANCE * std::max<length_t>(1, tour.get_distance());
    }

    /// Appends uniformly random remaining cities until the tour is complete.
    [[nodiscard]] TourState RandomConstruction(const Problem &problem, uint64_t &seed);

    /// Repeatedly adds the arc with the smallest lower bound increase. Ties go to the lowest city index.
    [[nodiscard]] TourState GreedyConstruction(const Problem &problem);

    /// Greedy construction that breaks ties between equally cheap arcs uniformly at random. Bound
    /// increases within RELATIVE_TOLERANCE of the lower bound count as ties.
    [[nodiscard]] TourState GreedyConstructionRandomTieBreak(const Problem &problem, uint64_t &seed);

    /**
     * Greedy randomized adaptive construction. At each step the arcs whose bound increase is within
     * min + alpha * (max - min) form the restricted candidate list, and one of them is added at random.
     * alpha = 0 is a randomized greedy, alpha = 1 a random construction.
     */
    [[nodiscard]] TourState GreedyRandomizedAdaptiveConstruction(const Problem &problem, double alpha, uint64_t &seed);

    struct GraspOptions {
        double alpha = 0.0;
        std::chrono::milliseconds time_limit{100};
    };

    /// Restarts randomized adaptive construction until the time limit expires and returns the shortest
    /// tour found. At least one tour is always built.
    [[nodiscard]] TourState Grasp(const Problem &problem, const GraspOptions &options, uint64_t &seed);

    /// Breadth-first construction keeping the beam_width partial tours with the smallest lower bound
    /// at every depth. Returns the shortest complete tour of the last level.
    [[nodiscard]] TourState BeamSearch(const Problem &problem, size_t beam_width);

    /**
     * First-improvement local search: walks the neighbourhood in random order and applies the first
     * improving move, then starts over with a fresh order. Stops at a local optimum or after max_moves.
     * @return the number of applied moves
     */
    template<typename Engine>
    uint64_t LocalSearchFirst(TourState &tour, const Engine &engine, uint64_t &seed,
                              const uint64_t max_moves = std::numeric_limits<uint64_t>::max()) {
        uint64_t num_applied = 0;
        bool improved = true;
        while (improved && num_applied < max_moves) {
            improved = false;
            auto moves = engine.randomized_local_moves(tour, seed);
            while (const auto move = moves.next()) {
                if (engine.objective_delta_of(tour, *move) > ImprovementThreshold(tour)) {
                    engine.apply_move(tour, *move);
                    ++num_applied;
                    improved = true;
                    break;
                }
            }
        }
        return num_applied;
    }

    /**
     * Best-improvement local search: applies the most improving move of the whole neighbourhood
     * until none improves or max_moves were applied.
     * @return the number of applied moves
     */
    template<typename Engine>
    uint64_t LocalSearchBest(TourState &tour, const Engine &engine,
                             const uint64_t max_moves = std::numeric_limits<uint64_t>::max()) {
        uint64_t num_applied = 0;
        while (num_applied < max_moves) {
            const auto moves = engine.local_moves(tour);
            size_t best_move = moves.size();
            length_t best_delta = ImprovementThreshold(tour);
            for (size_t m = 0; m < moves.size(); ++m) {
                if (const length_t delta = engine.objective_delta_of(tour, moves[m]); delta > best_delta) {
                    best_delta = delta;
                    best_move = m;
                }
            }
            if (best_move == moves.size()) {
                break;
            }
            engine.apply_move(tour, moves[best_move]);
            ++num_applied;
        }
        return num_applied;
    }

    /// Runs num_rounds ant-colony rounds on tour. The tour never gets longer.
    void RunAntColony(TourState &tour, AntColonyEngine &engine, uint64_t num_rounds, uint64_t &seed);
}
