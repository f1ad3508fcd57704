#pragma once

#include <atsp/sparse_permutation.h>
#include <atsp/tour_state.h>

#include <optional>
#include <vector>

namespace atsp {
    /**
     * Describes a three-opt segment exchange with cut points i < j < k.
     * The tour [0..i] [i+1..j] [j+1..k] [k+1..] becomes [0..i] [j+1..k] [i+1..j] [k+1..]:
     * the two middle segments swap places and keep their orientation, so no edge is reversed.
     */
    struct three_opt_t {
        node_tour_idx i = -1;
        node_tour_idx j = -1;
        node_tour_idx k = -1;

        bool operator==(const three_opt_t &other) const {
            return i == other.i && j == other.j && k == other.k;
        }
    };

    /**
     * Three-opt segment exchange on complete tours. Moves are cut triples with
     * j >= i + 2, k >= j + 2 and k < n, so every moved segment holds at least two cities.
     */
    class ThreeOptEngine {
    public:
        [[nodiscard]] static bool IsValidMove(size_t num_cities, const three_opt_t &move);

        /// Every move in lexicographic (i, j, k) order. Empty for tours of fewer than five cities.
        /// @throws std::logic_error if the tour is not feasible
        [[nodiscard]] std::vector<three_opt_t> local_moves(const TourState &tour) const;

        /// The same moves as local_moves, drawn in uniformly random order.
        [[nodiscard]] RandomizedMoves<three_opt_t> randomized_local_moves(const TourState &tour, uint64_t &seed) const;

        /// A single random move; repeated calls may return the same move.
        [[nodiscard]] std::optional<three_opt_t> random_local_move(const TourState &tour, uint64_t &seed) const;

        /**
         * Returns by how much the move shortens the tour (removed minus added edge costs).
         * @throws std::invalid_argument if the cut points do not describe a move on this tour
         */
        [[nodiscard]] length_t objective_delta_of(const TourState &tour, const three_opt_t &move) const;

        /// Swaps the two middle segments and updates the tour length in O(n).
        void apply_move(TourState &tour, const three_opt_t &move) const;
    };
}
