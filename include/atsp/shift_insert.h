#pragma once

#include <atsp/sparse_permutation.h>
#include <atsp/tour_state.h>

#include <optional>
#include <vector>

namespace atsp {
    /// Relocates the city at tour position city_idx to just before the city at position dest_idx.
    struct shift_insert_t {
        node_tour_idx city_idx = -1;
        node_tour_idx dest_idx = -1;

        bool operator==(const shift_insert_t &other) const {
            return city_idx == other.city_idx && dest_idx == other.dest_idx;
        }
    };

    /**
     * Single-city relocation (Or-opt of length one) on complete tours.
     * Positions wrap around the tour. A destination equal to the city's own position or either
     * neighbouring position is not a move. After a move the tour is rotated back to start at the anchor.
     */
    class ShiftInsertEngine {
    public:
        [[nodiscard]] static bool IsValidMove(size_t num_cities, const shift_insert_t &move);

        /// All n * (n - 3) valid moves by ascending (city_idx, dest_idx).
        /// @throws std::logic_error if the tour is not feasible
        [[nodiscard]] std::vector<shift_insert_t> local_moves(const TourState &tour) const;

        [[nodiscard]] RandomizedMoves<shift_insert_t> randomized_local_moves(const TourState &tour, uint64_t &seed) const;

        /// A single random valid move; repeated calls may return the same move.
        [[nodiscard]] std::optional<shift_insert_t> random_local_move(const TourState &tour, uint64_t &seed) const;

        /// Returns by how much the move shortens the tour, from the six edges it touches.
        /// @throws std::invalid_argument if the move is not valid on this tour
        [[nodiscard]] length_t objective_delta_of(const TourState &tour, const shift_insert_t &move) const;

        void apply_move(TourState &tour, const shift_insert_t &move) const;
    };
}
