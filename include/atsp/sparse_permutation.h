#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <unordered_map>
#include <utility>
#include <vector>

namespace atsp {
    /**
     * Yields a uniformly random permutation of [0, n) one element at a time.
     *
     * This is a Fisher-Yates shuffle run backwards over a virtual identity array. Only the
     * entries displaced so far are stored, so memory grows with the number of elements drawn
     * instead of with n. The sequence is consumed as it is read and cannot be restarted.
     */
    class SparsePermutation {
        std::unordered_map<size_t, size_t> displaced{};
        size_t num_left;
        std::mt19937_64 rng;

    public:
        /// Seeds the generator from `seed` and advances `seed` for the caller's next draw.
        SparsePermutation(size_t n, uint64_t &seed);

        /// The next element, or nullopt once all n have been produced.
        [[nodiscard]] std::optional<size_t> next();

        [[nodiscard]] size_t count_left() const {
            return num_left;
        }
    };

    /// Walks a materialized move list in the order of a SparsePermutation over its indices.
    template<typename Move>
    class RandomizedMoves {
        std::vector<Move> moves;
        SparsePermutation permutation;

    public:
        RandomizedMoves(std::vector<Move> moves, uint64_t &seed)
            : moves(std::move(moves)), permutation(this->moves.size(), seed) {
        }

        [[nodiscard]] std::optional<Move> next() {
            if (const auto idx = permutation.next()) {
                return moves[*idx];
            }
            return std::nullopt;
        }

        [[nodiscard]] size_t count_left() const {
            return permutation.count_left();
        }
    };
}
