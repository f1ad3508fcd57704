#include <atsp/shift_insert.h>

#include <algorithm>
#include <random>
#include <stdexcept>

namespace atsp {
    namespace {
        [[nodiscard]] ATSP_FORCE_INLINE node_tour_idx Wrap(const node_tour_idx idx, const node_tour_idx n) {
            return (idx % n + n) % n;
        }
    }

    bool ShiftInsertEngine::IsValidMove(const size_t num_cities, const shift_insert_t &move) {
        const auto n = static_cast<node_tour_idx>(num_cities);
        if (move.city_idx < 0 || move.city_idx >= n || move.dest_idx < 0 || move.dest_idx >= n) {
            return false;
        }
        return move.dest_idx != move.city_idx
               && move.dest_idx != Wrap(move.city_idx + 1, n)
               && move.dest_idx != Wrap(move.city_idx - 1, n);
    }

    std::vector<shift_insert_t> ShiftInsertEngine::local_moves(const TourState &tour) const {
        tour.CheckFeasible();
        const size_t n = tour.order.size();

        std::vector<shift_insert_t> moves{};
        for (node_tour_idx city_idx = 0; city_idx < static_cast<node_tour_idx>(n); ++city_idx) {
            for (node_tour_idx dest_idx = 0; dest_idx < static_cast<node_tour_idx>(n); ++dest_idx) {
                if (const shift_insert_t move{city_idx, dest_idx}; IsValidMove(n, move)) {
                    moves.push_back(move);
                }
            }
        }
        return moves;
    }

    RandomizedMoves<shift_insert_t> ShiftInsertEngine::randomized_local_moves(const TourState &tour,
                                                                             uint64_t &seed) const {
        return {local_moves(tour), seed};
    }

    std::optional<shift_insert_t> ShiftInsertEngine::random_local_move(const TourState &tour, uint64_t &seed) const {
        tour.CheckFeasible();
        const auto n = static_cast<node_tour_idx>(tour.order.size());
        if (n < 4) {
            return std::nullopt;
        }

        std::mt19937_64 rng(seed);
        const node_tour_idx city_idx = std::uniform_int_distribution<node_tour_idx>(0, n - 1)(rng);
        // skip the city itself and its successor, then land anywhere but the predecessor
        const node_tour_idx offset = std::uniform_int_distribution<node_tour_idx>(2, n - 2)(rng);
        seed = rng();
        return shift_insert_t{city_idx, Wrap(city_idx + offset, n)};
    }

    length_t ShiftInsertEngine::objective_delta_of(const TourState &tour, const shift_insert_t &move) const {
        const auto &order = tour.order;
        const auto &problem = *tour.problem;
        const auto n = static_cast<node_tour_idx>(order.size());
        if (!IsValidMove(order.size(), move)) {
            throw std::invalid_argument("invalid shift-insert move");
        }

        const node_cost_idx city = order[move.city_idx];
        const node_cost_idx prev_city = order[Wrap(move.city_idx - 1, n)];
        const node_cost_idx next_city = order[Wrap(move.city_idx + 1, n)];
        const node_cost_idx dest = order[move.dest_idx];
        const node_cost_idx prev_dest = order[Wrap(move.dest_idx - 1, n)];

        const length_t removed = static_cast<length_t>(problem.get_cost(prev_city, city))
                                 + problem.get_cost(city, next_city)
                                 + problem.get_cost(prev_dest, dest);

        const length_t added = static_cast<length_t>(problem.get_cost(prev_city, next_city))
                               + problem.get_cost(city, dest)
                               + problem.get_cost(prev_dest, city);

        return removed - added;
    }

    void ShiftInsertEngine::apply_move(TourState &tour, const shift_insert_t &move) const {
        tour.CheckFeasible();
        const length_t delta = objective_delta_of(tour, move);

        auto &order = tour.order;
        const node_cost_idx city = order[move.city_idx];
        order.erase(order.begin() + move.city_idx);
        const node_tour_idx insert_idx = move.dest_idx > move.city_idx ? move.dest_idx - 1 : move.dest_idx;
        order.insert(order.begin() + insert_idx, city);

        // moving the anchor, or inserting in front of it, shifts the start of the tour
        if (order.front() != ANCHOR_CITY) {
            std::rotate(order.begin(), std::ranges::find(order, ANCHOR_CITY), order.end());
        }

        tour.CommitInPlaceMove(delta);
    }
}
