#include <atsp/three_opt.h>

#include <algorithm>
#include <random>
#include <stdexcept>

namespace atsp {
    bool ThreeOptEngine::IsValidMove(const size_t num_cities, const three_opt_t &move) {
        return move.i >= 0 && move.j >= move.i + 2 && move.k >= move.j + 2
               && move.k < static_cast<node_tour_idx>(num_cities);
    }

    std::vector<three_opt_t> ThreeOptEngine::local_moves(const TourState &tour) const {
        tour.CheckFeasible();
        const auto n = static_cast<node_tour_idx>(tour.order.size());

        std::vector<three_opt_t> moves{};
        for (node_tour_idx i = 0; i + 4 < n; ++i) {
            for (node_tour_idx j = i + 2; j + 2 < n; ++j) {
                for (node_tour_idx k = j + 2; k < n; ++k) {
                    moves.push_back({i, j, k});
                }
            }
        }
        return moves;
    }

    RandomizedMoves<three_opt_t> ThreeOptEngine::randomized_local_moves(const TourState &tour, uint64_t &seed) const {
        return {local_moves(tour), seed};
    }

    std::optional<three_opt_t> ThreeOptEngine::random_local_move(const TourState &tour, uint64_t &seed) const {
        tour.CheckFeasible();
        const auto n = static_cast<node_tour_idx>(tour.order.size());
        if (n < 5) {
            return std::nullopt;
        }

        std::mt19937_64 rng(seed);
        // draw cut points by position so that each (i, j, k) stays reachable
        const node_tour_idx i = std::uniform_int_distribution<node_tour_idx>(0, n - 5)(rng);
        const node_tour_idx j = std::uniform_int_distribution<node_tour_idx>(i + 2, n - 3)(rng);
        const node_tour_idx k = std::uniform_int_distribution<node_tour_idx>(j + 2, n - 1)(rng);
        seed = rng();
        return three_opt_t{i, j, k};
    }

    length_t ThreeOptEngine::objective_delta_of(const TourState &tour, const three_opt_t &move) const {
        const auto &order = tour.order;
        const auto &problem = *tour.problem;
        const size_t n = order.size();
        if (!IsValidMove(n, move)) {
            throw std::invalid_argument("invalid three-opt cut points");
        }

        const node_cost_idx x1 = order[move.i];
        const node_cost_idx x2 = order[move.i + 1];
        const node_cost_idx y1 = order[move.j];
        const node_cost_idx y2 = order[move.j + 1];
        const node_cost_idx z1 = order[move.k];
        const node_cost_idx z2 = order[(move.k + 1) % n];

        // Costs of the old edges that will be removed:
        const length_t removed = static_cast<length_t>(problem.get_cost(x1, x2))
                                 + problem.get_cost(y1, y2)
                                 + problem.get_cost(z1, z2);

        // Costs of the new edges that will be added:
        const length_t added = static_cast<length_t>(problem.get_cost(x1, y2))
                               + problem.get_cost(y1, z2)
                               + problem.get_cost(z1, x2);

        return removed - added;
    }

    void ThreeOptEngine::apply_move(TourState &tour, const three_opt_t &move) const {
        tour.CheckFeasible();
        const length_t delta = objective_delta_of(tour, move);

        // [i+1..j] [j+1..k] -> [j+1..k] [i+1..j]
        auto &order = tour.order;
        std::rotate(order.begin() + move.i + 1, order.begin() + move.j + 1, order.begin() + move.k + 1);

        tour.CommitInPlaceMove(delta);
    }
}
