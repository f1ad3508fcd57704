#include <atsp/problem.h>
#include <atsp/tour_state.h>

#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>

namespace atsp {
    namespace {
        /// Ranks every city other than `city` by ascending cost. Ties keep index order.
        template<typename CostOf>
        void RankNeighbors(std::vector<node_cost_idx> &ranking, const size_t num_nodes,
                           const node_cost_idx city, CostOf &&cost_of) {
            const auto row = ranking.begin() + city * (num_nodes - 1);
            auto it = row;
            for (node_cost_idx other = 0; other < static_cast<node_cost_idx>(num_nodes); ++other) {
                if (other != city) {
                    *it++ = other;
                }
            }
            std::stable_sort(row, it, [&](const node_cost_idx a, const node_cost_idx b) {
                return cost_of(a) < cost_of(b);
            });
        }
    }

    Problem::Problem(CostMatrix &&cost_matrix)
        : cost_matrix(std::move(cost_matrix)) {
        const size_t n = dimension();
        if (n < 2) {
            return;
        }
        shortest_out.resize(n * (n - 1));
        shortest_in.resize(n * (n - 1));

        length_t raw_lower_bound = 0;
        for (node_cost_idx i = 0; i < static_cast<node_cost_idx>(n); ++i) {
            RankNeighbors(shortest_out, n, i, [&](const node_cost_idx j) { return get_cost(i, j); });
            RankNeighbors(shortest_in, n, i, [&](const node_cost_idx j) { return get_cost(j, i); });
            raw_lower_bound += get_cost(i, ranked_out(i).front());
            raw_lower_bound += get_cost(ranked_in(i).front(), i);
        }
        empty_tour_lower_bound = raw_lower_bound / 2;
    }

    Problem Problem::FromDistanceMatrix(const size_t dimension, const std::vector<cost_t> &matrix) {
        if (matrix.size() != dimension * dimension) {
            throw std::invalid_argument("distance matrix holds " + std::to_string(matrix.size())
                                        + " entries, expected " + std::to_string(dimension * dimension));
        }
        return FromDistanceMatrix(dimension, matrix.data());
    }

    Problem Problem::FromDistanceMatrix(const size_t dimension, const cost_t *matrix) {
        if (dimension == 0) {
            throw std::invalid_argument("a problem needs at least one city");
        }
        if (matrix == nullptr) {
            throw std::invalid_argument("distance matrix is null");
        }

        CostMatrix mat{dimension};
        for (node_cost_idx i = 0; i < static_cast<node_cost_idx>(dimension); ++i) {
            for (node_cost_idx j = 0; j < static_cast<node_cost_idx>(dimension); ++j) {
                if (i == j) {
                    // a city is never adjacent to itself
                    mat.set_cost(i, j, 0);
                    continue;
                }
                const cost_t cost = matrix[i * dimension + j];
                if (!std::isfinite(cost) || cost < 0) {
                    throw std::invalid_argument("invalid cost from city " + std::to_string(i)
                                                + " to city " + std::to_string(j));
                }
                mat.set_cost(i, j, cost);
            }
        }
        return Problem{std::move(mat)};
    }

    TourState Problem::empty_tour() const {
        return TourState{*this};
    }

    length_t ComputeTourCost(const std::vector<node_cost_idx> &tour, const Problem &problem) {
        length_t cost = 0;
        for (size_t i = 0; i < tour.size(); ++i) {
            const node_cost_idx from_id = tour[i];
            const node_cost_idx to_id = tour[(i + 1) % tour.size()];
            cost += problem.get_cost(from_id, to_id);
        }
        return cost;
    }

    void PrintProblem(const Problem &problem, std::ostream &out) {
        const auto printHeader = [&] {
            out << "+";
            for (size_t i = 0; i < problem.dimension(); ++i) {
                out << "------"; // allow 5 chars per number
            }
            out << "+" << std::endl;
        };
        printHeader();
        for (node_cost_idx i = 0; i < static_cast<node_cost_idx>(problem.dimension()); ++i) {
            out << "|";
            for (node_cost_idx j = 0; j < static_cast<node_cost_idx>(problem.dimension()); ++j) {
                out << std::fixed << std::setprecision(1) << std::setw(5)
                        << problem.get_cost(i, j) << " ";
            }
            out << "|" << std::endl;
        }
        printHeader();
    }
}
