#pragma once

#include <libatsp.h>

#include <algorithm>
#include <cstddef>
#include <iosfwd>
#include <limits>
#include <memory>
#include <span>
#include <vector>

#ifndef WIN32
#define ATSP_FORCE_INLINE __attribute__((always_inline)) inline
#else
#define ATSP_FORCE_INLINE inline __forceinline
#endif

namespace atsp {
    /// Represents an index into the cost array where a particular city is located
    typedef std::ptrdiff_t node_cost_idx;

    /// Represents an index into the tour array where a particular city is located
    typedef std::ptrdiff_t node_tour_idx;

    /// Represents a position inside one of a city's neighbor rankings
    typedef std::ptrdiff_t node_rank_idx;

    /// Sums of edge costs: tour lengths, lower bounds and move deltas. Three float costs add up
    /// exactly in a double, so equally long reconnections compare equal.
    typedef double length_t;

    constexpr cost_t COST_POSITIVE_INFINITY = std::numeric_limits<cost_t>::infinity();

    /// Every tour starts at, and closes back to, this city.
    constexpr node_cost_idx ANCHOR_CITY = 0;

    class TourState;

    class CostMatrix {
        std::unique_ptr<cost_t[]> distances;

    public:
        size_t num_nodes;

        explicit CostMatrix(const size_t num_nodes)
            : distances(std::make_unique<cost_t[]>(num_nodes * num_nodes)),
              num_nodes(num_nodes) {
            std::fill_n(distances.get(), num_nodes * num_nodes, COST_POSITIVE_INFINITY);
        }

        CostMatrix(const CostMatrix &) = delete;

        CostMatrix &operator=(const CostMatrix &) = delete;

        CostMatrix(CostMatrix &&other) noexcept
            : distances(std::move(other.distances)),
              num_nodes(other.num_nodes) {
            other.num_nodes = 0;
        }

        CostMatrix &operator=(CostMatrix &&other) noexcept {
            distances = std::move(other.distances);
            num_nodes = other.num_nodes;
            other.num_nodes = 0;
            return *this;
        }

        [[nodiscard]] ATSP_FORCE_INLINE cost_t get_cost(const node_cost_idx from, const node_cost_idx to) const {
            return distances[from * num_nodes + to];
        }

        ATSP_FORCE_INLINE void set_cost(const node_cost_idx from, const node_cost_idx to, const cost_t cost) {
            distances[from * num_nodes + to] = cost;
        }
    };

    /**
     * An immutable asymmetric TSP instance: the distance matrix plus, for every city,
     * the other cities ranked by ascending outgoing and incoming distance.
     *
     * Tours hold a pointer to the problem they were created from, so a Problem must
     * neither move nor be destroyed while any of its tours is alive.
     */
    class Problem {
        CostMatrix cost_matrix;

        /// Row i holds the (dimension - 1) cities other than i, by ascending cost(i, .)
        std::vector<node_cost_idx> shortest_out;

        /// Row i holds the (dimension - 1) cities other than i, by ascending cost(., i)
        std::vector<node_cost_idx> shortest_in;

        length_t empty_tour_lower_bound{};

        explicit Problem(CostMatrix &&cost_matrix);

    public:
        Problem(Problem &&) noexcept = default;

        Problem &operator=(Problem &&) noexcept = default;

        /**
         * Builds a problem from a row-major dimension x dimension matrix.
         * The diagonal is ignored.
         * @throws std::invalid_argument if the dimension is zero, the matrix has the wrong size,
         *         or an off-diagonal cost is negative or not finite
         */
        [[nodiscard]] static Problem FromDistanceMatrix(size_t dimension, const std::vector<cost_t> &matrix);

        [[nodiscard]] static Problem FromDistanceMatrix(size_t dimension, const cost_t *matrix);

        [[nodiscard]] size_t dimension() const {
            return cost_matrix.num_nodes;
        }

        [[nodiscard]] ATSP_FORCE_INLINE cost_t get_cost(const node_cost_idx from, const node_cost_idx to) const {
            return cost_matrix.get_cost(from, to);
        }

        [[nodiscard]] std::span<const node_cost_idx> ranked_out(const node_cost_idx city) const {
            const size_t width = dimension() - 1;
            return {shortest_out.data() + city * width, width};
        }

        [[nodiscard]] std::span<const node_cost_idx> ranked_in(const node_cost_idx city) const {
            const size_t width = dimension() - 1;
            return {shortest_in.data() + city * width, width};
        }

        /// The assignment relaxation over all cities: half the sum of every city's cheapest
        /// outgoing and cheapest incoming edge.
        [[nodiscard]] length_t lower_bound_at_empty_tour() const {
            return empty_tour_lower_bound;
        }

        /// A tour holding only the anchor city.
        [[nodiscard]] TourState empty_tour() const;
    };

    [[nodiscard]] length_t ComputeTourCost(const std::vector<node_cost_idx> &tour, const Problem &problem);

    /// Prints the distance matrix. Useful for debugging.
    void PrintProblem(const Problem &problem, std::ostream &out);
}
