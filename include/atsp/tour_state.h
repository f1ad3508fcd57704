#pragma once

#include <atsp/problem.h>

#include <iosfwd>
#include <optional>
#include <vector>

namespace atsp {
    /// A directed edge (source, dest) extending a tour.
    struct arc_t {
        node_cost_idx source = -1;
        node_cost_idx dest = -1;

        bool operator==(const arc_t &other) const {
            return source == other.source && dest == other.dest;
        }

        bool operator!=(const arc_t &other) const {
            return !(*this == other);
        }
    };

    /**
     * A partial or complete tour anchored at ANCHOR_CITY, paired with its exact length and the
     * assignment lower bound on any completion of it.
     *
     * The bound counts every committed edge in full, plus half of the cheapest valid edge of
     * every still open slot:
     *  - out-slots: each remaining city (targets: other remaining cities or the anchor) and,
     *    while cities remain, the last city (targets: remaining cities);
     *  - in-slots: each remaining city (sources: other remaining cities or the last city) and,
     *    while cities remain, the anchor (sources: remaining cities).
     *
     * The cheapest valid neighbour of each slot is tracked by a cursor into the city's ranking.
     * Valid sets only shrink as cities are added, so cursors only move forward. Each city is also
     * listed as a watcher of the neighbour its cursor points at, so an add only revisits the
     * cities whose cursor was invalidated by it.
     *
     * Once feasible, every slot is committed and the bound equals the tour length.
     */
    class TourState {
        friend class Problem;
        friend class ThreeOptEngine;
        friend class ShiftInsertEngine;
        friend class AntColonyEngine;

        const Problem *problem;

        std::vector<node_cost_idx> order;
        std::vector<char> remaining;
        size_t num_remaining;

        length_t distance{};
        length_t bound{};

        std::vector<node_rank_idx> out_cursor;
        std::vector<node_rank_idx> in_cursor;

        /// out_watchers[x] lists the cities whose out cursor was moved onto x. Entries go stale
        /// when the cursor moves on and are filtered when the list is consumed.
        std::vector<std::vector<node_cost_idx>> out_watchers;
        std::vector<std::vector<node_cost_idx>> in_watchers;

        explicit TourState(const Problem &problem);

        template<typename Cursors>
        [[nodiscard]] length_t RepairBound(const arc_t &arc, Cursors &cursors) const;

        void CheckAddable(const arc_t &arc) const;

        /// Commits a complete order produced by a local move engine.
        void ReplaceOrder(std::vector<node_cost_idx> new_order, length_t new_distance);

        /// Records that a local move edited `order` in place and shortened the tour by `improvement`.
        void CommitInPlaceMove(length_t improvement);

        void CheckFeasible() const;

    public:
        [[nodiscard]] const Problem &get_problem() const {
            return *problem;
        }

        /// Cities in visiting order, starting at ANCHOR_CITY.
        [[nodiscard]] const std::vector<node_cost_idx> &get_order() const {
            return order;
        }

        [[nodiscard]] node_cost_idx last_city() const {
            return order.back();
        }

        [[nodiscard]] bool is_remaining(const node_cost_idx city) const {
            return remaining[city] != 0;
        }

        [[nodiscard]] size_t count_remaining() const {
            return num_remaining;
        }

        /// Length of the path so far, including the closing edge once feasible.
        [[nodiscard]] length_t get_distance() const {
            return distance;
        }

        [[nodiscard]] length_t lower_bound() const {
            return bound;
        }

        [[nodiscard]] node_rank_idx get_out_cursor(const node_cost_idx city) const {
            return out_cursor[city];
        }

        [[nodiscard]] node_rank_idx get_in_cursor(const node_cost_idx city) const {
            return in_cursor[city];
        }

        [[nodiscard]] bool is_feasible() const {
            return num_remaining == 0;
        }

        /// The tour length, or nullopt while cities remain.
        [[nodiscard]] std::optional<length_t> exact_length() const {
            if (!is_feasible()) {
                return std::nullopt;
            }
            return distance;
        }

        /// One arc from the last city to each remaining city, by ascending city index.
        [[nodiscard]] std::vector<arc_t> addable_arcs() const;

        /// The arcs already committed to the tour, in visiting order. The closing arc is not listed.
        [[nodiscard]] std::vector<arc_t> components() const;

        /**
         * Returns how much the lower bound would change if arc were added.
         * Leaves the tour untouched.
         * @throws std::invalid_argument if arc does not start at the last city or its destination
         *         is not a remaining city
         */
        [[nodiscard]] length_t lower_bound_delta_of_add(const arc_t &arc) const;

        /// Returns how much the tour length grows by adding arc, closing edge included.
        [[nodiscard]] length_t objective_delta_of_add(const arc_t &arc) const;

        /**
         * Appends arc.dest to the tour, closing it back to the anchor when no city remains.
         * Invalidates previously obtained arcs and moves.
         * @throws std::invalid_argument under the same conditions as lower_bound_delta_of_add
         */
        void add(const arc_t &arc);

        /// Recomputes the assignment lower bound without using the cursors.
        [[nodiscard]] length_t compute_lower_bound_from_scratch() const;
    };

    /// Prints the tour as a path closed back to the anchor. Useful for debugging.
    void PrintTour(const TourState &tour, std::ostream &out);
}
