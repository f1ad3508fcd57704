#include <atsp/tour_state.h>

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace atsp {
    namespace {
        /// Cursor access for add(): moves the real cursors and keeps the watcher lists in sync.
        class CommittedCursors {
            std::vector<node_rank_idx> &out_cursor;
            std::vector<node_rank_idx> &in_cursor;
            std::vector<std::vector<node_cost_idx>> &out_watchers;
            std::vector<std::vector<node_cost_idx>> &in_watchers;

        public:
            CommittedCursors(std::vector<node_rank_idx> &out_cursor, std::vector<node_rank_idx> &in_cursor,
                             std::vector<std::vector<node_cost_idx>> &out_watchers,
                             std::vector<std::vector<node_cost_idx>> &in_watchers)
                : out_cursor(out_cursor), in_cursor(in_cursor),
                  out_watchers(out_watchers), in_watchers(in_watchers) {
            }

            [[nodiscard]] node_rank_idx out(const node_cost_idx city) const {
                return out_cursor[city];
            }

            [[nodiscard]] node_rank_idx in(const node_cost_idx city) const {
                return in_cursor[city];
            }

            void move_out(const node_cost_idx city, const node_rank_idx rank, const node_cost_idx target) {
                out_cursor[city] = rank;
                out_watchers[target].push_back(city);
            }

            void move_in(const node_cost_idx city, const node_rank_idx rank, const node_cost_idx source) {
                in_cursor[city] = rank;
                in_watchers[source].push_back(city);
            }

            [[nodiscard]] const std::vector<node_cost_idx> &watching_out(const node_cost_idx target) const {
                return out_watchers[target];
            }

            [[nodiscard]] const std::vector<node_cost_idx> &watching_in(const node_cost_idx source) const {
                return in_watchers[source];
            }

            /// No cursor will ever point at `target` again.
            void retire_out(const node_cost_idx target) {
                out_watchers[target].clear();
            }

            void retire_in(const node_cost_idx source) {
                in_watchers[source].clear();
            }
        };

        /// Cursor access for lower_bound_delta_of_add(): moved cursors live in a sparse overlay.
        class ScratchCursors {
            const std::vector<node_rank_idx> &out_cursor;
            const std::vector<node_rank_idx> &in_cursor;
            const std::vector<std::vector<node_cost_idx>> &out_watchers;
            const std::vector<std::vector<node_cost_idx>> &in_watchers;
            std::unordered_map<node_cost_idx, node_rank_idx> out_overlay{};
            std::unordered_map<node_cost_idx, node_rank_idx> in_overlay{};

        public:
            ScratchCursors(const std::vector<node_rank_idx> &out_cursor, const std::vector<node_rank_idx> &in_cursor,
                           const std::vector<std::vector<node_cost_idx>> &out_watchers,
                           const std::vector<std::vector<node_cost_idx>> &in_watchers)
                : out_cursor(out_cursor), in_cursor(in_cursor),
                  out_watchers(out_watchers), in_watchers(in_watchers) {
            }

            [[nodiscard]] node_rank_idx out(const node_cost_idx city) const {
                const auto it = out_overlay.find(city);
                return it == out_overlay.end() ? out_cursor[city] : it->second;
            }

            [[nodiscard]] node_rank_idx in(const node_cost_idx city) const {
                const auto it = in_overlay.find(city);
                return it == in_overlay.end() ? in_cursor[city] : it->second;
            }

            void move_out(const node_cost_idx city, const node_rank_idx rank, node_cost_idx) {
                out_overlay[city] = rank;
            }

            void move_in(const node_cost_idx city, const node_rank_idx rank, node_cost_idx) {
                in_overlay[city] = rank;
            }

            [[nodiscard]] const std::vector<node_cost_idx> &watching_out(const node_cost_idx target) const {
                return out_watchers[target];
            }

            [[nodiscard]] const std::vector<node_cost_idx> &watching_in(const node_cost_idx source) const {
                return in_watchers[source];
            }

            void retire_out(node_cost_idx) {
            }

            void retire_in(node_cost_idx) {
            }
        };
    }

    TourState::TourState(const Problem &problem)
        : problem(&problem),
          remaining(problem.dimension(), 1),
          num_remaining(problem.dimension() - 1),
          bound(problem.lower_bound_at_empty_tour()),
          out_cursor(problem.dimension(), 0),
          in_cursor(problem.dimension(), 0),
          out_watchers(problem.dimension()),
          in_watchers(problem.dimension()) {
        const size_t n = problem.dimension();
        order.reserve(n);
        order.push_back(ANCHOR_CITY);
        remaining[ANCHOR_CITY] = 0;

        if (n < 2) {
            return;
        }
        for (node_cost_idx city = 0; city < static_cast<node_cost_idx>(n); ++city) {
            out_watchers[problem.ranked_out(city).front()].push_back(city);
            in_watchers[problem.ranked_in(city).front()].push_back(city);
        }
    }

    template<typename Cursors>
    length_t TourState::RepairBound(const arc_t &arc, Cursors &cursors) const {
        const Problem &p = *problem;
        const node_cost_idx u = arc.source;
        const node_cost_idx v = arc.dest;
        length_t lb = bound;

        const auto cost = [&](const node_cost_idx from, const node_cost_idx to) -> length_t {
            return p.get_cost(from, to);
        };

        const auto out_target = [&](const node_cost_idx city) {
            return p.ranked_out(city)[cursors.out(city)];
        };
        const auto in_source = [&](const node_cost_idx city) {
            return p.ranked_in(city)[cursors.in(city)];
        };
        // whether a city is still unvisited once arc has been added
        const auto remains = [&](const node_cost_idx city) {
            return city != v && remaining[city] != 0;
        };

        // Moves a cursor forward to the first valid neighbour, swapping the stale half edge
        // for the new one.
        const auto advance_out = [&](const node_cost_idx city, const auto &is_valid) {
            const auto ranking = p.ranked_out(city);
            node_rank_idx rank = cursors.out(city);
            if (is_valid(ranking[rank])) {
                return;
            }
            lb -= cost(city, ranking[rank]) / 2;
            do {
                ++rank;
            } while (rank < std::ssize(ranking) && !is_valid(ranking[rank]));
            if (rank == std::ssize(ranking)) {
                throw std::logic_error("no valid successor left for city " + std::to_string(city));
            }
            lb += cost(city, ranking[rank]) / 2;
            cursors.move_out(city, rank, ranking[rank]);
        };
        const auto advance_in = [&](const node_cost_idx city, const auto &is_valid) {
            const auto ranking = p.ranked_in(city);
            node_rank_idx rank = cursors.in(city);
            if (is_valid(ranking[rank])) {
                return;
            }
            lb -= cost(ranking[rank], city) / 2;
            do {
                ++rank;
            } while (rank < std::ssize(ranking) && !is_valid(ranking[rank]));
            if (rank == std::ssize(ranking)) {
                throw std::logic_error("no valid predecessor left for city " + std::to_string(city));
            }
            lb += cost(ranking[rank], city) / 2;
            cursors.move_in(city, rank, ranking[rank]);
        };

        // u's out-slot and v's in-slot are now served by the real edge
        lb -= (cost(in_source(v), v) + cost(u, out_target(u))) / 2;
        lb += cost(u, v);

        if (num_remaining == 1) {
            // v is the final city: its out-slot and the anchor's in-slot close the tour
            lb -= (cost(v, out_target(v)) + cost(in_source(ANCHOR_CITY), ANCHOR_CITY)) / 2;
            lb += cost(v, ANCHOR_CITY);
            return lb;
        }

        // v is the new last city and must continue to a remaining city
        advance_out(v, remains);

        // the anchor is entered from a remaining city
        advance_in(ANCHOR_CITY, remains);

        // u can no longer precede anyone
        const auto valid_source = [&](const node_cost_idx city) {
            return city == v || remains(city);
        };
        for (const node_cost_idx city: cursors.watching_in(u)) {
            if (remains(city) && in_source(city) == u) {
                advance_in(city, valid_source);
            }
        }
        cursors.retire_in(u);

        // v can no longer follow anyone but u
        const auto valid_target = [&](const node_cost_idx city) {
            return city == ANCHOR_CITY || remains(city);
        };
        for (const node_cost_idx city: cursors.watching_out(v)) {
            if (remains(city) && out_target(city) == v) {
                advance_out(city, valid_target);
            }
        }
        cursors.retire_out(v);

        return lb;
    }

    void TourState::CheckAddable(const arc_t &arc) const {
        const auto n = static_cast<node_cost_idx>(problem->dimension());
        if (arc.dest < 0 || arc.dest >= n) {
            throw std::invalid_argument("city " + std::to_string(arc.dest) + " is out of range");
        }
        if (arc.source != last_city()) {
            throw std::invalid_argument("arc must start at the last city " + std::to_string(last_city())
                                        + ", got " + std::to_string(arc.source));
        }
        if (!is_remaining(arc.dest)) {
            throw std::invalid_argument("city " + std::to_string(arc.dest) + " was already visited");
        }
    }

    void TourState::CheckFeasible() const {
        if (!is_feasible()) {
            throw std::logic_error("local moves need a complete tour, "
                                   + std::to_string(num_remaining) + " cities remain");
        }
    }

    std::vector<arc_t> TourState::addable_arcs() const {
        std::vector<arc_t> arcs{};
        arcs.reserve(num_remaining);
        const node_cost_idx last = last_city();
        for (node_cost_idx city = 0; city < static_cast<node_cost_idx>(remaining.size()); ++city) {
            if (remaining[city]) {
                arcs.push_back({last, city});
            }
        }
        return arcs;
    }

    std::vector<arc_t> TourState::components() const {
        std::vector<arc_t> arcs{};
        for (size_t i = 1; i < order.size(); ++i) {
            arcs.push_back({order[i - 1], order[i]});
        }
        return arcs;
    }

    length_t TourState::lower_bound_delta_of_add(const arc_t &arc) const {
        CheckAddable(arc);
        ScratchCursors cursors{out_cursor, in_cursor, out_watchers, in_watchers};
        return RepairBound(arc, cursors) - bound;
    }

    length_t TourState::objective_delta_of_add(const arc_t &arc) const {
        CheckAddable(arc);
        length_t delta = problem->get_cost(arc.source, arc.dest);
        if (num_remaining == 1) {
            delta += problem->get_cost(arc.dest, ANCHOR_CITY);
        }
        return delta;
    }

    void TourState::add(const arc_t &arc) {
        CheckAddable(arc);

        CommittedCursors cursors{out_cursor, in_cursor, out_watchers, in_watchers};
        bound = RepairBound(arc, cursors);

        order.push_back(arc.dest);
        remaining[arc.dest] = 0;
        --num_remaining;

        distance += problem->get_cost(arc.source, arc.dest);
        if (num_remaining == 0) {
            distance += problem->get_cost(arc.dest, ANCHOR_CITY);
        }

#ifdef ATSP_IS_DEBUG
        assert(std::fabs(bound - compute_lower_bound_from_scratch()) < 1e-3);
#endif
    }

    length_t TourState::compute_lower_bound_from_scratch() const {
        const Problem &p = *problem;
        const auto n = static_cast<node_cost_idx>(p.dimension());

        length_t committed = 0;
        for (size_t i = 1; i < order.size(); ++i) {
            committed += p.get_cost(order[i - 1], order[i]);
        }
        if (is_feasible()) {
            return committed + p.get_cost(last_city(), ANCHOR_CITY);
        }

        const node_cost_idx last = last_city();
        const auto cheapest_out = [&](const node_cost_idx city, const auto &is_valid) {
            cost_t best = COST_POSITIVE_INFINITY;
            for (node_cost_idx other = 0; other < n; ++other) {
                if (other != city && is_valid(other)) {
                    best = std::min(best, p.get_cost(city, other));
                }
            }
            return best;
        };
        const auto cheapest_in = [&](const node_cost_idx city, const auto &is_valid) {
            cost_t best = COST_POSITIVE_INFINITY;
            for (node_cost_idx other = 0; other < n; ++other) {
                if (other != city && is_valid(other)) {
                    best = std::min(best, p.get_cost(other, city));
                }
            }
            return best;
        };
        const auto is_unvisited = [&](const node_cost_idx city) {
            return is_remaining(city);
        };

        length_t halves = 0;
        for (node_cost_idx city = 0; city < n; ++city) {
            if (!is_remaining(city)) {
                continue;
            }
            halves += cheapest_out(city, [&](const node_cost_idx other) {
                return other == ANCHOR_CITY || is_remaining(other);
            });
            halves += cheapest_in(city, [&](const node_cost_idx other) {
                return other == last || is_remaining(other);
            });
        }
        halves += cheapest_out(last, is_unvisited);
        halves += cheapest_in(ANCHOR_CITY, is_unvisited);

        return committed + halves / 2;
    }

    void TourState::ReplaceOrder(std::vector<node_cost_idx> new_order, const length_t new_distance) {
        CheckFeasible();
        order = std::move(new_order);
        distance = new_distance;
        // a complete tour is its own bound
        bound = new_distance;

#ifdef ATSP_IS_DEBUG
        assert(order.size() == problem->dimension());
        assert(order.front() == ANCHOR_CITY);
        assert(std::fabs(distance - ComputeTourCost(order, *problem)) < 1e-3);
#endif
    }

    void TourState::CommitInPlaceMove(const length_t improvement) {
        distance -= improvement;
        bound = distance;

#ifdef ATSP_IS_DEBUG
        assert(order.front() == ANCHOR_CITY);
        assert(std::fabs(distance - ComputeTourCost(order, *problem)) < 1e-3);
#endif
    }

    void PrintTour(const TourState &tour, std::ostream &out) {
        for (const auto city: tour.get_order()) {
            out << city << "->";
        }
        out << ANCHOR_CITY;
        if (const auto length = tour.exact_length()) {
            out << " with a total distance of " << *length;
        } else {
            out << " (" << tour.count_remaining() << " cities remaining, lower bound "
                    << tour.lower_bound() << ")";
        }
        out << std::endl;
    }
}
