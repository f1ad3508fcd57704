#include <atsp/solvers.h>

#include <algorithm>
#include <random>
#include <utility>
#include <vector>

namespace atsp {
    namespace {
        [[nodiscard]] arc_t PickUniform(const std::vector<arc_t> &arcs, uint64_t &seed) {
            std::mt19937_64 rng(seed);
            std::uniform_int_distribution<size_t> dist(0, arcs.size() - 1);
            const arc_t picked = arcs[dist(rng)];
            seed = rng();
            return picked;
        }

        struct scored_arc_t {
            length_t delta;
            arc_t arc;
        };

        [[nodiscard]] std::vector<scored_arc_t> ScoreAddableArcs(const TourState &tour) {
            std::vector<scored_arc_t> scored{};
            for (const auto &arc: tour.addable_arcs()) {
                scored.push_back({tour.lower_bound_delta_of_add(arc), arc});
            }
            return scored;
        }
    }

    TourState RandomConstruction(const Problem &problem, uint64_t &seed) {
        TourState tour = problem.empty_tour();
        while (!tour.is_feasible()) {
            tour.add(PickUniform(tour.addable_arcs(), seed));
        }
        return tour;
    }

    TourState GreedyConstruction(const Problem &problem) {
        TourState tour = problem.empty_tour();
        while (!tour.is_feasible()) {
            const auto scored = ScoreAddableArcs(tour);
            const auto best = std::ranges::min_element(scored, {}, &scored_arc_t::delta);
            tour.add(best->arc);
        }
        return tour;
    }

    TourState GreedyConstructionRandomTieBreak(const Problem &problem, uint64_t &seed) {
        TourState tour = problem.empty_tour();
        while (!tour.is_feasible()) {
            const auto scored = ScoreAddableArcs(tour);
            const length_t best_delta = std::ranges::min_element(scored, {}, &scored_arc_t::delta)->delta;
            // cursor arithmetic may leave equal increases an ulp apart
            const length_t slack = RELATIVE_TOLERANCE * std::max<length_t>(1, tour.lower_bound());

            std::vector<arc_t> ties{};
            for (const auto &[delta, arc]: scored) {
                if (delta <= best_delta + slack) {
                    ties.push_back(arc);
                }
            }
            tour.add(PickUniform(ties, seed));
        }
        return tour;
    }

    TourState GreedyRandomizedAdaptiveConstruction(const Problem &problem, const double alpha, uint64_t &seed) {
        TourState tour = problem.empty_tour();
        while (!tour.is_feasible()) {
            const auto scored = ScoreAddableArcs(tour);
            const auto [min_it, max_it] = std::ranges::minmax_element(scored, {}, &scored_arc_t::delta);
            const double threshold = min_it->delta + alpha * (max_it->delta - min_it->delta)
                                     + RELATIVE_TOLERANCE * std::max<length_t>(1, tour.lower_bound());

            std::vector<arc_t> restricted{};
            for (const auto &[delta, arc]: scored) {
                if (delta <= threshold) {
                    restricted.push_back(arc);
                }
            }
            tour.add(PickUniform(restricted, seed));
        }
        return tour;
    }

    TourState Grasp(const Problem &problem, const GraspOptions &options, uint64_t &seed) {
        const auto start = std::chrono::high_resolution_clock::now();

        TourState best_tour = GreedyRandomizedAdaptiveConstruction(problem, options.alpha, seed);
        while (std::chrono::high_resolution_clock::now() - start < options.time_limit) {
            TourState tour = GreedyRandomizedAdaptiveConstruction(problem, options.alpha, seed);
            if (tour.get_distance() < best_tour.get_distance()) {
                best_tour = std::move(tour);
            }
        }
        return best_tour;
    }

    TourState BeamSearch(const Problem &problem, const size_t beam_width) {
        struct child_t {
            length_t lower_bound;
            size_t parent;
            arc_t arc;
        };

        std::vector<TourState> beam{};
        beam.push_back(problem.empty_tour());
        const size_t width = std::max<size_t>(1, beam_width);

        // every tour of a level has the same length, so all of them become feasible together
        while (!beam.front().is_feasible()) {
            std::vector<child_t> children{};
            for (size_t parent = 0; parent < beam.size(); ++parent) {
                const TourState &tour = beam[parent];
                for (const auto &arc: tour.addable_arcs()) {
                    children.push_back({tour.lower_bound() + tour.lower_bound_delta_of_add(arc), parent, arc});
                }
            }

            const size_t num_kept = std::min(width, children.size());
            std::ranges::partial_sort(children, children.begin() + static_cast<std::ptrdiff_t>(num_kept), {},
                                      &child_t::lower_bound);

            std::vector<TourState> next_beam{};
            next_beam.reserve(num_kept);
            for (size_t c = 0; c < num_kept; ++c) {
                TourState child = beam[children[c].parent];
                child.add(children[c].arc);
                next_beam.push_back(std::move(child));
            }
            beam = std::move(next_beam);
        }

        return *std::ranges::min_element(beam, {}, &TourState::get_distance);
    }

    void RunAntColony(TourState &tour, AntColonyEngine &engine, const uint64_t num_rounds, uint64_t &seed) {
        for (uint64_t round = 0; round < num_rounds; ++round) {
            engine.apply_move(tour, engine.local_moves(tour, seed));
        }
    }
}
