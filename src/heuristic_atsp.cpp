#include <libatsp.h>

#include <atsp/ant_colony.h>
#include <atsp/problem.h>
#include <atsp/shift_insert.h>
#include <atsp/solvers.h>
#include <atsp/three_opt.h>
#include <atsp/tour_state.h>

#include <algorithm>
#include <chrono>
#include <new>
#include <stdexcept>

using atsp::TourState;

namespace {
    [[nodiscard]] TourState BuildInitialTour(const atsp::Problem &problem,
                                             const AtspSolverOptionsDescriptor &options,
                                             uint64_t &seed) {
        switch (options.construction) {
            case ATSP_CONSTRUCT_RANDOM:
                return atsp::RandomConstruction(problem, seed);
            case ATSP_CONSTRUCT_GREEDY:
                return atsp::GreedyConstruction(problem);
            case ATSP_CONSTRUCT_GRASP: {
                const atsp::GraspOptions grasp_options{
                    .alpha = options.grasp_alpha,
                    .time_limit = std::chrono::milliseconds(options.time_limit_ms),
                };
                return atsp::Grasp(problem, grasp_options, seed);
            }
            case ATSP_CONSTRUCT_BEAM_SEARCH:
                return atsp::BeamSearch(problem, options.beam_width);
        }
        throw std::invalid_argument("unknown construction heuristic");
    }

    template<typename Engine>
    void RunLocalSearch(TourState &tour, const Engine &engine,
                        const AtspSolverOptionsDescriptor &options, uint64_t &seed) {
        if (options.strategy == ATSP_LOCAL_SEARCH_FIRST_IMPROVEMENT) {
            atsp::LocalSearchFirst(tour, engine, seed, options.num_iterations);
        } else {
            atsp::LocalSearchBest(tour, engine, options.num_iterations);
        }
    }

    void ImproveTour(TourState &tour, const atsp::Problem &problem,
                     const AtspSolverOptionsDescriptor &options, uint64_t &seed) {
        switch (options.local_search) {
            case ATSP_LOCAL_SEARCH_NONE:
                return;
            case ATSP_LOCAL_SEARCH_3OPT:
                RunLocalSearch(tour, atsp::ThreeOptEngine{}, options, seed);
                return;
            case ATSP_LOCAL_SEARCH_SHIFT_INSERT:
                RunLocalSearch(tour, atsp::ShiftInsertEngine{}, options, seed);
                return;
            case ATSP_LOCAL_SEARCH_ANT_COLONY: {
                atsp::AntColonyEngine engine{
                    problem, {
                        .num_ants = std::max(1u, options.ant_colony_num_ants),
                        .evaporation = options.ant_colony_evaporation,
                    }
                };
                atsp::RunAntColony(tour, engine, options.num_iterations, seed);
                return;
            }
        }
        throw std::invalid_argument("unknown local search engine");
    }
}

AtspStatus atspSolveHeuristic(const AtspDistanceMatrixDescriptor *matrix,
                              const AtspSolverOptionsDescriptor *solver_options,
                              AtspSolutionDescriptor *output_descriptor) {
    uint64_t seed = solver_options->seed;

    try {
        const atsp::Problem problem = atsp::Problem::FromDistanceMatrix(matrix->dimension, matrix->distances);

        TourState tour = BuildInitialTour(problem, *solver_options, seed);
        ImproveTour(tour, problem, *solver_options, seed);

        const auto &order = tour.get_order();

        // Fill output descriptor
        auto *cities = new cityid_t[order.size()];
        std::ranges::copy(order, cities);
        output_descriptor->tour = cities;
        output_descriptor->num_cities = order.size();
        // final cost recompute for safety
        output_descriptor->solution_cost = static_cast<cost_t>(atsp::ComputeTourCost(order, problem));
        output_descriptor->lower_bound = static_cast<cost_t>(problem.lower_bound_at_empty_tour());
    } catch (const std::bad_alloc &) {
        return ATSP_STATUS_OUT_OF_MEMORY;
    } catch (const std::invalid_argument &) {
        return ATSP_STATUS_ERROR_INVALID_ARG;
    } catch (const std::exception &) {
        return ATSP_STATUS_ERROR_INTERNAL;
    }
    return ATSP_STATUS_SUCCESS;
}
