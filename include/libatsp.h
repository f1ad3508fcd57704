#pragma once

#ifndef __cplusplus
#include <stdint.h>
#include <stddef.h>
#else
#include <cstdint>
#include <cstddef>
#endif


#define ATSP_EXPORT extern "C"

typedef enum AtspResult {
    ATSP_STATUS_SUCCESS = 0, /**< Operation completed successfully. */
    ATSP_STATUS_ERROR_INVALID_GRAPH = 1, /**< The input distance matrix is invalid. */
    ATSP_STATUS_ERROR_INVALID_ARG = 2, /**< Invalid argument provided. */
    ATSP_STATUS_OUT_OF_MEMORY = 3, /**< Out of memory. */
    ATSP_STATUS_ERROR_INTERNAL = 4 /**< An internal error occurred. */
} AtspStatus;

typedef float cost_t;
typedef uint64_t cityid_t;

/**
 * Input descriptor to the ATSP solver: a dense, row-major distance matrix.
 */
typedef struct AtspDistanceMatrixDescriptor {
    /**
     * distances[i * dimension + j] is the cost of travelling from city i to city j.
     * Off-diagonal entries must be finite and non-negative. The diagonal is ignored.
     */
    const cost_t *distances{};

    /**
     * The number of cities. The matrix holds dimension * dimension entries.
     */
    size_t dimension{};
} AtspDistanceMatrixDescriptor;

typedef struct AtspSolutionDescriptor {
    /**
     * The tour as an array of city indices. The tour always starts at city 0.
     */
    cityid_t *tour{};

    /**
     * The number of elements in the tour array. Equal to the dimension for a valid solution.
     * An implicit wrap-around edge is assumed from tour[n-1] to tour[0].
     */
    size_t num_cities{};

    /**
     * The sum of the costs of the edges in the tour including the wrap-around edge.
     */
    cost_t solution_cost{};

    /**
     * The assignment lower bound of the problem at the empty tour.
     * No tour can be cheaper than this value.
     */
    cost_t lower_bound{};
} AtspSolutionDescriptor;

/**
 * Chooses how the initial tour is built.
 */
typedef enum AtspConstructionHeuristic {
    /**
     * Appends uniformly random cities.
     */
    ATSP_CONSTRUCT_RANDOM = 0,

    /**
     * Appends the city whose arc raises the assignment lower bound the least.
     */
    ATSP_CONSTRUCT_GREEDY = 1,

    /**
     * Repeats randomized greedy construction (restricted by grasp_alpha) until
     * time_limit_ms expires and keeps the best tour.
     */
    ATSP_CONSTRUCT_GRASP = 2,

    /**
     * Breadth-first beam search ranked by the lower bound, keeping beam_width tours per level.
     */
    ATSP_CONSTRUCT_BEAM_SEARCH = 3
} AtspConstructionHeuristic;

/**
 * Chooses the move family used to improve the constructed tour.
 */
typedef enum AtspLocalSearchEngine {
    ATSP_LOCAL_SEARCH_NONE = 0,

    /**
     * Exchanges two consecutive segments of the tour.
     */
    ATSP_LOCAL_SEARCH_3OPT = 1,

    /**
     * Relocates a single city to another position.
     */
    ATSP_LOCAL_SEARCH_SHIFT_INSERT = 2,

    /**
     * Runs num_iterations rounds of ant-colony sampling seeded with the constructed tour.
     */
    ATSP_LOCAL_SEARCH_ANT_COLONY = 3
} AtspLocalSearchEngine;

typedef enum AtspLocalSearchStrategy {
    /**
     * Applies the first improving move found in randomized order.
     */
    ATSP_LOCAL_SEARCH_FIRST_IMPROVEMENT = 0,

    /**
     * Applies the best improving move of the whole neighbourhood.
     */
    ATSP_LOCAL_SEARCH_BEST_IMPROVEMENT = 1
} AtspLocalSearchStrategy;

/**
 * Solver configuration descriptor.
 */
typedef struct AtspSolverOptionsDescriptor {
    /**
     * The seed for the random number generator
     */
    uint64_t seed{};

    /**
     * Which heuristic builds the initial tour.
     */
    AtspConstructionHeuristic construction = ATSP_CONSTRUCT_GREEDY;

    /**
     * Restricted candidate list threshold for GRASP, in [0, 1].
     * 0 keeps only the best candidates, 1 keeps all of them.
     */
    float grasp_alpha = 0.1f;

    /**
     * Number of partial tours kept per level by beam search.
     */
    uint32_t beam_width = 10;

    /**
     * Time budget for GRASP restarts, in milliseconds.
     */
    uint64_t time_limit_ms = 100;

    /**
     * Which move family improves the constructed tour.
     */
    AtspLocalSearchEngine local_search = ATSP_LOCAL_SEARCH_3OPT;

    /**
     * How moves are accepted by the 3-Opt and shift-insert engines.
     */
    AtspLocalSearchStrategy strategy = ATSP_LOCAL_SEARCH_BEST_IMPROVEMENT;

    /**
     * Upper bound on applied moves (3-Opt, shift-insert) or sampling rounds (ant colony).
     */
    uint64_t num_iterations = 1000;

    /**
     * Number of ants sampled per round by the ant colony engine.
     */
    uint32_t ant_colony_num_ants = 200;

    /**
     * Factor in (0, 1) the whole pheromone matrix is multiplied by after each round.
     */
    float ant_colony_evaporation = 0.9f;
} AtspSolverOptionsDescriptor;

/**
 * Heuristically solves the asymmetric TSP for the given distance matrix.
 * On success the caller owns output_descriptor->tour and must release it with atspDisposeSolution.
 * @param matrix the input distance matrix
 * @param solver_options options to configure the solver
 * @param output_descriptor the output descriptor to write the solution to
 * @return the result status of the operation
 */
ATSP_EXPORT AtspStatus atspSolve(const AtspDistanceMatrixDescriptor *matrix,
                                 const AtspSolverOptionsDescriptor *solver_options,
                                 AtspSolutionDescriptor *output_descriptor);

/**
 * Releases the tour array allocated by atspSolve and resets the descriptor.
 */
ATSP_EXPORT void atspDisposeSolution(AtspSolutionDescriptor *solution);
