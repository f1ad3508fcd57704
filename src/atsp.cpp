#include <libatsp.h>

#include <cmath>

AtspStatus atspSolveHeuristic(const AtspDistanceMatrixDescriptor *matrix,
                              const AtspSolverOptionsDescriptor *solver_options,
                              AtspSolutionDescriptor *output_descriptor);

/// Validate that the matrix describes a complete directed graph.
/// Every off-diagonal cost must be finite and non-negative. The diagonal is never read.
AtspStatus ValidateDistanceMatrix(const AtspDistanceMatrixDescriptor &matrix) {
    const size_t n = matrix.dimension;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (i == j) {
                continue;
            }
            const cost_t cost = matrix.distances[i * n + j];
            if (!std::isfinite(cost) || cost < 0) {
                return ATSP_STATUS_ERROR_INVALID_GRAPH;
            }
        }
    }
    return ATSP_STATUS_SUCCESS;
}

/// Validate that every option holds a known enumerator and lies in its documented range.
AtspStatus ValidateSolverOptions(const AtspSolverOptionsDescriptor &options) {
    switch (options.construction) {
        case ATSP_CONSTRUCT_RANDOM:
        case ATSP_CONSTRUCT_GREEDY:
        case ATSP_CONSTRUCT_GRASP:
        case ATSP_CONSTRUCT_BEAM_SEARCH:
            break;
        default:
            return ATSP_STATUS_ERROR_INVALID_ARG;
    }
    switch (options.local_search) {
        case ATSP_LOCAL_SEARCH_NONE:
        case ATSP_LOCAL_SEARCH_3OPT:
        case ATSP_LOCAL_SEARCH_SHIFT_INSERT:
        case ATSP_LOCAL_SEARCH_ANT_COLONY:
            break;
        default:
            return ATSP_STATUS_ERROR_INVALID_ARG;
    }
    if (options.strategy != ATSP_LOCAL_SEARCH_FIRST_IMPROVEMENT
        && options.strategy != ATSP_LOCAL_SEARCH_BEST_IMPROVEMENT) {
        return ATSP_STATUS_ERROR_INVALID_ARG;
    }
    if (!(options.grasp_alpha >= 0 && options.grasp_alpha <= 1)) {
        return ATSP_STATUS_ERROR_INVALID_ARG;
    }
    if (!(options.ant_colony_evaporation > 0 && options.ant_colony_evaporation < 1)) {
        return ATSP_STATUS_ERROR_INVALID_ARG;
    }
    return ATSP_STATUS_SUCCESS;
}

AtspStatus atspSolve(const AtspDistanceMatrixDescriptor *matrix,
                     const AtspSolverOptionsDescriptor *solver_options,
                     AtspSolutionDescriptor *output_descriptor) {
    if (matrix == nullptr || output_descriptor == nullptr || solver_options == nullptr) {
        return ATSP_STATUS_ERROR_INVALID_ARG;
    }
    if (matrix->distances == nullptr || matrix->dimension == 0) {
        return ATSP_STATUS_ERROR_INVALID_ARG;
    }
    if (const auto status = ::ValidateSolverOptions(*solver_options); status != ATSP_STATUS_SUCCESS) {
        return status;
    }
    if (const auto status = ::ValidateDistanceMatrix(*matrix); status != ATSP_STATUS_SUCCESS) {
        return status;
    }
    return atspSolveHeuristic(matrix, solver_options, output_descriptor);
}

void atspDisposeSolution(AtspSolutionDescriptor *solution) {
    if (solution == nullptr) {
        return;
    }
    delete[] solution->tour;
    solution->tour = nullptr;
    solution->num_cities = 0;
    solution->solution_cost = 0;
    solution->lower_bound = 0;
}
