#pragma once

#include <atsp/problem.h>

#include <istream>

namespace atsp {
    /**
     * Reads a problem from whitespace separated tokens. The token following "DIMENSION:" (or
     * "DIMENSION" ":") gives the number of cities. After "EDGE_WEIGHT_SECTION", dimension * dimension
     * costs follow row by row. Any other token before the section is ignored.
     * @throws std::runtime_error if the dimension or section is missing, or the matrix is truncated
     *         or holds a malformed number
     * @throws std::invalid_argument if the costs do not form a valid problem
     */
    [[nodiscard]] Problem ReadProblem(std::istream &in);
}
