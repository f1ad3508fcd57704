#include <atsp/matrix_reader.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace atsp {
    namespace {
        [[nodiscard]] std::string NextToken(std::istream &in, const char *what) {
            std::string token{};
            if (!(in >> token)) {
                throw std::runtime_error(std::string("unexpected end of input while reading ") + what);
            }
            return token;
        }

        [[nodiscard]] size_t ParseDimension(const std::string &token) {
            size_t consumed = 0;
            long long value = -1;
            try {
                value = std::stoll(token, &consumed);
            } catch (const std::logic_error &) {
                consumed = 0;
            }
            if (consumed != token.size() || value <= 0) {
                throw std::runtime_error("invalid dimension '" + token + "'");
            }
            return static_cast<size_t>(value);
        }

        [[nodiscard]] cost_t ParseCost(const std::string &token) {
            size_t consumed = 0;
            cost_t value = 0;
            try {
                value = std::stof(token, &consumed);
            } catch (const std::logic_error &) {
                consumed = 0;
            }
            if (consumed != token.size()) {
                throw std::runtime_error("invalid edge weight '" + token + "'");
            }
            return value;
        }
    }

    Problem ReadProblem(std::istream &in) {
        size_t dimension = 0;
        bool has_section = false;

        std::string token{};
        while (in >> token) {
            if (token == "DIMENSION:") {
                dimension = ParseDimension(NextToken(in, "the dimension"));
            } else if (token == "DIMENSION") {
                std::string value = NextToken(in, "the dimension");
                if (value == ":") {
                    value = NextToken(in, "the dimension");
                }
                dimension = ParseDimension(value);
            } else if (token == "EDGE_WEIGHT_SECTION") {
                has_section = true;
                break;
            }
        }

        if (dimension == 0) {
            throw std::runtime_error("missing DIMENSION");
        }
        if (!has_section) {
            throw std::runtime_error("missing EDGE_WEIGHT_SECTION");
        }

        std::vector<cost_t> matrix{};
        matrix.reserve(dimension * dimension);
        for (size_t i = 0; i < dimension * dimension; ++i) {
            matrix.push_back(ParseCost(NextToken(in, "the edge weights")));
        }
        return Problem::FromDistanceMatrix(dimension, matrix);
    }
}
