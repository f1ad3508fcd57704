#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <random>
#include <utility>
#include <vector>
#include <libatsp.h>

static std::vector<cost_t> createRandomAsymmetricMatrix(const size_t n, const double max_cost) {
    std::mt19937_64 rng{std::random_device{}()};
    std::uniform_real_distribution dist(1.0, max_cost);

    std::vector<cost_t> distances(n * n, 0);
    for (size_t i = 0; i < n; i++) {
        for (size_t j = 0; j < n; j++) {
            if (i == j) {
                continue;
            }
            distances[i * n + j] = static_cast<cost_t>(dist(rng));
        }
    }
    return distances;
}

int main() {
    const std::vector<std::pair<const char *, AtspSolverOptionsDescriptor>> configurations{
        {"greedy + 3-opt", {.construction = ATSP_CONSTRUCT_GREEDY, .local_search = ATSP_LOCAL_SEARCH_3OPT}},
        {
            "greedy + shift-insert",
            {.construction = ATSP_CONSTRUCT_GREEDY, .local_search = ATSP_LOCAL_SEARCH_SHIFT_INSERT}
        },
        {
            "beam search + 3-opt",
            {.construction = ATSP_CONSTRUCT_BEAM_SEARCH, .local_search = ATSP_LOCAL_SEARCH_3OPT}
        },
        {
            "greedy + ant colony",
            {
                .construction = ATSP_CONSTRUCT_GREEDY, .local_search = ATSP_LOCAL_SEARCH_ANT_COLONY,
                .num_iterations = 20
            }
        },
    };

    for (const std::vector<size_t> test_sizes{10, 20, 50, 100}; const auto n: test_sizes) {
        const std::vector<cost_t> distances = createRandomAsymmetricMatrix(n, 100.0);
        const AtspDistanceMatrixDescriptor matrix{.distances = distances.data(), .dimension = n};

        for (const auto &[name, options]: configurations) {
            constexpr size_t iterations = 3;
            long long total_ns = 0;
            double total_gap = 0;

            for (size_t i = 0; i < iterations; i++) {
                AtspSolutionDescriptor outputDesc{};

                auto start = std::chrono::steady_clock::now();
                if (const AtspStatus status = atspSolve(&matrix, &options, &outputDesc);
                    status != ATSP_STATUS_SUCCESS) {
                    std::cerr << "Error: atspSolve returned status " << status << std::endl;
                    atspDisposeSolution(&outputDesc);
                    return 1;
                }
                auto end = std::chrono::steady_clock::now();

                total_ns += std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
                total_gap += outputDesc.solution_cost / outputDesc.lower_bound - 1.0;

                atspDisposeSolution(&outputDesc);
            }

            const double avg_ms = (static_cast<double>(total_ns) / iterations) / 1e6;
            const double avg_gap = total_gap / iterations * 100.0;

            // Print a summary for this n and configuration
            std::cout << "N = " << n << ", " << name
                      << ": Average Solve Time = " << std::fixed << std::setprecision(3) << avg_ms
                      << " ms, gap to lower bound = " << std::setprecision(1) << avg_gap
                      << "% (over " << iterations << " runs)" << std::endl;
        }
    }

    return 0;
}
