#pragma once

#include <atsp/sparse_permutation.h>
#include <atsp/tour_state.h>

#include <cstdint>
#include <memory>
#include <random>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace atsp {
    struct AntColonyOptions {
        /// Ants sampled per round.
        uint32_t num_ants = 200;

        /// Exponent applied to pheromone levels.
        double alpha = 0.9;

        /// Exponent applied to distances.
        double beta = 1.5;

        /// Factor in (0, 1) the whole matrix is multiplied by once per step.
        double evaporation = 0.9;

        /// Each edge of a selected ant receives deposit / length.
        double deposit = 10.0;

        /// Lower bound on the pheromone level used when sampling, so unvisited edges stay reachable.
        double pheromone_floor = 1e-5;

        /// Threads used to sample a round. 0 uses the hardware concurrency.
        uint32_t num_workers = 0;
    };

    /// A closed tour sampled by one ant, rotated to start at the anchor.
    struct ant_tour_t {
        std::vector<node_cost_idx> order{};
        length_t length = COST_POSITIVE_INFINITY;
    };

    class PheromoneMatrix {
        std::unique_ptr<double[]> levels;
        size_t num_nodes;

    public:
        explicit PheromoneMatrix(const size_t num_nodes)
            : levels(std::make_unique<double[]>(num_nodes * num_nodes)), num_nodes(num_nodes) {
            std::fill_n(levels.get(), num_nodes * num_nodes, 0.0);
        }

        [[nodiscard]] size_t dimension() const {
            return num_nodes;
        }

        [[nodiscard]] ATSP_FORCE_INLINE double get_level(const node_cost_idx from, const node_cost_idx to) const {
            return levels[from * num_nodes + to];
        }

        ATSP_FORCE_INLINE void deposit(const node_cost_idx from, const node_cost_idx to, const double amount) {
            levels[from * num_nodes + to] += amount;
        }

        void evaporate(double factor);
    };

    /**
     * Population-based improvement: each round samples a colony of ant tours biased by a pheromone
     * matrix, ranks them together with the current tour, reinforces the best half of the colony,
     * evaporates, and moves the tour to the best candidate.
     *
     * The engine owns the pheromone matrix, so one engine should drive one tour at a time.
     */
    class AntColonyEngine {
        AntColonyOptions options;
        PheromoneMatrix pheromones;

    public:
        AntColonyEngine(const Problem &problem, AntColonyOptions options = {});

        [[nodiscard]] const AntColonyOptions &get_options() const {
            return options;
        }

        [[nodiscard]] const PheromoneMatrix &get_pheromones() const {
            return pheromones;
        }

        /**
         * Samples one round of options.num_ants tours on a pool of worker threads. Workers only read
         * the pheromone matrix. The result does not depend on the number of workers.
         * @throws std::logic_error if the tour is not feasible
         */
        [[nodiscard]] std::vector<ant_tour_t> local_moves(const TourState &tour, uint64_t &seed) const;

        [[nodiscard]] RandomizedMoves<ant_tour_t> randomized_local_moves(const TourState &tour, uint64_t &seed) const;

        /// Returns by how much replacing the tour with the ant would shorten it.
        [[nodiscard]] length_t objective_delta_of(const TourState &tour, const ant_tour_t &ant) const;

        /**
         * Applies one round: ranks the ants together with the current tour, keeps the
         * max(1, num_ants / 2) shortest, deposits pheromone on their edges, evaporates the matrix
         * once, and replaces the tour with the shortest kept candidate. The tour therefore never
         * gets longer.
         */
        void apply_move(TourState &tour, std::vector<ant_tour_t> ants);
    };

    struct StartThread {
        template<typename Task>
        std::thread operator()(Task &&task) const {
            return std::thread(std::forward<Task>(task));
        }
    };

    /**
     * Runs work(0) .. work(num_workers - 1) concurrently and returns once all of them finished.
     * A worker whose thread cannot be started runs on the calling thread instead. Threads that
     * were started are joined before any exception leaves.
     */
    template<typename Work, typename Start = StartThread>
    void RunWorkers(const size_t num_workers, const Work &work, const Start &start = {}) {
        std::vector<std::thread> threads{};
        threads.reserve(num_workers);
        const auto join_all = [&threads] {
            for (auto &thread: threads) {
                if (thread.joinable()) {
                    thread.join();
                }
            }
        };

        try {
            for (size_t w = 0; w < num_workers; ++w) {
                try {
                    threads.push_back(start([&work, w] { work(w); }));
                } catch (const std::system_error &) {
                    work(w);
                }
            }
        } catch (...) {
            join_all();
            throw;
        }
        join_all();
    }

    /// Builds one ant tour, picking each next city with probability proportional to
    /// max(pheromone, floor)^alpha / distance^beta.
    [[nodiscard]] ant_tour_t SampleAntTour(const Problem &problem, const PheromoneMatrix &pheromones,
                                           const AntColonyOptions &options, std::mt19937_64 &rng);
}
