#include <atsp/ant_colony.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <thread>

namespace atsp {
    void PheromoneMatrix::evaporate(const double factor) {
        std::for_each(levels.get(), levels.get() + num_nodes * num_nodes, [factor](double &level) {
            level *= factor;
        });
    }

    ant_tour_t SampleAntTour(const Problem &problem, const PheromoneMatrix &pheromones,
                             const AntColonyOptions &options, std::mt19937_64 &rng) {
        const size_t n = problem.dimension();

        ant_tour_t ant{};
        ant.order.reserve(n);
        std::vector<char> visited(n, 0);
        std::vector<double> weights(n, 0.0);

        // choose random starting point
        {
            std::uniform_int_distribution<node_cost_idx> dist(0, static_cast<node_cost_idx>(n) - 1);
            const node_cost_idx starting_point = dist(rng);
            ant.order.push_back(starting_point);
            visited[starting_point] = 1;
        }

        // sample edges proportional to pheromone and distance
        length_t total_cost = 0;
        while (ant.order.size() < n) {
            const node_cost_idx last_node = ant.order.back();
            double total_weight = 0;
            node_cost_idx fallback = -1;
            for (node_cost_idx node = 0; node < static_cast<node_cost_idx>(n); ++node) {
                if (visited[node]) {
                    weights[node] = 0;
                    continue;
                }
                const cost_t cost = problem.get_cost(last_node, node);
                const double level = std::max(pheromones.get_level(last_node, node), options.pheromone_floor);
                const double divisor = cost != 0 ? std::pow(static_cast<double>(cost), options.beta) : 1.0;
                weights[node] = std::pow(level, options.alpha) / divisor;
                total_weight += weights[node];
                fallback = node;
            }

            double choice = std::uniform_real_distribution<double>(0, total_weight)(rng);
            // rounding can leave the choice marginally above zero after the last candidate
            node_cost_idx next_node = fallback;
            for (node_cost_idx node = 0; node < static_cast<node_cost_idx>(n); ++node) {
                if (visited[node]) {
                    continue;
                }
                choice -= weights[node];
                if (choice <= 0) {
                    next_node = node;
                    break;
                }
            }

            total_cost += problem.get_cost(last_node, next_node);
            ant.order.push_back(next_node);
            visited[next_node] = 1;
        }
        total_cost += problem.get_cost(ant.order.back(), ant.order.front());
        ant.length = total_cost;

        std::ranges::rotate(ant.order, std::ranges::find(ant.order, ANCHOR_CITY));
        return ant;
    }

    AntColonyEngine::AntColonyEngine(const Problem &problem, AntColonyOptions options)
        : options(options), pheromones(problem.dimension()) {
        if (!(options.evaporation > 0 && options.evaporation < 1)) {
            throw std::invalid_argument("evaporation factor must lie in (0, 1)");
        }
    }

    std::vector<ant_tour_t> AntColonyEngine::local_moves(const TourState &tour, uint64_t &seed) const {
        tour.CheckFeasible();
        if (tour.problem->dimension() != pheromones.dimension()) {
            throw std::invalid_argument("tour and pheromone matrix belong to different problems");
        }

        const uint64_t round_seed = seed;
        {
            std::mt19937_64 rng(seed);
            seed = rng();
        }

        const size_t num_ants = std::max(1u, options.num_ants);
        size_t num_workers = options.num_workers != 0 ? options.num_workers : std::thread::hardware_concurrency();
        num_workers = std::clamp<size_t>(num_workers, 1, num_ants);

        std::vector<ant_tour_t> ants(num_ants);
        std::vector<std::exception_ptr> failures(num_workers);

        // worker w builds ants w, w + num_workers, ...; each ant has its own stream
        const auto work = [&](const size_t worker) {
            try {
                for (size_t a = worker; a < num_ants; a += num_workers) {
                    std::mt19937_64 rng(round_seed + a);
                    ants[a] = SampleAntTour(*tour.problem, pheromones, options, rng);
                }
            } catch (...) {
                failures[worker] = std::current_exception();
            }
        };

        if (num_workers == 1) {
            work(0);
        } else {
            RunWorkers(num_workers, work);
        }

        for (const auto &failure: failures) {
            if (failure) {
                std::rethrow_exception(failure);
            }
        }
        return ants;
    }

    RandomizedMoves<ant_tour_t> AntColonyEngine::randomized_local_moves(const TourState &tour, uint64_t &seed) const {
        auto ants = local_moves(tour, seed);
        return {std::move(ants), seed};
    }

    length_t AntColonyEngine::objective_delta_of(const TourState &tour, const ant_tour_t &ant) const {
        return tour.distance - ant.length;
    }

    void AntColonyEngine::apply_move(TourState &tour, std::vector<ant_tour_t> ants) {
        tour.CheckFeasible();
        if (ants.empty()) {
            return;
        }
        const size_t n = tour.problem->dimension();
        for (const auto &ant: ants) {
            if (ant.order.size() != n) {
                throw std::invalid_argument("ant tour does not visit every city");
            }
        }

        // the current tour competes with the colony for the best half (elitism)
        const size_t num_selected = std::max<size_t>(1, ants.size() / 2);
        ants.push_back({tour.order, tour.distance});
        std::ranges::stable_sort(ants, {}, &ant_tour_t::length);
        ants.resize(num_selected);

        for (const auto &ant: ants) {
            const double amount = ant.length > 0 ? options.deposit / ant.length : options.deposit;
            for (size_t i = 0; i < n; ++i) {
                pheromones.deposit(ant.order[i], ant.order[(i + 1) % n], amount);
            }
        }
        pheromones.evaporate(options.evaporation);

        if (ants.front().length < tour.distance) {
            tour.ReplaceOrder(std::move(ants.front().order), ants.front().length);
        }
    }
}
