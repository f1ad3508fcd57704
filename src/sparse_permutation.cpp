#include <atsp/sparse_permutation.h>

namespace atsp {
    SparsePermutation::SparsePermutation(const size_t n, uint64_t &seed)
        : num_left(n), rng(seed) {
        seed = rng();
    }

    std::optional<size_t> SparsePermutation::next() {
        if (num_left == 0) {
            return std::nullopt;
        }
        const size_t i = --num_left;
        const size_t r = std::uniform_int_distribution<size_t>(0, i)(rng);

        const auto value_at = [this](const size_t idx) {
            const auto it = displaced.find(idx);
            return it == displaced.end() ? idx : it->second;
        };

        const size_t value = value_at(r);
        if (r != i) {
            displaced[r] = value_at(i);
        }
        // slot i is never read again
        displaced.erase(i);
        return value;
    }
}
