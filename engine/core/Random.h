// Injectable random source used by every gameplay roll.
#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace Engine {

class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform value in [0, 1].
    virtual double unit() = 0;
    // Uniform integer in [lo, hi].
    virtual int range(int lo, int hi) = 0;

    double uniform(double lo, double hi) { return lo + (hi - lo) * unit(); }

    // True when a unit draw lands at or under p. p <= 0 never passes, p >= 1 always does.
    bool chance(double p);

    // Uniform index in [0, count). Throws std::invalid_argument when count is 0.
    std::size_t index(std::size_t count);
};

class MersenneRandom : public RandomSource {
public:
    MersenneRandom();
    explicit MersenneRandom(std::uint32_t seed);

    double unit() override;
    int range(int lo, int hi) override;

private:
    std::mt19937 engine_;
};

// Cumulative-weight selection over non-negative weights.
std::size_t pickWeightedIndex(const std::vector<double>& weights, RandomSource& rng);

// Fisher-Yates shuffle driven by the injected source.
template <typename T>
void shuffleInPlace(std::vector<T>& items, RandomSource& rng) {
    for (std::size_t i = items.size(); i > 1; --i) {
        const std::size_t j = rng.index(i);
        std::swap(items[i - 1], items[j]);
    }
}

}  // namespace Engine
