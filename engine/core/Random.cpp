#include "Random.h"

#include <stdexcept>
#include <utility>

namespace Engine {

bool RandomSource::chance(double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    return unit() <= p;
}

std::size_t RandomSource::index(std::size_t count) {
    if (count == 0) throw std::invalid_argument("RandomSource::index: empty range");
    return static_cast<std::size_t>(range(0, static_cast<int>(count) - 1));
}

MersenneRandom::MersenneRandom() : engine_(std::random_device{}()) {}

MersenneRandom::MersenneRandom(std::uint32_t seed) : engine_(seed) {}

double MersenneRandom::unit() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
}

int MersenneRandom::range(int lo, int hi) {
    if (hi < lo) std::swap(lo, hi);
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(engine_);
}

std::size_t pickWeightedIndex(const std::vector<double>& weights, RandomSource& rng) {
    if (weights.empty()) throw std::invalid_argument("pickWeightedIndex: no weights");
    double total = 0.0;
    for (double w : weights) {
        if (w < 0.0) throw std::invalid_argument("pickWeightedIndex: negative weight");
        total += w;
    }
    if (total <= 0.0) throw std::invalid_argument("pickWeightedIndex: weights sum to zero");

    double roll = rng.unit() * total;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        if (weights[i] <= 0.0) continue;
        roll -= weights[i];
        if (roll <= 0.0) return i;
    }
    // Float drift: fall back to the last positive weight.
    for (std::size_t i = weights.size(); i-- > 0;) {
        if (weights[i] > 0.0) return i;
    }
    return weights.size() - 1;
}

}  // namespace Engine
