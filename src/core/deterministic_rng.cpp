#include "accretion/core/deterministic_rng.hpp"

#include "accretion/core/constants.hpp"

DeterministicRng::DeterministicRng(std::uint64_t seed) {
    reseed(seed);
}

void DeterministicRng::reseed(std::uint64_t seed) {
    seed_ = seed;
    draws_ = 0;
    engine_.seed(seed);
}

std::uint64_t DeterministicRng::nextU64() {
    ++draws_;
    return engine_();
}

double DeterministicRng::uniform() {
    // Top 53 bits -> exactly representable double in [0, 1)
    return static_cast<double>(nextU64() >> 11) * 0x1.0p-53;
}

double DeterministicRng::uniform(double a, double b) {
    return a + uniform() * (b - a);
}

double DeterministicRng::angle() {
    return uniform() * SimulatorConstants::Tau;
}

bool DeterministicRng::bernoulli(double p) {
    return uniform() < p;
}
