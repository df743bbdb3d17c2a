/**
 * @file deterministic_rng.hpp
 * @brief Seeded random stream shared by every randomised part of a run.
 *
 * The state is a pure function of (seed, draws): every sample consumes a
 * fixed number of 64-bit engine outputs and no distribution keeps hidden
 * state between calls. Two streams with the same seed that have served the
 * same number of draws produce identical sequences.
 */

#ifndef ACCRETION_DETERMINISTIC_RNG_HPP
#define ACCRETION_DETERMINISTIC_RNG_HPP

#include <cstdint>
#include <random>

class DeterministicRng {
public:
    explicit DeterministicRng(std::uint64_t seed = 0);

    /** @brief Restarts the stream from a new seed */
    void reseed(std::uint64_t seed);

    /** @brief Raw 64-bit draw */
    std::uint64_t nextU64();

    /** @brief Uniform double in [0, 1). One draw. */
    double uniform();

    /** @brief Uniform double in [a, b). One draw. */
    double uniform(double a, double b);

    /** @brief Uniform angle in [0, 2*pi). One draw. */
    double angle();

    /** @brief True with probability p. One draw. */
    bool bernoulli(double p);

    std::uint64_t seed() const { return seed_; }
    std::uint64_t draws() const { return draws_; }

private:
    std::mt19937_64 engine_;
    std::uint64_t seed_ = 0;
    std::uint64_t draws_ = 0;
};

#endif // ACCRETION_DETERMINISTIC_RNG_HPP
