/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file random_source.hpp
 * @brief Entropy source for identifier fields.
 *
 * @details
 * Declares the abstract `RandomSource` contract consumed by both generators and
 * its default implementation backed by a 64-bit Mersenne Twister. Generators
 * receive the source by reference so tests can substitute a scripted sequence.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <random>

namespace uuidforge::infra {

/**
 * @class RandomSource
 * @brief Supplies uniform unsigned integers of a requested bit width.
 */
class RandomSource {
  public:
    /// Widest draw supported by `next_bits`.
    static constexpr int kMaxBits = 53;

    virtual ~RandomSource() = default;

    /**
     * @brief Returns a uniform value in `[0, 2^width)`.
     *
     * Widths above 30 are assembled from two independent draws: the low 30 bits
     * and `width - 30` high bits. A width of 0 yields 0 without consuming entropy.
     *
     * @param width Requested bit width, in `[0, 53]`.
     * @throws std::invalid_argument if `width` is outside `[0, 53]`.
     */
    std::uint64_t next_bits(int width);

    /// Uniform double in `[0, 1)` with 30 bits of resolution.
    double next_unit();

  protected:
    /**
     * @brief Produces a single uniform draw of `width` bits, `1 <= width <= 30`.
     *
     * Implementations never see widths outside that range; validation and the
     * two-draw assembly happen in `next_bits`.
     */
    virtual std::uint32_t draw(int width) = 0;
};

/**
 * @class MersenneRandomSource
 * @brief Default `RandomSource` seeded from `std::random_device`.
 *
 * @details
 * A single instance may be shared by any number of threads: each draw holds an
 * internal mutex around the engine. Not suitable where cryptographic
 * unpredictability is required.
 */
class MersenneRandomSource : public RandomSource {
  public:
    MersenneRandomSource();

    /// Deterministic seeding, for reproducible runs.
    explicit MersenneRandomSource(std::uint64_t seed);

  protected:
    std::uint32_t draw(int width) override;

  private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

} // namespace uuidforge::infra
