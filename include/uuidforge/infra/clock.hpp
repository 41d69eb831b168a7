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
 * @file clock.hpp
 * @brief Calendar time source for version 1 generation.
 */

#pragma once

#include <atomic>
#include <cstdint>

namespace uuidforge::infra {

/**
 * @class Clock
 * @brief Supplies the current calendar time in milliseconds since 1970-01-01T00:00:00Z.
 */
class Clock {
  public:
    virtual ~Clock() = default;

    virtual std::int64_t now_ms() const = 0;
};

/// Reads `std::chrono::system_clock`.
class SystemClock : public Clock {
  public:
    std::int64_t now_ms() const override;
};

/**
 * @class ManualClock
 * @brief A clock that only moves when told to.
 *
 * Used to hold time constant across several generations or to simulate the
 * host clock stepping backwards.
 */
class ManualClock : public Clock {
  public:
    explicit ManualClock(std::int64_t start_ms) : now_(start_ms) {}

    std::int64_t now_ms() const override
    {
        return now_.load();
    }

    void set(std::int64_t ms)
    {
        now_.store(ms);
    }

    void advance(std::int64_t delta_ms)
    {
        now_.fetch_add(delta_ms);
    }

  private:
    std::atomic<std::int64_t> now_;
};

} // namespace uuidforge::infra
