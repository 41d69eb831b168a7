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
 * @file generator_test.cpp
 * @brief Tests for the version 1 state machine, version 4 assembly and the facades.
 *
 * @details
 * Version 1 scenarios run against a `ManualClock` so the millisecond can be held
 * constant or stepped backwards, and against scripted random sources where exact
 * field values are asserted.
 */

#include "framework.hpp"
#include "test_support.hpp"
#include "uuidforge/compat/legacy_generator.hpp"
#include "uuidforge/core/time_converter.hpp"
#include "uuidforge/core/v1_generator.hpp"
#include "uuidforge/core/v4_generator.hpp"
#include "uuidforge/infra/clock.hpp"
#include "uuidforge/infra/config.hpp"
#include "uuidforge/uuid.hpp"

#include <cstdint>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using uuidforge::core::Identifier;
using uuidforge::core::TimeConverter;
using uuidforge::core::V1Generator;
using uuidforge::core::V1State;
using uuidforge::core::V4Generator;
using uuidforge::infra::Config;
using uuidforge::infra::ManualClock;
using uuidforge::infra::MersenneRandomSource;
using uuidforge::test::ScriptedRandomSource;

namespace {

constexpr std::int64_t kFixedMs = 1700000000000LL;

bool has_rfc4122_variant(const Identifier& id)
{
    return (id.clock_seq_hi_and_reserved() & 0xC0) == 0x80;
}

} // namespace

// ============================================================================
// Version 1
// ============================================================================

/**
 * @brief Exact field layout for a fully scripted generation.
 *
 * Draw order: sequence (14), node high octet (8), node low (30 + 10), then the tick
 * (4) on the first generation because the clock differs from the zeroed timestamp.
 */
void test_v1_exact_fields()
{
    ManualClock clock(1);
    ScriptedRandomSource rng({0x1234, 0x02, 0x0, 0x0, 0x5});
    V1Generator gen(clock, rng);

    Identifier id = gen.generate();
    ASSERT_EQ(id.hex_string(), std::string("13816715-1dd2-11b2-9234-030000000000"));
    ASSERT_EQ(id.version(), 1u);
    ASSERT_TRUE(has_rfc4122_variant(id));

    V1State st = gen.snapshot();
    ASSERT_EQ(st.timestamp, std::int64_t{1});
    ASSERT_EQ(st.tick, std::uint32_t{5});
    ASSERT_EQ(st.sequence, std::uint32_t{0x1234});
}

void test_v1_version_and_variant()
{
    ManualClock clock(kFixedMs);
    MersenneRandomSource rng(11);
    V1Generator gen(clock, rng);

    for (int i = 0; i < 2000; ++i) {
        if (i % 7 == 0) {
            clock.advance(1);
        }
        Identifier id = gen.generate();
        ASSERT_EQ(id.version(), 1u);
        ASSERT_TRUE(has_rfc4122_variant(id));
        ASSERT_TRUE((id.node() & V1Generator::kMulticastBit) != 0);
    }
}

/**
 * @brief Calls within one millisecond never produce equal identifiers.
 */
void test_v1_unique_with_frozen_clock()
{
    ManualClock clock(kFixedMs);
    MersenneRandomSource rng(23);
    V1Generator gen(clock, rng);

    std::set<std::string> seen;
    Identifier previous = gen.generate();
    seen.insert(previous.hex_string());
    for (int i = 0; i < 5000; ++i) {
        Identifier next = gen.generate();
        ASSERT_NE(next, previous);
        seen.insert(next.hex_string());
        previous = next;
    }
    ASSERT_EQ(seen.size(), static_cast<std::size_t>(5001));
}

/**
 * @brief A clock that steps backwards bumps the sequence exactly once.
 */
void test_v1_clock_regression_bumps_sequence()
{
    ManualClock clock(kFixedMs);
    // sequence = 100, node = 0x03 << 40, first tick = 3, second tick = 7.
    ScriptedRandomSource rng({100, 0x02, 0x0, 0x0, 3, 7});
    V1Generator gen(clock, rng);

    Identifier before = gen.generate();
    ASSERT_EQ(gen.snapshot().sequence, std::uint32_t{100});

    clock.set(kFixedMs - 50);
    Identifier after = gen.generate();
    V1State st = gen.snapshot();

    ASSERT_EQ(st.sequence, std::uint32_t{101});
    ASSERT_EQ(st.timestamp, kFixedMs - 50);
    ASSERT_EQ(st.tick, std::uint32_t{7});
    ASSERT_EQ(after.clock_seq_low(), std::uint64_t{101});
    ASSERT_NE(after, before);
}

/**
 * @brief A new millisecond in the forward direction leaves the sequence untouched.
 */
void test_v1_clock_advance_keeps_sequence()
{
    ManualClock clock(kFixedMs);
    ScriptedRandomSource rng({100, 0x02, 0x0, 0x0, 3, 9});
    V1Generator gen(clock, rng);

    gen.generate();
    clock.advance(1);
    gen.generate();

    V1State st = gen.snapshot();
    ASSERT_EQ(st.sequence, std::uint32_t{100});
    ASSERT_EQ(st.tick, std::uint32_t{9});
}

/**
 * @brief With the tick-advance probability at zero every repeat bumps the sequence.
 */
void test_v1_sequence_fallback()
{
    Config cfg;
    cfg.tick_ratio = 0.0;

    ManualClock clock(kFixedMs);
    ScriptedRandomSource rng({0x3FFE, 0x02, 0x0, 0x0, 4});
    V1Generator gen(clock, rng, cfg);

    gen.generate();
    Identifier second = gen.generate();
    ASSERT_EQ(gen.snapshot().sequence, std::uint32_t{0x3FFF});
    ASSERT_EQ(second.clock_seq_hi_and_reserved(), std::uint64_t{0xBF});
    ASSERT_EQ(second.clock_seq_low(), std::uint64_t{0xFF});

    // 14-bit wrap-around.
    Identifier third = gen.generate();
    ASSERT_EQ(gen.snapshot().sequence, std::uint32_t{0});
    ASSERT_EQ(third.clock_seq_hi_and_reserved(), std::uint64_t{0x80});
    ASSERT_EQ(gen.snapshot().tick, std::uint32_t{4});
}

/**
 * @brief The tick stops below 10000 and the sequence takes over at the ceiling.
 */
void test_v1_tick_ceiling()
{
    Config cfg;
    cfg.tick_ratio = 1.0;

    ManualClock clock(kFixedMs);
    MersenneRandomSource rng(5);
    V1Generator gen(clock, rng, cfg);

    gen.generate();
    std::uint32_t start_sequence = gen.snapshot().sequence;
    for (int i = 0; i < 12000; ++i) {
        gen.generate();
        ASSERT_TRUE(gen.snapshot().tick < 10000);
    }

    V1State st = gen.snapshot();
    ASSERT_TRUE(st.tick >= cfg.tick_ceiling);
    ASSERT_NE(st.sequence, start_sequence);
}

/**
 * @brief At the highest accepted ceiling the last identifier of a millisecond stays
 * below every `time_low` the next millisecond can produce.
 *
 * Every tick draw answers 15, so each advance adds the maximum of 16.
 */
void test_v1_no_overlap_across_ms_at_max_ceiling()
{
    Config cfg;
    cfg.tick_ratio = 1.0;
    cfg.tick_ceiling = Config::kMaxTickCeiling;

    ManualClock clock(kFixedMs);
    // sequence = 100, node = 0x03 << 40, first tick = 0, then 15 for every draw.
    ScriptedRandomSource rng({100, 0x02, 0x0, 0x0, 0}, 15);
    V1Generator gen(clock, rng, cfg);

    Identifier last = gen.generate();
    for (int i = 0; i < 700; ++i) {
        last = gen.generate();
    }
    ASSERT_EQ(gen.snapshot().tick, Config::kMaxTickCeiling);

    std::uint64_t next_ms_floor = TimeConverter::convert(kFixedMs + 1).low;
    ASSERT_TRUE(last.time_low() < next_ms_floor);

    clock.advance(1);
    Identifier next = gen.generate();
    ASSERT_NE(next, last);
    ASSERT_TRUE(next.time_low() > last.time_low());
}

/**
 * @brief A ceiling set directly on `Config` above the accepted range is clamped.
 */
void test_v1_clamps_oversized_ceiling()
{
    Config cfg;
    cfg.tick_ratio = 1.0;
    cfg.tick_ceiling = 10000;

    ManualClock clock(kFixedMs);
    ScriptedRandomSource rng({100, 0x02, 0x0, 0x0, 0}, 15);
    V1Generator gen(clock, rng, cfg);

    for (int i = 0; i < 700; ++i) {
        gen.generate();
    }
    ASSERT_EQ(gen.snapshot().tick, Config::kMaxTickCeiling);
}

/**
 * @brief A clock reading before 1582-10-15 throws and leaves the state untouched.
 */
void test_v1_pre_gregorian_clock_keeps_state()
{
    ManualClock clock(kFixedMs);
    ScriptedRandomSource rng({100, 0x02, 0x0, 0x0, 3});
    V1Generator gen(clock, rng);
    gen.generate();
    V1State before = gen.snapshot();

    clock.set(TimeConverter::kGregorianEpochMs - 1);
    ASSERT_THROWS(gen.generate(), std::out_of_range);

    V1State after = gen.snapshot();
    ASSERT_EQ(after.timestamp, before.timestamp);
    ASSERT_EQ(after.sequence, before.sequence);
    ASSERT_EQ(after.tick, before.tick);
    ASSERT_EQ(after.node, before.node);
}

/**
 * @brief Tick advances stay sub-millisecond, so `time_low` grows monotonically.
 */
void test_v1_time_low_monotonic_within_ms()
{
    Config cfg;
    cfg.tick_ratio = 1.0;

    ManualClock clock(kFixedMs);
    MersenneRandomSource rng(99);
    V1Generator gen(clock, rng, cfg);

    std::uint64_t last = gen.generate().time_low();
    for (int i = 0; i < 500; ++i) {
        std::uint64_t now = gen.generate().time_low();
        ASSERT_TRUE(now > last);
        last = now;
    }
}

void test_v1_reset()
{
    ManualClock clock(kFixedMs);
    ScriptedRandomSource rng({10, 0x02, 0x0, 0x0, 6, 0x200, 0x80, 0x1, 0x0});
    V1Generator gen(clock, rng);

    gen.generate();
    ASSERT_EQ(gen.snapshot().timestamp, kFixedMs);

    gen.reset();
    V1State st = gen.snapshot();
    ASSERT_EQ(st.timestamp, std::int64_t{0});
    ASSERT_EQ(st.tick, std::uint32_t{0});
    ASSERT_EQ(st.sequence, std::uint32_t{0x200});
    ASSERT_EQ(st.node, (std::uint64_t{0x81} << 40) | std::uint64_t{1});
}

/**
 * @brief Concurrent callers sharing one generator never collide.
 */
void test_v1_concurrent_generation()
{
    ManualClock clock(kFixedMs);
    MersenneRandomSource rng(2024);
    V1Generator gen(clock, rng);

    constexpr int kThreads = 4;
    constexpr int kPerThread = 2000;

    std::mutex results_mutex;
    std::set<std::string> results;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&] {
            std::vector<std::string> local;
            local.reserve(kPerThread);
            for (int i = 0; i < kPerThread; ++i) {
                local.push_back(gen.generate().hex_string());
            }
            std::lock_guard<std::mutex> lock(results_mutex);
            results.insert(local.begin(), local.end());
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    ASSERT_EQ(results.size(), static_cast<std::size_t>(kThreads * kPerThread));
}

// ============================================================================
// Version 4
// ============================================================================

void test_v4_version_and_variant()
{
    MersenneRandomSource rng(3);
    V4Generator gen(rng);
    std::set<std::string> seen;
    for (int i = 0; i < 2000; ++i) {
        Identifier id = gen.generate();
        ASSERT_EQ(id.version(), 4u);
        ASSERT_TRUE(has_rfc4122_variant(id));
        seen.insert(id.hex_string());
    }
    ASSERT_EQ(seen.size(), static_cast<std::size_t>(2000));
}

/**
 * @brief Fixed bits survive all-ones and all-zeros entropy.
 */
void test_v4_fixed_bits()
{
    ScriptedRandomSource ones({}, 0xFFFFFFFF);
    ASSERT_EQ(V4Generator(ones).generate_string(),
              std::string("ffffffff-ffff-4fff-bfff-ffffffffffff"));

    ScriptedRandomSource zeros({}, 0);
    ASSERT_EQ(V4Generator(zeros).generate_string(),
              std::string("00000000-0000-4000-8000-000000000000"));
}

// ============================================================================
// Facades
// ============================================================================

void test_facade_generate()
{
    std::string id = uuidforge::Uuid::generate();
    ASSERT_EQ(id.length(), static_cast<std::size_t>(36));
    ASSERT_EQ(id[14], '4');

    auto parsed = uuidforge::Uuid::parse(id);
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(parsed->version(), 4u);
    ASSERT_NE(uuidforge::Uuid::generate(), id);

    ASSERT_EQ(uuidforge::Uuid::generate_v1().version(), 1u);
    ASSERT_FALSE(uuidforge::Uuid::parse("not-a-uuid").has_value());
}

void test_facade_reset_state()
{
    uuidforge::Uuid::generate_v1();
    uuidforge::Uuid::reset_state();
    V1State st = uuidforge::Uuid::context().v1().snapshot();
    ASSERT_EQ(st.timestamp, std::int64_t{0});
    ASSERT_TRUE((st.node & V1Generator::kMulticastBit) != 0);
    ASSERT_EQ(uuidforge::Uuid::generate_v1().node(), st.node);
}

void test_legacy_generator()
{
    uuidforge::Context ctx;
    uuidforge::compat::LegacyGenerator legacy(ctx);

    auto v4 = uuidforge::Uuid::parse(legacy.generate());
    auto v1 = uuidforge::Uuid::parse(legacy.generate({1}));
    ASSERT_TRUE(v4.has_value() && v1.has_value());
    ASSERT_EQ(v4->version(), 4u);
    ASSERT_EQ(v1->version(), 1u);
    ASSERT_EQ(v1->node(), ctx.v1().snapshot().node);
}
