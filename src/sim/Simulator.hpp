//
// Created by Malik T on 03/09/2025.
//

#ifndef BJSIM_SIMULATOR_HPP
#define BJSIM_SIMULATOR_HPP

#include <cstdint>
#include "../core/Rules.hpp"
#include "Trackers.hpp"

namespace bjsim::core::debug {class AuditLogger;}
namespace bjsim::sim
{
    inline constexpr uint64_t MaxThreads = 256;

    struct SimulationConfig
    {
        uint64_t hands{300'000};
        uint64_t seed{7};
        uint64_t threads{1};
        core::RuleSet rules{};
    };

    struct SimulationResult
    {
        Summary summary;
        Trackers trackers;

        auto operator==(SimulationResult const&) const -> bool = default;
    };

    // Seed of worker `index` in a run seeded with `seed`. Worker 0 uses the run seed,
    // so a single-threaded run matches Simulate(nhands, h17, seed).
    auto WorkerSeed(uint64_t seed, uint32_t index) noexcept -> uint64_t;

    // Basic-strategy player against an infinite shoe with the default table rules.
    auto Simulate(uint64_t nhands, bool hit_soft_17, uint64_t seed) -> SimulationResult;

    // Throws ConfigError for zero threads, more than MaxThreads, more threads than
    // hands, or an audit transcript requested on a multi-threaded run.
    auto Simulate(SimulationConfig const& config, core::debug::AuditLogger* audit = nullptr) -> SimulationResult;
}

#endif //BJSIM_SIMULATOR_HPP
