//
// Created by Malik T on 03/09/2025.
//
#include "Simulator.hpp"

#include <format>
#include <future>
#include <thread>
#include <utility>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Round.hpp"
#include "../core/Shoe.hpp"
#include "../core/StandardRules.hpp"
#include "../core/StrategyPlayer.hpp"
#include "../debug/AuditLogger.hpp"

namespace bjsim::sim
{
    namespace
    {
        // Plays `hands` rounds on one shoe. With an audit logger every decision is
        // stepped by hand so the transcript sees it.
        auto RunWorker(core::RuleSet const& rules,
                       uint64_t const seed,
                       uint64_t const hands,
                       core::debug::AuditLogger* audit) -> Trackers
        {
            core::InfiniteShoe shoe(seed);
            core::StrategyPlayer player{};
            Trackers trackers{};

            for (uint64_t n{}; n < hands; ++n)
            {
                if (!audit)
                {
                    trackers.Record(core::PlayRound(rules, shoe, player));
                    continue;
                }

                core::RoundImpl round(rules, std::make_unique<core::StandardRules>(), shoe, player);
                audit->deal(round, n);
                while (!round.IsFinished())
                {
                    std::shared_ptr<core::DecisionSnapshot const> const snap = round.ActiveSnapshot();
                    core::StepOutcome const out = round.Step();
                    audit->turn(*snap, round.LastAction().value_or(core::Action::Stand));
                    audit->outcome(out);
                    if (out == core::StepOutcome::Invalid)
                    {
                        audit->violation(*round.LastViolation());
                        BJS_THROW(core::error::Code::InvalidAction, core::error::describe(*round.LastViolation()));
                    }
                }
                core::RoundResult const result = round.Result();
                audit->end(result);
                trackers.Record(result);
            }
            return trackers;
        }
    }

    auto WorkerSeed(uint64_t const seed, uint32_t const index) noexcept -> uint64_t
    {
        if (index == 0) return seed;
        // splitmix64 step per worker keeps neighbouring seeds apart
        uint64_t z = seed + static_cast<uint64_t>(index) * 0x9E3779B97F4A7C15ULL;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }

    auto Simulate(uint64_t const nhands, bool const hit_soft_17, uint64_t const seed) -> SimulationResult
    {
        SimulationConfig cfg{};
        cfg.hands = nhands;
        cfg.seed = seed;
        cfg.rules.hit_soft_17 = hit_soft_17;
        return Simulate(cfg);
    }

    auto Simulate(SimulationConfig const& config, core::debug::AuditLogger* audit) -> SimulationResult
    {
        core::Validate(config.rules);
        if (config.threads == 0)
            BJS_THROW(core::error::Code::Config, "Simulation needs at least one thread");
        if (config.threads > MaxThreads)
            BJS_THROW(core::error::Code::Config,
                      std::format("{} threads requested, at most {} allowed", config.threads, MaxThreads));
        if (config.threads > 1 && config.threads > config.hands)
            BJS_THROW(core::error::Code::Config,
                      std::format("{} threads for {} hand(s) leaves workers idle", config.threads, config.hands));
        if (audit && config.threads > 1)
            BJS_THROW(core::error::Code::Config, "Audit transcript requires a single-threaded run");

        if (audit) audit->start(config.rules, config.seed, config.hands);

        Trackers total{};
        if (config.threads == 1)
        {
            total = RunWorker(config.rules, config.seed, config.hands, audit);
        }
        else
        {
            uint64_t const per = config.hands / config.threads;
            uint64_t const extra = config.hands % config.threads;

            std::vector<std::future<Trackers>> futures;
            // joined on destruction, so a failed spawn leaves no thread joinable
            std::vector<std::jthread> workers;
            futures.reserve(config.threads);
            workers.reserve(config.threads);

            for (uint32_t i{}; i < config.threads; ++i)
            {
                uint64_t const hands = per + (i < extra ? 1 : 0);
                std::packaged_task<Trackers()> task(
                    [rules = config.rules, seed = WorkerSeed(config.seed, i), hands]
                    {
                        return RunWorker(rules, seed, hands, nullptr);
                    }
                );
                futures.push_back(task.get_future());
                workers.emplace_back(std::move(task));
            }
            for (std::jthread& w : workers) w.join();

            // a worker's exception is stored in its future and rethrown here
            for (std::future<Trackers>& f : futures) total.Merge(f.get());
        }

        SimulationResult res{};
        res.summary = Summarize(total, core::Label(config.rules));
        res.trackers = std::move(total);

        if (audit)
        {
            audit->footer(res.summary);
            audit->flush();
        }
        return res;
    }
}
