//
// Created by Malik T on 13/08/2025.
//

//
// main.cpp: Monte Carlo blackjack simulator
//

#include <charconv>
#include <cstdint>
#include <cstring>
#include <format>
#include <fstream>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/Exception.hpp"
#include "core/Rules.hpp"
#include "debug/AuditLogger.hpp"
#include "report/codec.hpp"
#include "sim/Simulator.hpp"

namespace
{
    struct CliConfig
    {
        std::uint64_t hands{300'000};
        std::uint64_t seed{7};
        std::uint64_t threads{1};
        bool          s17{false};
        bool          histograms{false};
        std::vector<std::pair<std::string, std::string>> rule_pairs;
        std::optional<std::string> audit_path;
        std::optional<std::string> report_path;
    };

    auto Usage() -> void
    {
        std::print("usage: bjsim [-n|--hands N] [--s17] [--seed N] [--threads N]\n"
                   "             [--rule key=value]... [--audit PATH] [--report PATH] [--histograms]\n");
    }

    auto ParseArgs(int argc, char** argv) -> CliConfig
    {
        using bjsim::core::error::Code;
        CliConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next = [&]() -> std::string_view
            {
                if (i + 1 >= argc) { BJS_THROW(Code::Config, std::format("{} needs a value", arg)); }
                return argv[++i];
            };

            auto next_uint = [&](std::uint64_t& out)
            {
                std::string_view const s = next();
                auto res = std::from_chars(s.data(), s.data() + s.size(), out);
                if (res.ec != std::errc{} || res.ptr != s.data() + s.size())
                {
                    BJS_THROW(Code::Config, std::format("{} expects an unsigned integer, got '{}'", arg, s));
                }
            };

            if (arg == "-n" || arg == "--hands")
            {
                next_uint(cfg.hands);
            }
            else if (arg == "--seed")
            {
                next_uint(cfg.seed);
            }
            else if (arg == "--threads")
            {
                next_uint(cfg.threads);
            }
            else if (arg == "--s17")
            {
                cfg.s17 = true;
            }
            else if (arg == "--rule")
            {
                std::string_view const kv = next();
                auto const eq = kv.find('=');
                if (eq == std::string_view::npos)
                {
                    BJS_THROW(Code::Config, std::format("--rule expects key=value, got '{}'", kv));
                }
                cfg.rule_pairs.emplace_back(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
            }
            else if (arg == "--audit")
            {
                cfg.audit_path = std::string(next());
            }
            else if (arg == "--report")
            {
                cfg.report_path = std::string(next());
            }
            else if (arg == "--histograms")
            {
                cfg.histograms = true;
            }
            else
            {
                BJS_THROW(Code::Config, std::format("unknown argument '{}'", arg));
            }
        }
        return cfg;
    }

    auto PrintHistogram(std::string_view title, std::span<std::uint64_t const> bins, std::size_t lo) -> void
    {
        std::uint64_t total{};
        for (std::size_t i = lo; i < bins.size(); ++i) total += bins[i];
        std::print("{}\n", title);
        for (std::size_t i = lo; i < bins.size(); ++i)
        {
            double const pct = total ? 100.0 * static_cast<double>(bins[i]) / static_cast<double>(total) : 0.0;
            std::print("  {:>2}: {:>10} ({:6.2f}%)\n", i, bins[i], pct);
        }
    }

    auto WriteReport(std::string const& path, bjsim::sim::SimulationResult const& res) -> void
    {
        flatbuffers::DetachedBuffer const buf = bjsim::report::EncodeReport(res);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            BJS_THROW(bjsim::core::error::Code::Serialization, std::format("cannot open report file '{}'", path));
        }
        out.write(reinterpret_cast<char const*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        if (!out)
        {
            BJS_THROW(bjsim::core::error::Code::Serialization, std::format("short write to report file '{}'", path));
        }
    }
}

int main(int argc, char** argv)
{
    using namespace bjsim;
    using namespace bjsim::core;

    try
    {
        if (argc > 1 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0))
        {
            Usage();
            return 0;
        }

        CliConfig const cli = ParseArgs(argc, argv);

        sim::SimulationConfig cfg{};
        cfg.hands = cli.hands;
        cfg.seed = cli.seed;
        cfg.threads = cli.threads;
        cfg.rules = RuleSetFromPairs(cli.rule_pairs);
        if (cli.s17) cfg.rules.hit_soft_17 = false;

        std::print("[bjsim] {} hand(s), seed {}, {} thread(s), {}\n",
                   cfg.hands, cfg.seed, cfg.threads, Describe(cfg.rules));

        std::optional<debug::AuditLogger> audit;
        if (cli.audit_path)
        {
            audit.emplace(*cli.audit_path);
            if (!audit->IsOpen())
            {
                BJS_THROW(error::Code::Config, std::format("cannot open audit file '{}'", *cli.audit_path));
            }
        }

        sim::SimulationResult const res = sim::Simulate(cfg, audit ? &*audit : nullptr);
        sim::Summary const& s = res.summary;

        std::print("\nRule: {}\n", s.rule);
        std::print("Hands simulated: {}\n", s.hands_simulated);
        std::print("Win:  {:.2f}%\n", s.win_rate * 100.0);
        std::print("Loss: {:.2f}%\n", s.loss_rate * 100.0);
        std::print("Push: {:.2f}%\n", s.push_rate * 100.0);
        std::print("EV per initial bet: {:.3f}%  (95% CI {:.3f}% .. {:.3f}%)\n",
                   s.ev_per_hand * 100.0, s.ci95_low * 100.0, s.ci95_high * 100.0);

        if (cli.histograms)
        {
            std::print("\n");
            PrintHistogram("Player final totals (hands compared with the dealer)", res.trackers.player_totals, 4);
            PrintHistogram("Dealer final totals", res.trackers.dealer_totals,
                           static_cast<std::size_t>(constants::DealerStandsOn));
            std::print("  bust: {:>8}\n", res.trackers.counters.dealer_bust);
        }

        if (cli.report_path)
        {
            WriteReport(*cli.report_path, res);
            std::print("[bjsim] report written to {}\n", *cli.report_path);
        }
    }
    catch (error::ConfigError const& e)
    {
        std::print(stderr, "[bjsim] configuration error: {}\n", e.what());
        Usage();
        return 2;
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "[bjsim] {}\n", e);
        return 1;
    }

    return 0;
}
