//
// Created by Malik T on 20/08/2025.
//

#ifndef BJSIM_AUDITLOGGER_HPP
#define BJSIM_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Round.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Rules.hpp"
#include "../sim/Trackers.hpp"

namespace bjsim::core::debug
{
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]] auto IsOpen() const -> bool { return out_.is_open(); }

        // Run header (seed, rules, requested hands)
        auto start(RuleSet const& rules, std::uint64_t seed, std::uint64_t hands) -> void;

        // Opening cards of a round, before any decision
        auto deal(RoundImpl const& round, std::uint64_t round_no) -> void;

        // Per decision: the snapshot the player saw and the action that was applied
        auto turn(DecisionSnapshot const& s, Action a) -> void;

        // Per step outcome (after Apply/Advance)
        auto outcome(StepOutcome m) -> void;

        auto violation(error::RuleViolation const& v) -> void;

        // Resolved hands and the dealer's final cards
        auto end(RoundResult const& result) -> void;

        auto footer(sim::Summary const& summary) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //BJSIM_AUDITLOGGER_HPP
