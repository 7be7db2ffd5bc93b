#include "AuditLogger.hpp"

#include <format>
#include <string_view>

using namespace bjsim::core;

namespace
{

auto s_policy(InvalidActionPolicy const p) -> std::string_view
{
    return p == InvalidActionPolicy::Reject ? "reject" : "fallback";
}

auto s_options(ActionOptions const& o) -> std::string
{
    std::string body;
    if (o.can_double)    body += "D";
    if (o.can_split)     body += "P";
    if (o.can_surrender) body += "R";
    return body.empty() ? std::string("-") : body;
}

auto s_dealer_total(RoundResult const& r) -> std::string
{
    if (!r.dealer_total) return "unplayed";
    if (*r.dealer_total > constants::Blackjack) return std::format("{} bust", *r.dealer_total);
    return std::to_string(*r.dealer_total);
}

} // anonymous namespace

namespace bjsim::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(RuleSet const& rules, uint64_t const seed, uint64_t const hands) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Hands={}\n", hands);
    out_ << std::format("Rules={} surrender={} das={} resplit={} peek={} bj={} invalid={}\n",
                        Label(rules),
                        rules.late_surrender,
                        rules.das,
                        rules.resplit_limit,
                        rules.peek,
                        rules.blackjack_3to2 ? "3:2" : "1:1",
                        s_policy(rules.invalid_action));
    out_.flush();
}

auto AuditLogger::deal(RoundImpl const& round, uint64_t const round_no) -> void
{
    out_ << std::format("Round {} player=[{}] up={}{}\n",
                        round_no,
                        to_string(round.HandAt(0).cards),
                        to_string(round.DealerUp().rank),
                        round.IsFinished() ? " settled-on-deal" : "");
}

auto AuditLogger::turn(DecisionSnapshot const& s, Action const a) -> void
{
    out_ << std::format(
        "Turn hand=H{} cards=[{}] total={}{} opts={} advice={}\n",
        static_cast<int>(s.hand),
        to_string(s.cards),
        s.total,
        s.soft ? "s" : "",
        s_options(s.options),
        to_string(s.recommended)
    );

    out_ << std::format("Action: {}\n", to_string(a));
}

auto AuditLogger::outcome(StepOutcome const m) -> void
{
    out_ << std::format("Outcome: {}\n", to_string(m));
}

auto AuditLogger::violation(error::RuleViolation const& v) -> void
{
    out_ << std::format("Violation: {}\n", error::describe(v));
}

auto AuditLogger::end(RoundResult const& result) -> void
{
    std::string body;
    for (size_t i{}; i < result.outcomes.size(); ++i)
    {
        Outcome const& o = result.outcomes[i];
        body += std::format("{}H{}:{}:{:+g}",
                            (i ? "," : ""),
                            static_cast<int>(o.hand),
                            to_string(o.kind),
                            o.payoff);
    }

    out_ << std::format("Dealer=[{}] total={}\n", to_string(result.dealer_cards), s_dealer_total(result));
    out_ << std::format("Resolved=[{}] net={:+g}\n", body, result.NetPayoff());
}

auto AuditLogger::footer(sim::Summary const& summary) -> void
{
    out_ << std::format("Summary rule={} hands={} units={:+.1f} ev={:+.5f} win={:.4f} loss={:.4f} push={:.4f}\n",
                        summary.rule,
                        summary.hands_simulated,
                        summary.total_units,
                        summary.ev_per_hand,
                        summary.win_rate,
                        summary.loss_rate,
                        summary.push_rate);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace bjsim::core::debug
