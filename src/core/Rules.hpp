//
// Created by Malik T on 15/08/2025.
//

#ifndef BJSIM_RULES_HPP
#define BJSIM_RULES_HPP

#include <span>
#include <string>
#include <string_view>
#include <utility>
#include "Actions.hpp"
#include "Types.hpp"
#include "State.hpp"
#include "Exception.hpp"

namespace bjsim::core
{
    enum class InvalidActionPolicy : uint8_t
    {
        Reject,   // Play() throws InvalidActionError
        Fallback  // Play() substitutes the basic-strategy action
    };

    struct RuleSet
    {
        bool hit_soft_17{true};
        bool late_surrender{true};
        bool das{true};
        int  resplit_limit{constants::DefaultResplitLimit};
        bool peek{true};
        bool blackjack_3to2{true};
        InvalidActionPolicy invalid_action{InvalidActionPolicy::Reject};

        auto operator==(RuleSet const&) const -> bool = default;
    };

    // Throws ConfigError; called before any round is played.
    auto Validate(RuleSet const& rules) -> void;

    // "H17" or "S17"
    auto Label(RuleSet const& rules) -> std::string_view;
    auto Describe(RuleSet const& rules) -> std::string;

    // Applies key=value overrides on top of the defaults. Unknown keys and
    // malformed values throw ConfigError.
    auto RuleSetFromPairs(std::span<std::pair<std::string, std::string> const> pairs) -> RuleSet;
    auto ApplyRuleOverride(RuleSet& rules, std::string_view key, std::string_view value) -> void;

    //forward declaration
    class RoundImpl;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        virtual auto Options(RoundImpl const& round) const -> ActionOptions = 0;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(RoundImpl const& round, Action a) const -> CheckResult = 0;

        // Mutate authoritative state (draw cards, split hands, set multipliers).
        virtual auto Apply(RoundImpl& round, Action a) -> void = 0;

        virtual auto Advance(RoundImpl& round) -> StepOutcome = 0;
    };
}

#endif //BJSIM_RULES_HPP
