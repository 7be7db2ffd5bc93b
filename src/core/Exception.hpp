//
// Created by Malik T on 14/08/2025.
//

#ifndef BJSIM_EXCEPTION_HPP
#define BJSIM_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace bjsim::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Config, // malformed rule set or simulation config
        Rules, // rules engine misuse (not a player's illegal move)
        State, // round engine misuse (not a player's illegal move)
        InvalidAction, // player proposed an action that cannot be applied
        ShoeExhausted, // draw source has no card left
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ShoeExhaustedError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Config: throw ConfigError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::ShoeExhausted: throw ShoeExhaustedError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define BJS_THROW(code_enum, msg) ::bjsim::core::error::fail((code_enum), (msg))
#define BJS_ASSERT(cond, msg) do { if(!(cond)) ::bjsim::core::error::fail(::bjsim::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        NoActiveHand,
        HandAlreadyTerminal,

        // Double
        Double_NotTwoCards,
        Double_AfterSplitDisallowed,

        // Split
        Split_NotTwoCards,
        Split_NotAPair,
        Split_LimitReached,

        // Surrender
        Surrender_Disabled,
        Surrender_AfterSplit,
        Surrender_NotFirstDecision,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Action> action{};
        std::optional<HandIdx> hand{};

        // Small integers useful in error messages
        std::optional<std::uint8_t> card_count{};
        std::optional<std::uint8_t> splits_used{};
        std::optional<std::uint8_t> split_limit{};
        std::optional<std::uint8_t> decisions{};

        // Card-related details
        std::optional<Rank> first{};
        std::optional<Rank> second{};

        // Quick helpers to build enriched violations (fluent style).
        auto with_action(Action a) -> RuleViolation&
        {
            action = a;
            return *this;
        }

        auto with_hand(HandIdx h) -> RuleViolation&
        {
            hand = h;
            return *this;
        }

        auto with_cards(std::uint8_t n) -> RuleViolation&
        {
            card_count = n;
            return *this;
        }

        auto with_splits(std::uint8_t used, std::uint8_t limit) -> RuleViolation&
        {
            splits_used = used;
            split_limit = limit;
            return *this;
        }

        auto with_decisions(std::uint8_t n) -> RuleViolation&
        {
            decisions = n;
            return *this;
        }

        auto with_pair(Rank a, Rank b) -> RuleViolation&
        {
            first = a;
            second = b;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        // Flow
        case E::NoActiveHand: return "No hand is awaiting a decision";
        case E::HandAlreadyTerminal: return "Hand already finished";

        // Double
        case E::Double_NotTwoCards: return "Double: only allowed on two cards";
        case E::Double_AfterSplitDisallowed: return "Double: not allowed after split";

        // Split
        case E::Split_NotTwoCards: return "Split: only allowed on two cards";
        case E::Split_NotAPair: return "Split: cards differ in value";
        case E::Split_LimitReached: return "Split: resplit limit reached";

        // Surrender
        case E::Surrender_Disabled: return "Surrender: not offered by rules";
        case E::Surrender_AfterSplit: return "Surrender: not allowed on a split hand";
        case E::Surrender_NotFirstDecision: return "Surrender: only allowed as first decision";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.action) s += std::format(" | action={}", to_string(*v.action));
        if (v.hand) s += std::format(" | hand=H{}", static_cast<int>(*v.hand));
        if (v.card_count) s += std::format(" | cards={}", *v.card_count);
        if (v.splits_used) s += std::format(" | splits={}", *v.splits_used);
        if (v.split_limit) s += std::format(" | limit={}", *v.split_limit);
        if (v.decisions) s += std::format(" | decisions={}", *v.decisions);
        if (v.first && v.second) s += std::format(" | pair={},{}", to_string(*v.first), to_string(*v.second));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //BJSIM_EXCEPTION_HPP
