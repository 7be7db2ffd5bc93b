//
// Created by Malik T on 14/08/2025.
//

#ifndef BJSIM_ACTIONS_HPP
#define BJSIM_ACTIONS_HPP

#include <string_view>
#include "Types.hpp"

namespace bjsim::core
{
    enum class Action : uint8_t
    {
        Hit,
        Stand,
        Double,
        Split,
        Surrender
    };

    enum class StepOutcome : uint8_t
    {
        Invalid,
        Applied,
        HandDone,
        RoundEnded
    };

    enum class HandStatus : uint8_t
    {
        Active,
        Pending,
        Stood,
        Busted,
        Doubled,
        Surrendered,
        Blackjack
    };

    enum class ResultKind : uint8_t
    {
        Win = 0,
        Loss,
        Push,
        BlackjackWin,
        BlackjackPush,
        Surrender,
        DealerBlackjack,
        DealerBustWin
    };
    inline constexpr size_t ResultKindCount = 8;

    struct Outcome
    {
        ResultKind kind{ResultKind::Push};
        double payoff{0.0};

        // what the trackers need from the resolved hand
        HandIdx hand{};
        int player_total{};
        uint8_t card_count{};
        uint8_t multiplier{1};
        bool from_split{false};
        bool busted{false};
        bool vs_dealer{false};
    };

    inline auto to_string(Action const a) -> std::string_view
    {
        switch (a)
        {
        case Action::Hit: return "Hit";
        case Action::Stand: return "Stand";
        case Action::Double: return "Double";
        case Action::Split: return "Split";
        case Action::Surrender: return "Surrender";
        }
        return "?";
    }

    inline auto to_string(ResultKind const k) -> std::string_view
    {
        switch (k)
        {
        case ResultKind::Win: return "win";
        case ResultKind::Loss: return "loss";
        case ResultKind::Push: return "push";
        case ResultKind::BlackjackWin: return "blackjack_win";
        case ResultKind::BlackjackPush: return "blackjack_push";
        case ResultKind::Surrender: return "surrender";
        case ResultKind::DealerBlackjack: return "dealer_blackjack";
        case ResultKind::DealerBustWin: return "dealer_bust_win";
        }
        return "unknown";
    }

    inline auto to_string(StepOutcome const o) -> std::string_view
    {
        switch (o)
        {
        case StepOutcome::Invalid: return "Invalid";
        case StepOutcome::Applied: return "Applied";
        case StepOutcome::HandDone: return "HandDone";
        case StepOutcome::RoundEnded: return "RoundEnded";
        }
        return "?";
    }

    // Terminal statuses never take another decision.
    inline constexpr auto IsTerminal(HandStatus const s) noexcept -> bool
    {
        return s != HandStatus::Active && s != HandStatus::Pending;
    }
} // namespace bjsim::core

#endif //BJSIM_ACTIONS_HPP
