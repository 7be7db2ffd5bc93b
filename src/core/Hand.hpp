//
// Created by Malik T on 16/08/2025.
//

#ifndef BJSIM_HAND_HPP
#define BJSIM_HAND_HPP

#include <optional>
#include <span>
#include "Types.hpp"
#include "Actions.hpp"

namespace bjsim::core
{
    struct HandTotal
    {
        int total{};
        bool soft{false};

        auto operator==(HandTotal const&) const -> bool = default;
    };

    // Ace counts 1 here; the soft bonus is applied by HandValue.
    constexpr auto CardValue(Rank const r) noexcept -> int
    {
        switch (r)
        {
        case Rank::Ace: return 1;
        case Rank::Ten:
        case Rank::Jack:
        case Rank::Queen:
        case Rank::King: return 10;
        default: return static_cast<int>(r) + 2;
        }
    }

    // Dealer upcard value as the strategy charts index it (Ace = 11).
    constexpr auto UpcardValue(Rank const r) noexcept -> int
    {
        return r == Rank::Ace ? 11 : CardValue(r);
    }

    constexpr auto IsTenValue(Rank const r) noexcept -> bool { return CardValue(r) == 10; }

    constexpr auto SameValue(Card const a, Card const b) noexcept -> bool
    {
        return CardValue(a.rank) == CardValue(b.rank);
    }

    [[nodiscard]]
    auto HandValue(std::span<Card const> cards) noexcept -> HandTotal;

    // Only meaningful for the original two-card hand; split hands never qualify.
    [[nodiscard]]
    auto IsBlackjack(std::span<Card const> cards) noexcept -> bool;

    [[nodiscard]]
    auto IsPair(std::span<Card const> cards) noexcept -> bool;

    struct Hand
    {
        Cards cards;
        HandStatus status{HandStatus::Pending};
        uint8_t multiplier{1};
        uint8_t decisions{0};
        bool from_split{false};
        std::optional<Outcome> outcome{};

        [[nodiscard]] auto Value() const noexcept -> HandTotal { return HandValue(cards); }
        [[nodiscard]] auto Total() const noexcept -> int { return Value().total; }
        [[nodiscard]] auto IsBust() const noexcept -> bool { return Total() > constants::Blackjack; }
        [[nodiscard]] auto IsNatural() const noexcept -> bool { return !from_split && IsBlackjack(cards); }
        [[nodiscard]] auto IsResolved() const noexcept -> bool { return outcome.has_value(); }
    };
}

#endif //BJSIM_HAND_HPP
