//
// Created by Malik T on 16/08/2025.
//

#include "Hand.hpp"

#include <algorithm>

namespace bjsim::core
{
    auto HandValue(std::span<Card const> cards) noexcept -> HandTotal
    {
        int total = 0;
        int aces_high = 0;
        for (Card const& c : cards)
        {
            total += CardValue(c.rank);
            if (c.rank == Rank::Ace)
            {
                total += constants::SoftAceBonus;
                ++aces_high;
            }
        }
        // demote aces one at a time until the hand fits or none is left at 11
        while (total > constants::Blackjack && aces_high > 0)
        {
            total -= constants::SoftAceBonus;
            --aces_high;
        }
        return HandTotal{.total = total, .soft = aces_high > 0};
    }

    auto IsBlackjack(std::span<Card const> cards) noexcept -> bool
    {
        if (cards.size() != 2) return false;
        bool const has_ace = std::ranges::any_of(cards, [](Card const& c) { return c.rank == Rank::Ace; });
        return has_ace && HandValue(cards).total == constants::Blackjack;
    }

    auto IsPair(std::span<Card const> cards) noexcept -> bool
    {
        return cards.size() == 2 && SameValue(cards[0], cards[1]);
    }
}
