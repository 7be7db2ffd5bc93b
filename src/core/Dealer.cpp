//
// Created by Malik T on 17/08/2025.
//

#include "Dealer.hpp"

#include "Exception.hpp"

namespace bjsim::core
{
    auto DealerShouldHit(std::span<Card const> cards, bool const hit_soft_17) noexcept -> bool
    {
        HandTotal const v = HandValue(cards);
        if (v.total < constants::DealerStandsOn) return true;
        return v.total == constants::DealerStandsOn && v.soft && hit_soft_17;
    }

    auto DealerPlay(Cards cards, bool const hit_soft_17, DrawSource& shoe) -> Cards
    {
        BJS_ASSERT(cards.size() >= 2, "Dealer plays out with fewer than two cards");
        while (DealerShouldHit(cards, hit_soft_17))
        {
            cards.push_back(shoe.Next());
        }
        return cards;
    }
}
