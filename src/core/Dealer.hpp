//
// Created by Malik T on 17/08/2025.
//

#ifndef BJSIM_DEALER_HPP
#define BJSIM_DEALER_HPP

#include <span>
#include "Hand.hpp"
#include "Shoe.hpp"

namespace bjsim::core
{
    [[nodiscard]]
    auto DealerShouldHit(std::span<Card const> cards, bool hit_soft_17) noexcept -> bool;

    // Draws until the dealer stands. Each draw raises the hard total by at least
    // one, so the loop is bounded.
    auto DealerPlay(Cards cards, bool hit_soft_17, DrawSource& shoe) -> Cards;
}

#endif //BJSIM_DEALER_HPP
