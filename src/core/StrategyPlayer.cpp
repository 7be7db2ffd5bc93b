//
// Created by Malik T on 18/08/2025.
//

#include "StrategyPlayer.hpp"

#include "Strategy.hpp"

namespace bjsim::core
{
    auto StrategyPlayer::Decide(std::shared_ptr<const DecisionSnapshot> snapshot) -> Action
    {
        ActionOptions const& o = snapshot->options;
        return BasicStrategy::Recommend(snapshot->cards, snapshot->dealer_up.rank,
                                        o.can_double, o.can_split, o.can_surrender);
    }
}
