//
// Created by Malik T on 18/08/2025.
//

#ifndef BJSIM_STRATEGYPLAYER_HPP
#define BJSIM_STRATEGYPLAYER_HPP

#include "Player.hpp"

namespace bjsim::core
{
    // Plays every decision by the basic-strategy chart.
    class StrategyPlayer final : public Player
    {
    public:
        auto Decide(std::shared_ptr<const DecisionSnapshot> snapshot) -> Action override;
    };
}

#endif //BJSIM_STRATEGYPLAYER_HPP
