//
// Created by Malik T on 14/08/2025.
//

#ifndef BJSIM_PLAYER_HPP
#define BJSIM_PLAYER_HPP

#include <memory>
#include "Actions.hpp"
#include "State.hpp"

namespace bjsim::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called by the round loop for every decision on the active hand
        // (basic-strategy adapter, scripted test actor or an interactive trainer).
        // An illegal answer is rejected by the rules, never applied.
        virtual auto Decide(std::shared_ptr<const DecisionSnapshot> snapshot) -> Action = 0;
    };
}
#endif //BJSIM_PLAYER_HPP
