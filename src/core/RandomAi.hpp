//
// Created by Malik T on 18/08/2025.
//

#ifndef BJSIM_RANDOMAI_HPP
#define BJSIM_RANDOMAI_HPP

#include <random>
#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace bjsim::core
{
    // Picks uniformly among the five actions. With legal_only the pick is
    // restricted to what the snapshot's options allow; without it the player
    // also proposes illegal moves, which exercises rejection paths.
    class RandomAI final : public bjsim::core::Player
    {
    public:
        explicit RandomAI(uint64_t rng_seed, bool legal_only = true);

        auto Decide(std::shared_ptr<const bjsim::core::DecisionSnapshot> snapshot) -> bjsim::core::Action override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

    private:
        std::mt19937 rng_;
        bool legal_only_;
    };
}

#endif //BJSIM_RANDOMAI_HPP
