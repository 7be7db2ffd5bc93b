//
// Created by Malik T on 18/08/2025.
//

#include "RandomAi.hpp"

#include <array>
#include <vector>

namespace bjsim::core
{
    RandomAI::RandomAI(uint64_t rng_seed, bool legal_only):
        rng_(rng_seed), legal_only_(legal_only) {}

    auto RandomAI::Decide(std::shared_ptr<const DecisionSnapshot> snapshot) -> Action
    {
        static constexpr std::array<Action, 5> all{
            Action::Hit, Action::Stand, Action::Double, Action::Split, Action::Surrender
        };
        if (!legal_only_)
        {
            return all[pick(all)];
        }

        std::vector<Action> cand{Action::Hit, Action::Stand};
        if (snapshot->options.can_double) cand.push_back(Action::Double);
        if (snapshot->options.can_split) cand.push_back(Action::Split);
        if (snapshot->options.can_surrender) cand.push_back(Action::Surrender);
        return cand[pick(cand)];
    }
}
