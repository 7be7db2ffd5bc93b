//
// Created by Malik T on 14/08/2025.
//

#ifndef BJSIM_STATE_HPP
#define BJSIM_STATE_HPP

#include "Types.hpp"
#include "Actions.hpp"

namespace bjsim::core
{
    // Which optional actions the active hand may take right now.
    struct ActionOptions
    {
        bool can_double{false};
        bool can_split{false};
        bool can_surrender{false};

        auto operator==(ActionOptions const&) const -> bool = default;
    };

    // Immutable view handed to a Player for one decision.
    struct DecisionSnapshot
    {
        HandIdx hand{};
        Cards cards;
        int total{};
        bool soft{false};
        bool from_split{false};
        uint8_t multiplier{1};

        Card dealer_up{};
        uint8_t hands_in_round{1};
        uint8_t splits_used{};

        ActionOptions options{};
        // what basic strategy would do here; display only
        Action recommended{Action::Stand};
    };

} // namespace bjsim::core

#endif //BJSIM_STATE_HPP
