//
// Created by Malik T on 19/08/2025.
//

#ifndef BJSIM_INSPECTOR_HPP
#define BJSIM_INSPECTOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "../core/Types.hpp"
#include "../core/Round.hpp"

namespace bjsim::core::debug
{
    struct Inspector
    {
        struct HandView
        {
            Cards cards;
            HandStatus status{};
            uint8_t multiplier{1};
            bool from_split{false};
            bool resolved{false};
        };

        struct SnapshotAll
        {
            std::vector<HandView> hands;
            std::vector<HandIdx> pending;
            std::optional<HandIdx> active;
            Cards dealer;

            uint8_t splits_used{};
            int resplit_limit{};
            bool dealer_played{false};
            bool finished{false};
        };

        static inline auto Gather(RoundImpl const& r) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.pending = r.pending_;
            ret.active = r.active_;
            ret.dealer = r.dealer_;
            ret.splits_used = r.splits_used_;
            ret.resplit_limit = r.cfg_.resplit_limit;
            ret.dealer_played = r.dealer_played_;
            ret.finished = r.finished_;

            ret.hands.reserve(r.hands_.size());
            for (Hand const& h : r.hands_)
            {
                ret.hands.push_back(HandView{
                    .cards = h.cards,
                    .status = h.status,
                    .multiplier = h.multiplier,
                    .from_split = h.from_split,
                    .resolved = h.IsResolved()
                });
            }
            return ret;
        }
    };
}

#endif //BJSIM_INSPECTOR_HPP
