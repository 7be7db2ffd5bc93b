//
// Created by malikt on 8/20/25.
//

#ifndef BJSIM_RECORDINGPLAYER_HPP
#define BJSIM_RECORDINGPLAYER_HPP

#include <memory>
#include <utility>
#include <vector>

#include "../core/Player.hpp"

namespace bjsim::core::debug
{
    // Forwards to an inner player and keeps every proposed action in order.
    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Decide(std::shared_ptr<const DecisionSnapshot> s) -> Action override
        {
            Action const a = inner_->Decide(std::move(s));
            history_.push_back(a);
            return a;
        }

        auto HasLast() const -> bool
        {
            return !history_.empty();
        }

        auto Last() const -> Action
        {
            return history_.back();
        }

    private:
        std::unique_ptr<Player> inner_;
        std::vector<Action> history_;
    };
} // namespace bjsim::core::debug

#endif //BJSIM_RECORDINGPLAYER_HPP
