//
// Created by Malik T on 15/08/2025.
//

#ifndef BJSIM_ROUND_HPP
#define BJSIM_ROUND_HPP

#include <memory>
#include <optional>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "Hand.hpp"
#include "Shoe.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Player.hpp"

namespace bjsim::core::debug {struct Inspector;}
namespace bjsim::core
{
    struct RoundResult
    {
        // one entry per resolved hand, in hand-creation order
        std::vector<Outcome> outcomes;
        uint8_t splits{};
        uint8_t doubles{};
        Cards dealer_cards;
        // set only when the dealer had to play the hand out
        std::optional<int> dealer_total{};
        bool dealer_blackjack{false};

        [[nodiscard]] auto NetPayoff() const noexcept -> double;
    };

    class RoundImpl
    {
    public:
        RoundImpl() = delete;
        // Deals immediately; naturals and the dealer peek may finish the round here.
        RoundImpl(RuleSet const& config,
                  std::unique_ptr<Rules> rules,
                  DrawSource& shoe,
                  Player& player);

        RoundImpl(RoundImpl const&) = delete;
        auto operator=(RoundImpl const&) -> RoundImpl& = delete;

        // One decision on the active hand: ask the player, validate/apply/advance.
        auto Step() -> StepOutcome;
        // Steps until every hand is resolved.
        auto Play() -> RoundResult;

        auto SnapshotFor(HandIdx hand) const -> std::shared_ptr<DecisionSnapshot const>;
        auto ActiveSnapshot() const -> std::shared_ptr<DecisionSnapshot const>;
        // Read-only basic-strategy consult for the active hand.
        auto Recommend() const -> Action;
        auto Result() const -> RoundResult;

        auto IsFinished() const noexcept    -> bool { return finished_; }
        auto Active() const noexcept        -> std::optional<HandIdx> { return active_; }
        auto HandCount() const noexcept     -> size_t { return hands_.size(); }
        auto HandAt(HandIdx idx) const      -> Hand const& { return hands_.at(idx); }
        auto DealerCards() const noexcept   -> Cards const& { return dealer_; }
        auto DealerUp() const noexcept      -> Card { return dealer_.front(); }
        auto DealerPlayed() const noexcept  -> bool { return dealer_played_; }
        auto SplitsUsed() const noexcept    -> uint8_t { return splits_used_; }
        auto PendingCount() const noexcept  -> size_t { return pending_.size(); }
        auto Config() const noexcept        -> RuleSet const& { return cfg_; }
        auto Fallbacks() const noexcept     -> uint32_t { return fallbacks_; }
        auto LastAction() const noexcept    -> std::optional<Action> { return last_action_; }
        auto LastViolation() const noexcept -> std::optional<error::RuleViolation> const& { return last_violation_; }

        //allows class to directly access private data on an instance
        friend class StandardRules;
        friend struct debug::Inspector;

        auto Draw() -> Card;
        // Records the outcome of a hand. Throws AssertionError on a second resolve.
        auto Resolve(HandIdx idx, ResultKind kind, double payoff) -> void;
        // Splits the active hand; the new second hand goes on the work-list.
        auto SplitActive() -> HandIdx;
        // Pops the next pending hand; false when the work-list is empty.
        auto ActivateNext() -> bool;
        // Dealer plays out (when needed) and every waiting hand is settled.
        auto FinishRound() -> void;

    private:
        auto DealInitial() -> void;
        auto SettleNaturals() -> void;
        auto MaxSteps() const noexcept -> uint32_t;

    private:
        RuleSet cfg_;
        std::unique_ptr<Rules> rules_;
        DrawSource& shoe_;
        Player& player_;

        // Authoritative state
        std::vector<Hand> hands_;           // every hand of the round, creation order
        std::vector<HandIdx> pending_;      // split hands awaiting decisions (stack)
        std::optional<HandIdx> active_{};
        Cards dealer_;

        uint8_t splits_used_{0};            // shared by all descendants of the original hand
        uint8_t doubles_{0};
        uint32_t steps_{0};
        uint32_t fallbacks_{0};
        bool dealer_played_{false};
        bool finished_{false};

        std::optional<Action> last_action_{};
        std::optional<error::RuleViolation> last_violation_{};
    };

    auto PlayRound(RuleSet const& config, DrawSource& shoe, Player& player) -> RoundResult;
    auto PlayHandOnce(RuleSet const& config, DrawSource& shoe, Player& player) -> std::vector<Outcome>;
}
#endif //BJSIM_ROUND_HPP
