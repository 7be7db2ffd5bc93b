//
// Created by Malik T on 15/08/2025.
//
#include "Round.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

#include "Dealer.hpp"
#include "StandardRules.hpp"
#include "Strategy.hpp"

namespace bjsim::core
{
    auto RoundResult::NetPayoff() const noexcept -> double
    {
        return std::accumulate(outcomes.cbegin(), outcomes.cend(), 0.0,
                               [](double acc, Outcome const& o) { return acc + o.payoff; });
    }

    RoundImpl::RoundImpl(RuleSet const& config,
                         std::unique_ptr<Rules> rules,
                         DrawSource& shoe,
                         Player& player) :
        cfg_(config),
        rules_(std::move(rules)),
        shoe_(shoe),
        player_(player)
    {
        Validate(cfg_);
        BJS_ASSERT(rules_ != nullptr, "Round constructed without a rules engine");
        hands_.reserve(static_cast<size_t>(cfg_.resplit_limit) + 1);
        DealInitial();
        SettleNaturals();
    }

    auto RoundImpl::DealInitial() -> void
    {
        Hand first{};
        first.cards.push_back(Draw());
        first.cards.push_back(Draw());
        hands_.push_back(std::move(first));

        dealer_.push_back(Draw());
        dealer_.push_back(Draw());
    }

    auto RoundImpl::SettleNaturals() -> void
    {
        bool const dealer_bj = IsBlackjack(dealer_);
        bool const player_bj = hands_.front().IsNatural();
        Rank const up = DealerUp().rank;
        bool const up_shows_bj = IsTenValue(up) || up == Rank::Ace;

        if (cfg_.peek && up_shows_bj && dealer_bj)
        {
            hands_.front().status = player_bj ? HandStatus::Blackjack : HandStatus::Stood;
            if (player_bj) Resolve(0, ResultKind::BlackjackPush, 0.0);
            else Resolve(0, ResultKind::DealerBlackjack, -1.0);
            finished_ = true;
            return;
        }

        if (player_bj)
        {
            hands_.front().status = HandStatus::Blackjack;
            if (dealer_bj) Resolve(0, ResultKind::BlackjackPush, 0.0);
            else Resolve(0, ResultKind::BlackjackWin, cfg_.blackjack_3to2 ? 1.5 : 1.0);
            finished_ = true;
            return;
        }

        hands_.front().status = HandStatus::Active;
        active_ = 0;
    }

    auto RoundImpl::Draw() -> Card
    {
        return shoe_.Next();
    }

    auto RoundImpl::Resolve(HandIdx const idx, ResultKind const kind, double const payoff) -> void
    {
        Hand& h = hands_.at(idx);
        BJS_ASSERT(!h.IsResolved(), std::format("Hand H{} resolved twice", static_cast<int>(idx)));

        HandTotal const v = h.Value();
        h.outcome = Outcome{
            .kind = kind,
            .payoff = payoff,
            .hand = idx,
            .player_total = v.total,
            .card_count = static_cast<uint8_t>(h.cards.size()),
            .multiplier = h.multiplier,
            .from_split = h.from_split,
            .busted = v.total > constants::Blackjack
        };
    }

    auto RoundImpl::SplitActive() -> HandIdx
    {
        BJS_ASSERT(active_.has_value(), "Split without an active hand");
        BJS_ASSERT(std::cmp_less(splits_used_, cfg_.resplit_limit), "Split beyond the resplit limit");

        HandIdx const src = *active_;
        BJS_ASSERT(IsPair(hands_[src].cards), "Split on a hand that is not a pair");

        Card const keep = hands_[src].cards[0];
        Card const moved = hands_[src].cards[1];

        hands_[src].cards = Cards{keep, Draw()};
        hands_[src].from_split = true;

        Hand second{};
        second.cards = Cards{moved, Draw()};
        second.from_split = true;
        second.status = HandStatus::Pending;

        auto const idx = static_cast<HandIdx>(hands_.size());
        hands_.push_back(std::move(second));
        pending_.push_back(idx);
        ++splits_used_;
        return idx;
    }

    auto RoundImpl::ActivateNext() -> bool
    {
        BJS_ASSERT(!active_.has_value() || IsTerminal(hands_[*active_].status),
                   "Activating a pending hand while another is still in play");
        active_.reset();
        if (pending_.empty()) return false;

        HandIdx const next = pending_.back();
        pending_.pop_back();
        BJS_ASSERT(hands_[next].status == HandStatus::Pending, "Work-list held a hand that was not pending");
        hands_[next].status = HandStatus::Active;
        active_ = next;
        return true;
    }

    auto RoundImpl::FinishRound() -> void
    {
        BJS_ASSERT(!active_.has_value() && pending_.empty(), "Round finished with hands still in play");

        auto const waiting = [](Hand const& h)
        {
            return !h.IsResolved() && (h.status == HandStatus::Stood || h.status == HandStatus::Doubled);
        };

        if (std::ranges::any_of(hands_, waiting))
        {
            dealer_ = DealerPlay(std::move(dealer_), cfg_.hit_soft_17, shoe_);
            dealer_played_ = true;

            int const dealer_total = HandValue(dealer_).total;
            bool const dealer_bj = IsBlackjack(dealer_);
            bool const dealer_bust = dealer_total > constants::Blackjack;

            for (size_t i{}; i < hands_.size(); ++i)
            {
                Hand const& h = hands_[i];
                if (!waiting(h)) continue;

                auto const idx = static_cast<HandIdx>(i);
                double const stake = h.multiplier;
                int const total = h.Total();

                if (dealer_bj) Resolve(idx, ResultKind::DealerBlackjack, -stake);
                else if (dealer_bust) Resolve(idx, ResultKind::DealerBustWin, stake);
                else if (total > dealer_total) Resolve(idx, ResultKind::Win, stake);
                else if (total < dealer_total) Resolve(idx, ResultKind::Loss, -stake);
                else Resolve(idx, ResultKind::Push, 0.0);
                hands_[i].outcome->vs_dealer = true;
            }
        }

        BJS_ASSERT(std::ranges::all_of(hands_, [](Hand const& h) { return h.IsResolved(); }),
                   "Round finished with an unresolved hand");
        finished_ = true;
    }

    auto RoundImpl::MaxSteps() const noexcept -> uint32_t
    {
        // a hand can take at most 20 hits before it busts, plus one closing decision
        // and one split decision per extra hand
        uint32_t const hands = static_cast<uint32_t>(cfg_.resplit_limit) + 1;
        return hands * 22;
    }

    auto RoundImpl::SnapshotFor(HandIdx const hand) const -> std::shared_ptr<DecisionSnapshot const>
    {
        Hand const& h = hands_.at(hand);
        std::shared_ptr<DecisionSnapshot> snap = std::make_shared<DecisionSnapshot>();
        HandTotal const v = h.Value();

        snap->hand = hand;
        snap->cards = h.cards;
        snap->total = v.total;
        snap->soft = v.soft;
        snap->from_split = h.from_split;
        snap->multiplier = h.multiplier;
        snap->dealer_up = DealerUp();
        snap->hands_in_round = static_cast<uint8_t>(hands_.size());
        snap->splits_used = splits_used_;

        if (active_ && *active_ == hand)
        {
            snap->options = rules_->Options(*this);
            snap->recommended = BasicStrategy::Recommend(h.cards, DealerUp().rank,
                                                         snap->options.can_double,
                                                         snap->options.can_split,
                                                         snap->options.can_surrender);
        }
        return snap;
    }

    auto RoundImpl::ActiveSnapshot() const -> std::shared_ptr<DecisionSnapshot const>
    {
        if (!active_) BJS_THROW(error::Code::State, "No hand is awaiting a decision");
        return SnapshotFor(*active_);
    }

    auto RoundImpl::Recommend() const -> Action
    {
        return ActiveSnapshot()->recommended;
    }

    auto RoundImpl::Step() -> StepOutcome
    {
        if (finished_) BJS_THROW(error::Code::State, "Step called on a finished round");
        BJS_ASSERT(active_.has_value(), "Unfinished round without an active hand");

        std::shared_ptr<DecisionSnapshot const> snap = ActiveSnapshot();
        Action action = player_.Decide(snap);
        last_action_ = action;

        if (auto const ok = rules_->Validate(*this, action); !ok.has_value())
        {
            last_violation_ = ok.error();
            if (cfg_.invalid_action == InvalidActionPolicy::Reject)
                return StepOutcome::Invalid;

            // nearest legal play: what basic strategy does under the current options
            action = snap->recommended;
            last_action_ = action;
            ++fallbacks_;
            auto const retry = rules_->Validate(*this, action);
            BJS_ASSERT(retry.has_value(), "Basic strategy proposed an illegal action");
        }

        rules_->Apply(*this, action);
        ++steps_;
        BJS_ASSERT(steps_ <= MaxSteps(), "Round exceeded its decision bound");
        return rules_->Advance(*this);
    }

    auto RoundImpl::Play() -> RoundResult
    {
        while (!finished_)
        {
            if (Step() == StepOutcome::Invalid)
            {
                BJS_THROW(error::Code::InvalidAction, error::describe(*last_violation_));
            }
        }
        return Result();
    }

    auto RoundImpl::Result() const -> RoundResult
    {
        if (!finished_) BJS_THROW(error::Code::State, "Result requested before the round finished");

        RoundResult res{};
        res.outcomes.reserve(hands_.size());
        for (Hand const& h : hands_)
        {
            BJS_ASSERT(h.IsResolved(), "Finished round holds an unresolved hand");
            res.outcomes.push_back(*h.outcome);
        }
        res.splits = splits_used_;
        res.doubles = doubles_;
        res.dealer_cards = dealer_;
        res.dealer_blackjack = IsBlackjack(dealer_);
        if (dealer_played_) res.dealer_total = HandValue(dealer_).total;
        return res;
    }

    auto PlayRound(RuleSet const& config, DrawSource& shoe, Player& player) -> RoundResult
    {
        RoundImpl round(config, std::make_unique<StandardRules>(), shoe, player);
        return round.Play();
    }

    auto PlayHandOnce(RuleSet const& config, DrawSource& shoe, Player& player) -> std::vector<Outcome>
    {
        return PlayRound(config, shoe, player).outcomes;
    }
}
