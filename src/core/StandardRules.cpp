//
// Created by Malik T on 15/08/2025.
//

#include "StandardRules.hpp"

#include <utility>
#include "Round.hpp"

namespace
{
    inline auto Viol(bjsim::core::error::RuleViolationCode code) -> bjsim::core::error::RuleViolation
    {
        return bjsim::core::error::RuleViolation{ .code = code };
    }
}

namespace bjsim::core
{
    auto StandardRules::Options(RoundImpl const& round) const -> ActionOptions
    {
        return ActionOptions{
            .can_double = Validate(round, Action::Double).has_value(),
            .can_split = Validate(round, Action::Split).has_value(),
            .can_surrender = Validate(round, Action::Surrender).has_value()
        };
    }

auto StandardRules::Validate(RoundImpl const& round, Action const a) const -> CheckResult
{
    using RVC = ::bjsim::core::error::RuleViolationCode;

    if (!round.active_)
        return std::unexpected(Viol(RVC::NoActiveHand).with_action(a));

    HandIdx const idx = *round.active_;
    Hand const& h = round.hands_[idx];
    auto const n_cards = static_cast<std::uint8_t>(h.cards.size());

    if (IsTerminal(h.status))
        return std::unexpected(Viol(RVC::HandAlreadyTerminal).with_action(a).with_hand(idx));

    switch (a)
    {
    case Action::Hit:
    case Action::Stand:
        return {};

    case Action::Double:
        if (n_cards != 2)
            return std::unexpected(Viol(RVC::Double_NotTwoCards)
                                   .with_action(a).with_hand(idx).with_cards(n_cards));
        if (h.from_split && !round.cfg_.das)
            return std::unexpected(Viol(RVC::Double_AfterSplitDisallowed)
                                   .with_action(a).with_hand(idx));
        return {};

    case Action::Split:
        if (n_cards != 2)
            return std::unexpected(Viol(RVC::Split_NotTwoCards)
                                   .with_action(a).with_hand(idx).with_cards(n_cards));
        if (!SameValue(h.cards[0], h.cards[1]))
            return std::unexpected(Viol(RVC::Split_NotAPair)
                                   .with_action(a).with_hand(idx).with_pair(h.cards[0].rank, h.cards[1].rank));
        if (!std::cmp_less(round.splits_used_, round.cfg_.resplit_limit))
            return std::unexpected(Viol(RVC::Split_LimitReached)
                                   .with_action(a).with_hand(idx)
                                   .with_splits(round.splits_used_,
                                                static_cast<std::uint8_t>(round.cfg_.resplit_limit)));
        return {};

    case Action::Surrender:
        if (!round.cfg_.late_surrender)
            return std::unexpected(Viol(RVC::Surrender_Disabled).with_action(a));
        if (h.from_split)
            return std::unexpected(Viol(RVC::Surrender_AfterSplit).with_action(a).with_hand(idx));
        if (idx != 0 || h.decisions != 0)
            return std::unexpected(Viol(RVC::Surrender_NotFirstDecision)
                                   .with_action(a).with_hand(idx).with_decisions(h.decisions));
        return {};
    }

    BJS_THROW(error::Code::Unknown, "Unreachable action in Validate");
}

    auto StandardRules::Apply(RoundImpl& round, Action const a) -> void
    {
        BJS_ASSERT(round.active_.has_value(), "Apply without an active hand");
        HandIdx const idx = *round.active_;

        switch (a)
        {
        case Action::Hit:
            {
                Card const c = round.Draw();
                Hand& h = round.hands_[idx];
                h.cards.push_back(c);
                if (h.IsBust()) h.status = HandStatus::Busted;
                break;
            }
        case Action::Stand:
            round.hands_[idx].status = HandStatus::Stood;
            break;
        case Action::Double:
            {
                Card const c = round.Draw();
                Hand& h = round.hands_[idx];
                h.multiplier = 2;
                h.cards.push_back(c);
                h.status = h.IsBust() ? HandStatus::Busted : HandStatus::Doubled;
                ++round.doubles_;
                break;
            }
        case Action::Surrender:
            round.hands_[idx].status = HandStatus::Surrendered;
            break;
        case Action::Split:
            // both halves stay with this hand's lineage; the first keeps deciding
            (void)round.SplitActive();
            break;
        }
        // hands_ may have grown, so index again
        ++round.hands_[idx].decisions;
    }

    auto StandardRules::Advance(RoundImpl& round) -> StepOutcome
    {
        BJS_ASSERT(round.active_.has_value(), "Advance without an active hand");
        HandIdx const idx = *round.active_;
        Hand const& h = round.hands_[idx];

        if (!IsTerminal(h.status))
            return StepOutcome::Applied;

        // bust and surrender settle without the dealer; the rest wait for FinishRound
        if (h.status == HandStatus::Busted)
            round.Resolve(idx, ResultKind::Loss, -static_cast<double>(h.multiplier));
        else if (h.status == HandStatus::Surrendered)
            round.Resolve(idx, ResultKind::Surrender, -0.5);

        if (round.ActivateNext())
            return StepOutcome::HandDone;

        round.FinishRound();
        return StepOutcome::RoundEnded;
    }
}
