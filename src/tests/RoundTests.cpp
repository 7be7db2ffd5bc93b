#include <gtest/gtest.h>

#include <memory>

#include "../core/Exception.hpp"
#include "../core/Round.hpp"
#include "../core/StandardRules.hpp"
#include "../core/Util.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/StackedShoe.hpp"
#include "TestSupport.hpp"

using namespace bjsim::core;
using bjsim::core::debug::StackedShoe;
using bjsim::test::ScriptedPlayer;

namespace
{
    using enum Rank;

    auto make_round(RuleSet const& rules, StackedShoe& shoe, Player& p) -> std::unique_ptr<RoundImpl>
    {
        return std::make_unique<RoundImpl>(rules, std::make_unique<StandardRules>(), shoe, p);
    }

    auto play_checked(RoundImpl& round) -> RoundResult
    {
        while (!round.IsFinished())
        {
            StepOutcome const out = round.Step();
            EXPECT_NE(out, StepOutcome::Invalid) << error::describe(*round.LastViolation());
            debug::CheckInvariants(round);
            if (out == StepOutcome::Invalid) break;
        }
        RoundResult res = round.Result();
        debug::CheckResult(res, round.Config().resplit_limit);
        return res;
    }
}

// ---------------- plain resolution ----------------

TEST(Round, Stand_Beats_Dealer)
{
    StackedShoe shoe{Ten, Nine, Ten, Seven};
    ScriptedPlayer p{Action::Stand};
    auto round = make_round(RuleSet{}, shoe, p);

    RoundResult const res = play_checked(*round);
    ASSERT_EQ(res.outcomes.size(), 1u);
    EXPECT_EQ(res.outcomes[0].kind, ResultKind::Win);
    EXPECT_DOUBLE_EQ(res.outcomes[0].payoff, 1.0);
    EXPECT_TRUE(res.outcomes[0].vs_dealer);
    EXPECT_EQ(res.outcomes[0].player_total, 19);
    ASSERT_TRUE(res.dealer_total.has_value());
    EXPECT_EQ(*res.dealer_total, 17);
}

TEST(Round, Push_And_Dealer_Bust)
{
    {
        StackedShoe shoe{Ten, Seven, Ten, Seven};
        ScriptedPlayer p{Action::Stand};
        RoundResult const res = PlayRound(RuleSet{}, shoe, p);
        EXPECT_EQ(res.outcomes.at(0).kind, ResultKind::Push);
        EXPECT_DOUBLE_EQ(res.NetPayoff(), 0.0);
    }
    {
        StackedShoe shoe{Ten, Eight, Ten, Six, Ten};
        ScriptedPlayer p{Action::Stand};
        RoundResult const res = PlayRound(RuleSet{}, shoe, p);
        EXPECT_EQ(res.outcomes.at(0).kind, ResultKind::DealerBustWin);
        EXPECT_DOUBLE_EQ(res.NetPayoff(), 1.0);
        EXPECT_EQ(res.dealer_total.value_or(0), 26);
    }
}

TEST(Round, Player_Bust_Skips_Dealer)
{
    StackedShoe shoe{Ten, Six, Ten, Six, King};
    ScriptedPlayer p{Action::Hit};
    RoundResult const res = PlayRound(RuleSet{}, shoe, p);

    ASSERT_EQ(res.outcomes.size(), 1u);
    EXPECT_EQ(res.outcomes[0].kind, ResultKind::Loss);
    EXPECT_TRUE(res.outcomes[0].busted);
    EXPECT_FALSE(res.outcomes[0].vs_dealer);
    EXPECT_FALSE(res.dealer_total.has_value());
    EXPECT_EQ(res.dealer_cards.size(), 2u);
    EXPECT_TRUE(shoe.Exhausted());
}

// ---------------- doubles and surrender ----------------

TEST(Round, Double_Pays_Twice_And_Draws_Once)
{
    StackedShoe shoe{Five, Six, Ten, Seven, Ten};
    ScriptedPlayer p{Action::Double};
    RoundResult const res = PlayRound(RuleSet{}, shoe, p);

    ASSERT_EQ(res.outcomes.size(), 1u);
    EXPECT_EQ(res.outcomes[0].kind, ResultKind::Win);
    EXPECT_DOUBLE_EQ(res.outcomes[0].payoff, 2.0);
    EXPECT_EQ(res.outcomes[0].multiplier, 2);
    EXPECT_EQ(res.outcomes[0].card_count, 3);
    EXPECT_EQ(res.doubles, 1);
    EXPECT_EQ(p.Seen().size(), 1u);
}

TEST(Round, Busted_Double_Loses_Two)
{
    StackedShoe shoe{Ten, Two, Ten, Seven, Ten};
    ScriptedPlayer p{Action::Double};
    RoundResult const res = PlayRound(RuleSet{}, shoe, p);

    ASSERT_EQ(res.outcomes.size(), 1u);
    EXPECT_EQ(res.outcomes[0].kind, ResultKind::Loss);
    EXPECT_DOUBLE_EQ(res.outcomes[0].payoff, -2.0);
    EXPECT_FALSE(res.dealer_total.has_value());
}

TEST(Round, Surrender_Costs_Half_And_Draws_Nothing)
{
    // exactly the opening four cards: any further draw would throw
    StackedShoe shoe{Ten, Six, Ten, Seven};
    ScriptedPlayer p{Action::Surrender};
    RoundResult const res = PlayRound(RuleSet{}, shoe, p);

    ASSERT_EQ(res.outcomes.size(), 1u);
    EXPECT_EQ(res.outcomes[0].kind, ResultKind::Surrender);
    EXPECT_DOUBLE_EQ(res.outcomes[0].payoff, -0.5);
    EXPECT_EQ(shoe.Dealt(), 4u);
    EXPECT_FALSE(res.dealer_total.has_value());
}

// ---------------- naturals and peek ----------------

TEST(Round, Natural_Pays_By_Rule)
{
    {
        StackedShoe shoe{Ace, King, Nine, Seven};
        ScriptedPlayer p{};
        RoundResult const res = PlayRound(RuleSet{}, shoe, p);
        EXPECT_EQ(res.outcomes.at(0).kind, ResultKind::BlackjackWin);
        EXPECT_DOUBLE_EQ(res.outcomes.at(0).payoff, 1.5);
        EXPECT_TRUE(p.Seen().empty());
    }
    {
        RuleSet rules{};
        rules.blackjack_3to2 = false;
        StackedShoe shoe{Ace, King, Nine, Seven};
        ScriptedPlayer p{};
        RoundResult const res = PlayRound(rules, shoe, p);
        EXPECT_DOUBLE_EQ(res.outcomes.at(0).payoff, 1.0);
    }
}

TEST(Round, Peek_Ends_Round_Before_Decisions)
{
    StackedShoe shoe{Ten, Nine, Ace, King};
    ScriptedPlayer p{Action::Stand};
    auto round = make_round(RuleSet{}, shoe, p);

    ASSERT_TRUE(round->IsFinished());
    RoundResult const res = round->Result();
    EXPECT_EQ(res.outcomes.at(0).kind, ResultKind::DealerBlackjack);
    EXPECT_DOUBLE_EQ(res.outcomes.at(0).payoff, -1.0);
    EXPECT_TRUE(res.dealer_blackjack);
    EXPECT_TRUE(p.Seen().empty());
    EXPECT_THROW((void)round->Step(), error::StateError);
    EXPECT_THROW((void)round->ActiveSnapshot(), error::StateError);
}

TEST(Round, Both_Naturals_Push)
{
    StackedShoe shoe{Ace, King, Ace, Queen};
    ScriptedPlayer p{};
    RoundResult const res = PlayRound(RuleSet{}, shoe, p);
    EXPECT_EQ(res.outcomes.at(0).kind, ResultKind::BlackjackPush);
    EXPECT_DOUBLE_EQ(res.NetPayoff(), 0.0);
}

TEST(Round, Without_Peek_Dealer_Blackjack_Settles_At_The_End)
{
    RuleSet rules{};
    rules.peek = false;
    StackedShoe shoe{Ten, Nine, Ace, King};
    ScriptedPlayer p{Action::Stand};
    RoundResult const res = PlayRound(rules, shoe, p);

    EXPECT_EQ(p.Seen().size(), 1u);
    EXPECT_EQ(res.outcomes.at(0).kind, ResultKind::DealerBlackjack);
    EXPECT_DOUBLE_EQ(res.outcomes.at(0).payoff, -1.0);
    EXPECT_EQ(res.dealer_cards.size(), 2u);
}

// ---------------- splits ----------------

TEST(Round, Resplits_Use_A_Shared_Budget)
{
    // 8,8 vs 10/7; split draws: (8 | 2), (8 | 3), (8 | 10); then one double card
    StackedShoe shoe{Eight, Eight, Ten, Seven,
                     Eight, Two,
                     Eight, Three,
                     Eight, Ten,
                     Ten};
    ScriptedPlayer p{Action::Split, Action::Split, Action::Split,
                     Action::Stand,    // H0: 8,8
                     Action::Stand,    // H3: 8,10
                     Action::Double,   // H2: 8,3 + 10
                     Action::Stand};   // H1: 8,2
    auto round = make_round(RuleSet{}, shoe, p);
    RoundResult const res = play_checked(*round);

    EXPECT_EQ(res.splits, 3);
    ASSERT_EQ(res.outcomes.size(), 4u);
    for (size_t i{}; i < res.outcomes.size(); ++i)
    {
        EXPECT_EQ(res.outcomes[i].hand, i);
        EXPECT_TRUE(res.outcomes[i].from_split);
    }
    EXPECT_EQ(res.outcomes[0].kind, ResultKind::Loss);
    EXPECT_EQ(res.outcomes[1].kind, ResultKind::Loss);
    EXPECT_EQ(res.outcomes[2].kind, ResultKind::Win);
    EXPECT_DOUBLE_EQ(res.outcomes[2].payoff, 2.0);
    EXPECT_EQ(res.outcomes[3].kind, ResultKind::Win);
    EXPECT_DOUBLE_EQ(res.NetPayoff(), 1.0);
    EXPECT_TRUE(shoe.Exhausted());

    // work-list order and the exhausted budget as the player saw it
    auto const& seen = p.Seen();
    ASSERT_EQ(seen.size(), 7u);
    EXPECT_EQ(seen[3].hand, 0);
    EXPECT_FALSE(seen[3].options.can_split);
    EXPECT_FALSE(seen[3].options.can_surrender);
    EXPECT_EQ(seen[4].hand, 3);
    EXPECT_EQ(seen[5].hand, 2);
    EXPECT_TRUE(seen[5].options.can_double);
    EXPECT_EQ(seen[6].hand, 1);
}

TEST(Round, Play_Hand_Once_Lists_Every_Hand)
{
    StackedShoe shoe{Nine, Nine, Ten, Seven, Ten, Nine};
    ScriptedPlayer p{Action::Split, Action::Stand, Action::Stand};
    std::vector<Outcome> const outcomes = PlayHandOnce(RuleSet{}, shoe, p);

    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(util::CountKind(outcomes, ResultKind::Win), 2u);
    EXPECT_EQ(util::CountKind(outcomes, ResultKind::Loss), 0u);
}

TEST(Round, Split_Beyond_Limit_Is_Rejected)
{
    RuleSet rules{};
    rules.resplit_limit = 1;
    StackedShoe shoe{Eight, Eight, Ten, Seven, Eight, Three};
    ScriptedPlayer p{Action::Split, Action::Split};
    auto round = make_round(rules, shoe, p);

    EXPECT_EQ(round->Step(), StepOutcome::Applied);
    EXPECT_EQ(round->Step(), StepOutcome::Invalid);
    ASSERT_TRUE(round->LastViolation().has_value());
    EXPECT_EQ(round->LastViolation()->code, error::RuleViolationCode::Split_LimitReached);
    EXPECT_EQ(round->HandCount(), 2u);
    EXPECT_EQ(round->SplitsUsed(), 1);
    EXPECT_EQ(round->PendingCount(), 1u);
    debug::CheckInvariants(*round);
}

TEST(Round, Play_Throws_On_Rejected_Action)
{
    RuleSet rules{};
    rules.resplit_limit = 1;
    StackedShoe shoe{Eight, Eight, Ten, Seven, Eight, Three};
    ScriptedPlayer p{Action::Split, Action::Split};
    auto round = make_round(rules, shoe, p);
    EXPECT_THROW((void)round->Play(), error::InvalidActionError);
}

TEST(Round, Fallback_Substitutes_Basic_Strategy)
{
    RuleSet rules{};
    rules.resplit_limit = 1;
    rules.invalid_action = InvalidActionPolicy::Fallback;
    // the rejected second split becomes a hit on hard 16 (surrender is closed after a split)
    StackedShoe shoe{Eight, Eight, Ten, Seven, Eight, Three, Five};
    ScriptedPlayer p{Action::Split, Action::Split, Action::Stand, Action::Stand};
    auto round = make_round(rules, shoe, p);
    RoundResult const res = round->Play();

    EXPECT_EQ(round->Fallbacks(), 1u);
    ASSERT_TRUE(round->LastViolation().has_value());
    EXPECT_EQ(round->LastViolation()->code, error::RuleViolationCode::Split_LimitReached);
    ASSERT_EQ(res.outcomes.size(), 2u);
    EXPECT_EQ(res.outcomes[0].player_total, 21);
    EXPECT_EQ(res.outcomes[0].kind, ResultKind::Win);
    EXPECT_EQ(res.outcomes[1].kind, ResultKind::Loss);
}

TEST(Round, Equal_Value_Cards_Split)
{
    StackedShoe shoe{King, Queen, Ten, Seven, Nine, Eight};
    ScriptedPlayer p{Action::Split, Action::Stand, Action::Stand};
    RoundResult const res = PlayRound(RuleSet{}, shoe, p);

    ASSERT_EQ(res.outcomes.size(), 2u);
    EXPECT_TRUE(p.Seen().front().options.can_split);
    EXPECT_EQ(res.outcomes[0].player_total, 19);
    EXPECT_EQ(res.outcomes[1].player_total, 18);
    EXPECT_DOUBLE_EQ(res.NetPayoff(), 2.0);
}

TEST(Round, Split_Aces_Reaching_21_Is_Not_A_Natural)
{
    StackedShoe shoe{Ace, Ace, Ten, Seven, King, Six};
    ScriptedPlayer p{Action::Split, Action::Stand, Action::Stand};
    RoundResult const res = PlayRound(RuleSet{}, shoe, p);

    ASSERT_EQ(res.outcomes.size(), 2u);
    EXPECT_EQ(res.outcomes[0].kind, ResultKind::Win);
    EXPECT_DOUBLE_EQ(res.outcomes[0].payoff, 1.0);
    EXPECT_EQ(res.outcomes[1].kind, ResultKind::Push);
}

// ---------------- eligibility ----------------

TEST(Round, Surrender_Only_As_First_Decision)
{
    StackedShoe shoe{Five, Three, Ten, Seven, Two};
    ScriptedPlayer p{Action::Hit, Action::Surrender};
    auto round = make_round(RuleSet{}, shoe, p);

    EXPECT_TRUE(round->ActiveSnapshot()->options.can_surrender);
    EXPECT_EQ(round->Step(), StepOutcome::Applied);
    EXPECT_FALSE(round->ActiveSnapshot()->options.can_surrender);
    EXPECT_FALSE(round->ActiveSnapshot()->options.can_double);
    EXPECT_EQ(round->Step(), StepOutcome::Invalid);
    EXPECT_EQ(round->LastViolation()->code, error::RuleViolationCode::Surrender_NotFirstDecision);
}

TEST(Round, Rule_Switches_Close_Options)
{
    RuleSet rules{};
    rules.late_surrender = false;
    rules.das = false;
    StackedShoe shoe{Eight, Eight, Ten, Seven, Three, Two};
    ScriptedPlayer p{Action::Surrender, Action::Split, Action::Double};
    auto round = make_round(rules, shoe, p);

    EXPECT_FALSE(round->ActiveSnapshot()->options.can_surrender);
    EXPECT_EQ(round->Step(), StepOutcome::Invalid);
    EXPECT_EQ(round->LastViolation()->code, error::RuleViolationCode::Surrender_Disabled);

    EXPECT_EQ(round->Step(), StepOutcome::Applied);
    EXPECT_FALSE(round->ActiveSnapshot()->options.can_double);
    EXPECT_EQ(round->Step(), StepOutcome::Invalid);
    EXPECT_EQ(round->LastViolation()->code, error::RuleViolationCode::Double_AfterSplitDisallowed);
}

TEST(Round, Not_A_Pair_Cannot_Split)
{
    StackedShoe shoe{Ten, Nine, Ten, Seven};
    ScriptedPlayer p{Action::Split};
    auto round = make_round(RuleSet{}, shoe, p);

    EXPECT_FALSE(round->ActiveSnapshot()->options.can_split);
    EXPECT_EQ(round->Step(), StepOutcome::Invalid);
    EXPECT_EQ(round->LastViolation()->code, error::RuleViolationCode::Split_NotAPair);
    EXPECT_FALSE(round->IsFinished());
}

TEST(Round, Recommend_Is_Read_Only)
{
    StackedShoe shoe{Ten, Six, Ten, Seven};
    ScriptedPlayer p{};
    auto round = make_round(RuleSet{}, shoe, p);

    EXPECT_EQ(round->Recommend(), Action::Surrender);
    EXPECT_EQ(round->Recommend(), Action::Surrender);
    EXPECT_EQ(shoe.Dealt(), 4u);
    EXPECT_THROW((void)round->Result(), error::StateError);
}

// ---------------- draw source ----------------

TEST(Round, Exhausted_Shoe_Surfaces)
{
    {
        StackedShoe shoe{Ten, Six, Ten};
        ScriptedPlayer p{};
        EXPECT_THROW((void)PlayRound(RuleSet{}, shoe, p), error::ShoeExhaustedError);
    }
    {
        StackedShoe shoe{Ten, Six, Ten, Seven};
        ScriptedPlayer p{Action::Hit};
        EXPECT_THROW((void)PlayRound(RuleSet{}, shoe, p), error::ShoeExhaustedError);
    }
}

TEST(Round, Bad_Config_Fails_Before_Dealing)
{
    RuleSet rules{};
    rules.resplit_limit = 64;
    StackedShoe shoe{Ten, Six, Ten, Seven};
    ScriptedPlayer p{};
    EXPECT_THROW((void)PlayRound(rules, shoe, p), error::ConfigError);
    EXPECT_EQ(shoe.Dealt(), 0u);
}

TEST(Invariants, Corrupt_Hand_Index_Is_Caught)
{
    debug::Inspector::SnapshotAll s{};
    s.hands.push_back(debug::Inspector::HandView{.cards = {Card{Ten}, Card{Six}}, .status = HandStatus::Active});
    s.active = 0;
    s.resplit_limit = 3;
    s.pending = {70};
    EXPECT_THROW(debug::CheckInvariants(s), error::AssertionError);

    RoundResult res{};
    Outcome o{};
    o.hand = 70;
    res.outcomes.push_back(o);
    EXPECT_THROW(debug::CheckResult(res, 3), error::AssertionError);
}
