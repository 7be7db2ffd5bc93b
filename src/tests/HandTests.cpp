#include <gtest/gtest.h>

#include "../core/Dealer.hpp"
#include "../core/Exception.hpp"
#include "../core/Hand.hpp"
#include "../core/Shoe.hpp"
#include "../debug/StackedShoe.hpp"

using namespace bjsim::core;

namespace
{
    auto cards(std::initializer_list<Rank> ranks) -> Cards
    {
        Cards out;
        for (Rank const r : ranks) out.push_back(Card{r});
        return out;
    }
}

TEST(HandValue, Aces_Demote_One_At_A_Time)
{
    EXPECT_EQ(HandValue(cards({Rank::Ace, Rank::Ace, Rank::Nine})), (HandTotal{21, true}));
    EXPECT_EQ(HandValue(cards({Rank::Ten, Rank::Nine, Rank::Ace})), (HandTotal{20, false}));
    EXPECT_EQ(HandValue(cards({Rank::Ace, Rank::Six})), (HandTotal{17, true}));
    EXPECT_EQ(HandValue(cards({Rank::Ace, Rank::Ace})), (HandTotal{12, true}));
    EXPECT_EQ(HandValue(cards({Rank::King, Rank::Queen, Rank::Two})), (HandTotal{22, false}));
}

TEST(HandValue, Empty_Hand_Is_Zero)
{
    EXPECT_EQ(HandValue(Cards{}), (HandTotal{0, false}));
}

TEST(HandValue, Blackjack_Needs_Exactly_Two_Cards_With_An_Ace)
{
    EXPECT_TRUE(IsBlackjack(cards({Rank::Ace, Rank::King})));
    EXPECT_TRUE(IsBlackjack(cards({Rank::Ten, Rank::Ace})));
    EXPECT_FALSE(IsBlackjack(cards({Rank::Ace, Rank::King, Rank::Nine})));
    EXPECT_FALSE(IsBlackjack(cards({Rank::Seven, Rank::Seven, Rank::Seven})));
    EXPECT_FALSE(IsBlackjack(cards({Rank::Ace, Rank::Nine})));
}

TEST(HandValue, Pairs_Compare_By_Value)
{
    EXPECT_TRUE(IsPair(cards({Rank::Eight, Rank::Eight})));
    EXPECT_TRUE(IsPair(cards({Rank::King, Rank::Queen})));
    EXPECT_FALSE(IsPair(cards({Rank::Eight, Rank::Nine})));
    EXPECT_FALSE(IsPair(cards({Rank::Eight, Rank::Eight, Rank::Eight})));
}

TEST(HandValue, Split_Hand_Never_Counts_As_Natural)
{
    Hand h{};
    h.cards = cards({Rank::Ace, Rank::King});
    EXPECT_TRUE(h.IsNatural());
    h.from_split = true;
    EXPECT_FALSE(h.IsNatural());
    EXPECT_EQ(h.Total(), 21);
}

TEST(Dealer, Soft_17_Depends_On_Rule)
{
    Cards const soft17 = cards({Rank::Ace, Rank::Six});
    EXPECT_FALSE(DealerShouldHit(soft17, false));
    EXPECT_TRUE(DealerShouldHit(soft17, true));

    Cards const hard17 = cards({Rank::Ten, Rank::Seven});
    EXPECT_FALSE(DealerShouldHit(hard17, true));
    EXPECT_TRUE(DealerShouldHit(cards({Rank::Ten, Rank::Six}), false));
}

TEST(Dealer, Plays_Out_From_The_Shoe)
{
    debug::StackedShoe s17_shoe{Rank::Four};
    Cards const s17 = DealerPlay(cards({Rank::Ace, Rank::Six}), false, s17_shoe);
    EXPECT_EQ(s17.size(), 2u);
    EXPECT_EQ(s17_shoe.Dealt(), 0u);

    debug::StackedShoe h17_shoe{Rank::Four};
    Cards const h17 = DealerPlay(cards({Rank::Ace, Rank::Six}), true, h17_shoe);
    ASSERT_EQ(h17.size(), 3u);
    EXPECT_EQ(HandValue(h17), (HandTotal{21, true}));

    debug::StackedShoe bust_shoe{Rank::Two, Rank::King};
    Cards const bust = DealerPlay(cards({Rank::Ten, Rank::Four}), true, bust_shoe);
    EXPECT_EQ(HandValue(bust).total, 26);
    EXPECT_TRUE(bust_shoe.Exhausted());
}

TEST(Dealer, Needs_Two_Cards)
{
    debug::StackedShoe shoe{Rank::Ten};
    EXPECT_THROW((void)DealerPlay(cards({Rank::Ten}), true, shoe), error::AssertionError);
}

TEST(Shoe, Seed_Fixes_The_Deal)
{
    // ranks drawn straight from the mt19937_64 stream, independent of the library's distributions
    InfiniteShoe shoe(7);
    std::vector<Rank> const expected{
        Rank::Ace, Rank::Three, Rank::Three, Rank::Six, Rank::Queen, Rank::Eight,
        Rank::Five, Rank::Seven, Rank::Seven, Rank::Two, Rank::Four, Rank::Five
    };
    for (Rank const r : expected) EXPECT_EQ(shoe.Next().rank, r);
    EXPECT_FALSE(shoe.Exhausted());
}
