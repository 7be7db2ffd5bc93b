//
// Created by Malik T on 14/08/2025.
//

#ifndef BJSIM_TYPES_HPP
#define BJSIM_TYPES_HPP

#define BJS_ENABLE_TEST_HOOKS true

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bjsim::core::constants
{
    inline constexpr int Blackjack = 21;
    inline constexpr int DealerStandsOn = 17;
    inline constexpr int SoftAceBonus = 10;
    inline constexpr int DefaultResplitLimit = 3;
    // one round then holds at most 64 hands, one bit each in a uint64_t mask
    inline constexpr int MaxResplitLimit = 63;
    inline constexpr size_t RankCount = 13;
}

namespace bjsim::core
{
    enum class Rank : uint8_t
    {
        Two = 0,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King,
        Ace
    };

    // Suits carry no information under a replacement draw, so a card is its rank.
    struct Card
    {
        Rank rank{Rank::Two};
    };
    inline auto operator==(Card const& a, Card const& b) -> bool { return a.rank == b.rank; }

    using Cards = std::vector<Card>;
    using HandIdx = uint8_t;

    inline constexpr std::array<Rank, constants::RankCount> AllRanks{
        Rank::Two, Rank::Three, Rank::Four, Rank::Five, Rank::Six, Rank::Seven, Rank::Eight,
        Rank::Nine, Rank::Ten, Rank::Jack, Rank::Queen, Rank::King, Rank::Ace
    };

    inline auto to_string(Rank const r) -> std::string_view
    {
        static constexpr std::array<std::string_view, constants::RankCount> map{
            "2", "3", "4", "5", "6", "7", "8", "9", "10", "J", "Q", "K", "A"
        };
        return map[static_cast<size_t>(r)];
    }

    inline auto to_string(Cards const& cards) -> std::string
    {
        std::string s;
        for (size_t i{}; i < cards.size(); ++i)
        {
            s += (i ? " " : "");
            s += to_string(cards[i].rank);
        }
        return s;
    }
}

#endif //BJSIM_TYPES_HPP
