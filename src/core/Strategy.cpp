//
// Created by Malik T on 18/08/2025.
//

#include "Strategy.hpp"

#include <algorithm>
#include <array>
#include "Exception.hpp"

namespace bjsim::core
{
    namespace
    {
        using Row = std::array<Cell, 10>;
        using enum Cell;

        constexpr int MinHard = 4;
        constexpr int MinSoft = 12;
        constexpr int MinPair = 2;

        //                                    2   3   4   5   6   7   8   9   10  A
        constexpr std::array<Row, 18> Hard{{
            /*  4 */ Row{H,  H,  H,  H,  H,  H,  H,  H,  H,  H},
            /*  5 */ Row{H,  H,  H,  H,  H,  H,  H,  H,  H,  H},
            /*  6 */ Row{H,  H,  H,  H,  H,  H,  H,  H,  H,  H},
            /*  7 */ Row{H,  H,  H,  H,  H,  H,  H,  H,  H,  H},
            /*  8 */ Row{H,  H,  H,  H,  H,  H,  H,  H,  H,  H},
            /*  9 */ Row{H,  Dh, Dh, Dh, Dh, H,  H,  H,  H,  H},
            /* 10 */ Row{Dh, Dh, Dh, Dh, Dh, Dh, Dh, Dh, H,  H},
            /* 11 */ Row{Dh, Dh, Dh, Dh, Dh, Dh, Dh, Dh, Dh, Dh},
            /* 12 */ Row{H,  H,  S,  S,  S,  H,  H,  H,  H,  H},
            /* 13 */ Row{S,  S,  S,  S,  S,  H,  H,  H,  H,  H},
            /* 14 */ Row{S,  S,  S,  S,  S,  H,  H,  H,  H,  H},
            /* 15 */ Row{S,  S,  S,  S,  S,  H,  H,  H,  Rh, H},
            /* 16 */ Row{S,  S,  S,  S,  S,  H,  H,  Rh, Rh, Rh},
            /* 17 */ Row{S,  S,  S,  S,  S,  S,  S,  S,  S,  S},
            /* 18 */ Row{S,  S,  S,  S,  S,  S,  S,  S,  S,  S},
            /* 19 */ Row{S,  S,  S,  S,  S,  S,  S,  S,  S,  S},
            /* 20 */ Row{S,  S,  S,  S,  S,  S,  S,  S,  S,  S},
            /* 21 */ Row{S,  S,  S,  S,  S,  S,  S,  S,  S,  S},
        }};

        //                                    2   3   4   5   6   7   8   9   10  A
        constexpr std::array<Row, 10> Soft{{
            /* 12 */ Row{H,  H,  H,  H,  H,  H,  H,  H,  H,  H},
            /* 13 */ Row{H,  H,  H,  Dh, Dh, H,  H,  H,  H,  H},
            /* 14 */ Row{H,  H,  H,  Dh, Dh, H,  H,  H,  H,  H},
            /* 15 */ Row{H,  H,  Dh, Dh, Dh, H,  H,  H,  H,  H},
            /* 16 */ Row{H,  H,  Dh, Dh, Dh, H,  H,  H,  H,  H},
            /* 17 */ Row{H,  Dh, Dh, Dh, Dh, H,  H,  H,  H,  H},
            /* 18 */ Row{S,  Ds, Ds, Ds, Ds, S,  S,  H,  H,  H},
            /* 19 */ Row{S,  S,  S,  S,  S,  S,  S,  S,  S,  S},
            /* 20 */ Row{S,  S,  S,  S,  S,  S,  S,  S,  S,  S},
            /* 21 */ Row{S,  S,  S,  S,  S,  S,  S,  S,  S,  S},
        }};

        // by the value of one card of the pair
        //                                    2   3   4   5   6   7   8   9   10  A
        constexpr std::array<Row, 10> Pairs{{
            /*  2 */ Row{P,  P,  P,  P,  P,  P,  X,  X,  X,  X},
            /*  3 */ Row{P,  P,  P,  P,  P,  P,  X,  X,  X,  X},
            /*  4 */ Row{X,  X,  X,  P,  P,  X,  X,  X,  X,  X},
            /*  5 */ Row{X,  X,  X,  X,  X,  X,  X,  X,  X,  X},
            /*  6 */ Row{P,  P,  P,  P,  P,  X,  X,  X,  X,  X},
            /*  7 */ Row{P,  P,  P,  P,  P,  P,  X,  X,  X,  X},
            /*  8 */ Row{P,  P,  P,  P,  P,  P,  P,  P,  P,  P},
            /*  9 */ Row{P,  P,  P,  P,  P,  X,  P,  P,  X,  X},
            /* 10 */ Row{X,  X,  X,  X,  X,  X,  X,  X,  X,  X},
            /*  A */ Row{P,  P,  P,  P,  P,  P,  P,  P,  P,  P},
        }};

        auto Column(int const upcard) -> size_t
        {
            if (upcard < 2 || upcard > 11)
                BJS_THROW(error::Code::Rules, std::format("Dealer upcard value {} outside 2..11", upcard));
            return static_cast<size_t>(upcard - 2);
        }

        template <size_t N>
        auto Lookup(std::array<Row, N> const& table, int const row_min, int const value, int const upcard) -> Cell
        {
            int const row = std::clamp(value, row_min, row_min + static_cast<int>(N) - 1) - row_min;
            return table[static_cast<size_t>(row)][Column(upcard)];
        }
    }

    auto BasicStrategy::HardCell(int const total, int const upcard) -> Cell
    {
        return Lookup(Hard, MinHard, total, upcard);
    }

    auto BasicStrategy::SoftCell(int const total, int const upcard) -> Cell
    {
        return Lookup(Soft, MinSoft, total, upcard);
    }

    auto BasicStrategy::PairCell(int const card_value, int const upcard) -> Cell
    {
        return Lookup(Pairs, MinPair, card_value, upcard);
    }

    auto BasicStrategy::Resolve(Cell const cell, bool const can_double, bool const surrender_allowed) noexcept -> Action
    {
        switch (cell)
        {
        case Cell::H: return Action::Hit;
        case Cell::S: return Action::Stand;
        case Cell::Dh: return can_double ? Action::Double : Action::Hit;
        case Cell::Ds: return can_double ? Action::Double : Action::Stand;
        case Cell::Rh: return surrender_allowed ? Action::Surrender : Action::Hit;
        case Cell::P: return Action::Split;
        case Cell::X: return Action::Hit;
        }
        return Action::Stand;
    }

    auto BasicStrategy::Recommend(std::span<Card const> player,
                                  Rank const dealer_up,
                                  bool const can_double,
                                  bool const can_split,
                                  bool const surrender_allowed) -> Action
    {
        if (player.size() < 2)
            BJS_THROW(error::Code::Rules, "Strategy consulted on a hand with fewer than two cards");

        int const up = UpcardValue(dealer_up);

        if (can_split && IsPair(player))
        {
            int const v = UpcardValue(player[0].rank);
            if (PairCell(v, up) == Cell::P) return Action::Split;
        }

        HandTotal const v = HandValue(player);
        bool const may_surrender = surrender_allowed && player.size() == 2;
        Cell const cell = v.soft ? SoftCell(v.total, up) : HardCell(v.total, up);
        return Resolve(cell, can_double, may_surrender);
    }
}
