//
// Created by Malik T on 18/08/2025.
//

#ifndef BJSIM_STRATEGY_HPP
#define BJSIM_STRATEGY_HPP

#include <span>
#include "Actions.hpp"
#include "Hand.hpp"

namespace bjsim::core
{
    // Chart cell: preferred action and what it degrades to when not allowed.
    enum class Cell : uint8_t
    {
        H,  // hit
        S,  // stand
        Dh, // double, else hit
        Ds, // double, else stand
        Rh, // surrender, else hit
        P,  // split
        X   // pair is not split; use the totals chart
    };

    // Basic strategy for an infinite deck with double after split and late surrender.
    // One chart serves both soft-17 rules: the H17-only plays (double soft 18 vs 2
    // and soft 19 vs 6, surrender 15 and 17 vs Ace) are not in it.
    // Tables are indexed by dealer upcard 2..11 (Ace = 11).
    class BasicStrategy
    {
    public:
        [[nodiscard]]
        static auto Recommend(std::span<Card const> player,
                              Rank dealer_up,
                              bool can_double,
                              bool can_split,
                              bool surrender_allowed) -> Action;

        // Raw chart lookups; out-of-range totals are clamped to the nearest row.
        [[nodiscard]] static auto HardCell(int total, int upcard) -> Cell;
        [[nodiscard]] static auto SoftCell(int total, int upcard) -> Cell;
        [[nodiscard]] static auto PairCell(int card_value, int upcard) -> Cell;

        [[nodiscard]]
        static auto Resolve(Cell cell, bool can_double, bool surrender_allowed) noexcept -> Action;
    };
}

#endif //BJSIM_STRATEGY_HPP
