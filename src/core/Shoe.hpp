//
// Created by Malik T on 16/08/2025.
//

#ifndef BJSIM_SHOE_HPP
#define BJSIM_SHOE_HPP

#include <cstdint>
#include <random>
#include "Types.hpp"

namespace bjsim::core
{
    // Single-card draw capability used at every dealing point of a round.
    class DrawSource
    {
    public:
        virtual ~DrawSource() = default;

        // Throws ShoeExhaustedError when a bounded source has nothing left.
        virtual auto Next() -> Card = 0;
        virtual auto Exhausted() const noexcept -> bool { return false; }
        virtual auto Shuffle() -> void {}
    };

    // Every rank equally likely on every draw (infinite deck). Ranks come from the
    // raw engine output by rejection sampling, so a seed deals the same cards on
    // every standard library.
    class InfiniteShoe final : public DrawSource
    {
    public:
        explicit InfiniteShoe(uint64_t seed);

        auto Next() -> Card override;

    private:
        std::mt19937_64 rng_;
    };
}

#endif //BJSIM_SHOE_HPP
