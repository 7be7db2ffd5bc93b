//
// Created by Malik T on 16/08/2025.
//

#include "Shoe.hpp"

#include <limits>

namespace bjsim::core
{
    InfiniteShoe::InfiniteShoe(uint64_t seed) :
        rng_{seed}
    {
    }

    auto InfiniteShoe::Next() -> Card
    {
        constexpr uint64_t ranks = constants::RankCount;
        // largest multiple of 13 the engine can produce; anything above it is redrawn
        constexpr uint64_t limit = std::numeric_limits<uint64_t>::max() -
                                   std::numeric_limits<uint64_t>::max() % ranks;
        uint64_t r = rng_();
        while (r >= limit) r = rng_();
        return Card{AllRanks[static_cast<size_t>(r % ranks)]};
    }
}
