//
// Created by Malik T on 14/08/2025.
//

#ifndef BJSIM_UTIL_HPP
#define BJSIM_UTIL_HPP

#include <algorithm>
#include <bit>
#include <cstdint>
#include <span>
#include "Actions.hpp"
#include "Types.hpp"

namespace bjsim::core::util
{
    inline auto CountKind(std::span<Outcome const> outcomes, ResultKind const k) -> size_t
    {
        return static_cast<size_t>(std::ranges::count_if(outcomes, [k](Outcome const& o) { return o.kind == k; }));
    }

    // Tracks which hand indices produced an outcome; a second sighting is a
    // double resolution.
    class HandUniqueChecker
    {
    public:
        HandUniqueChecker():
            hands_(0), contains_dup_(false) {}
        auto Add(HandIdx const h) -> void
        {
            uint64_t const bit = uint64_t{1} << h;
            contains_dup_ |= static_cast<bool>(hands_ & bit);
            hands_ |= bit;
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto Count() const -> int
        {
            return std::popcount(hands_);
        }
        // true when exactly hands 0..n-1 were seen
        [[nodiscard]]
        auto CoversFirst(size_t const n) const -> bool
        {
            uint64_t const want = n >= 64 ? ~uint64_t{0} : (uint64_t{1} << n) - 1;
            return hands_ == want;
        }
    private:
        uint64_t hands_;
        bool contains_dup_;
    };
}

#endif //BJSIM_UTIL_HPP
