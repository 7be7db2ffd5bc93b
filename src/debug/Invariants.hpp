//
// Created by Malik T on 19/08/2025.
//

#ifndef BJSIM_INVARIANTS_HPP
#define BJSIM_INVARIANTS_HPP

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

#include "../core/Exception.hpp"
#include "../core/Round.hpp"
#include "../core/Util.hpp"
#include "Inspector.hpp"

namespace bjsim::core::debug
{
    // A second layer of checks over the round's private state, run between steps
    // by the self-play tests.
    inline auto CheckInvariants(Inspector::SnapshotAll const& s) -> void
    {
#if BJS_ENABLE_TEST_HOOKS == false
        (void)s;
#else
        // 1) one hand per split, and never past the budget
        BJS_ASSERT(s.hands.size() == static_cast<size_t>(s.splits_used) + 1, "Hand count != 1 + splits");
        BJS_ASSERT(std::cmp_less_equal(s.splits_used, s.resplit_limit), "Splits exceed the resplit limit");

        // 2) every live hand holds at least two cards
        for (Inspector::HandView const& h : s.hands)
            BJS_ASSERT(h.cards.size() >= 2, "Hand with fewer than two cards");

        // 3) exactly the pending hands are on the work-list, each once
        {
            util::HandUniqueChecker seen{};
            for (HandIdx const idx : s.pending)
            {
                BJS_ASSERT(idx < s.hands.size(), "Work-list index out of range");
                seen.Add(idx);
                BJS_ASSERT(s.hands[idx].status == HandStatus::Pending, "Work-list holds a non-pending hand");
            }
            BJS_ASSERT(!seen.ContainsDup(), "Hand queued twice");
            auto const pending = std::ranges::count_if(s.hands, [](Inspector::HandView const& h)
                                                       { return h.status == HandStatus::Pending; });
            BJS_ASSERT(std::cmp_equal(pending, s.pending.size()), "Pending hand missing from the work-list");
        }

        // 4) at most one active hand, and it is the one the round points at
        {
            auto const active = std::ranges::count_if(s.hands, [](Inspector::HandView const& h)
                                                      { return h.status == HandStatus::Active; });
            BJS_ASSERT(active == (s.active ? 1 : 0), "Active hand bookkeeping mismatch");
            if (s.active) BJS_ASSERT(s.hands.at(*s.active).status == HandStatus::Active, "Active index is stale");
        }

        // 5) a finished round has settled everything; an open one has a decision pending
        if (s.finished)
        {
            BJS_ASSERT(!s.active && s.pending.empty(), "Finished round with hands in play");
            BJS_ASSERT(std::ranges::all_of(s.hands, &Inspector::HandView::resolved), "Finished round with unresolved hand");
        }
        else
        {
            BJS_ASSERT(s.active.has_value(), "Open round without an active hand");
            BJS_ASSERT(!s.dealer_played, "Dealer played before the hands were done");
        }

        // 6) doubled hands hold exactly one card past the double
        for (Inspector::HandView const& h : s.hands)
        {
            if (h.status == HandStatus::Doubled)
                BJS_ASSERT(h.cards.size() == 3 && h.multiplier == 2, "Doubled hand drew more than once");
        }
#endif // BJS_ENABLE_TEST_HOOKS == true
    }

    inline auto CheckInvariants(RoundImpl const& r) -> void
    {
        CheckInvariants(Inspector::Gather(r));
    }

    // Checks a finished round's result: each hand resolved exactly once and the
    // split count within the limit.
    inline auto CheckResult(RoundResult const& res, int const resplit_limit) -> void
    {
#if BJS_ENABLE_TEST_HOOKS == false
        (void)res;
        (void)resplit_limit;
#else
        BJS_ASSERT(std::cmp_less_equal(res.splits, resplit_limit), "Splits exceed the resplit limit");
        BJS_ASSERT(res.outcomes.size() == static_cast<size_t>(res.splits) + 1,
                   std::format("Outcome count {} != 1 + {} splits", res.outcomes.size(), res.splits));

        util::HandUniqueChecker seen{};
        for (Outcome const& o : res.outcomes)
        {
            BJS_ASSERT(o.hand < res.outcomes.size(), std::format("Outcome hand index {} out of range", o.hand));
            seen.Add(o.hand);
        }
        BJS_ASSERT(!seen.ContainsDup(), "Hand resolved twice");
        BJS_ASSERT(seen.CoversFirst(res.outcomes.size()), "Hand index gap in the outcomes");
#endif // BJS_ENABLE_TEST_HOOKS == true
    }
}
#endif //BJSIM_INVARIANTS_HPP
