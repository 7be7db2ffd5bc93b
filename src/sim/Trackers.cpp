//
// Created by Malik T on 02/09/2025.
//

#include "Trackers.hpp"

#include <cmath>

namespace bjsim::sim
{
    using core::ResultKind;

    auto OnlineStats::Update(double const value) -> void
    {
        ++count;
        double const delta = value - mean;
        mean += delta / static_cast<double>(count);
        m2 += delta * (value - mean);
    }

    auto OnlineStats::Combine(OnlineStats const& other) -> void
    {
        if (other.count == 0) return;
        if (count == 0)
        {
            *this = other;
            return;
        }
        double const n_a = static_cast<double>(count);
        double const n_b = static_cast<double>(other.count);
        double const n = n_a + n_b;
        double const delta = other.mean - mean;

        mean = (n_a * mean + n_b * other.mean) / n;
        m2 = m2 + other.m2 + delta * delta * n_a * n_b / n;
        count += other.count;
    }

    auto OnlineStats::Variance() const noexcept -> double
    {
        // population variance
        return count < 2 ? 0.0 : m2 / static_cast<double>(count);
    }

    auto OnlineStats::StdDev() const noexcept -> double
    {
        return std::sqrt(Variance());
    }

    auto Trackers::Record(core::RoundResult const& round) -> void
    {
        ++counters.rounds;
        counters.hands += round.outcomes.size();
        counters.splits += round.splits;
        counters.doubles += round.doubles;

        for (core::Outcome const& o : round.outcomes)
        {
            ++outcomes[static_cast<size_t>(o.kind)];
            if (o.busted) ++counters.player_bust;
            if (o.vs_dealer && !o.busted) ++player_totals[static_cast<size_t>(o.player_total)];
        }

        if (round.dealer_total)
        {
            ++counters.dealer_played;
            if (*round.dealer_total > core::constants::Blackjack) ++counters.dealer_bust;
            else ++dealer_totals[static_cast<size_t>(*round.dealer_total)];
        }

        double const net = round.NetPayoff();
        total_units += net;
        round_payoff.Update(net);
    }

    auto Trackers::Merge(Trackers const& other) -> void
    {
        for (size_t i{}; i < outcomes.size(); ++i) outcomes[i] += other.outcomes[i];
        for (size_t i{}; i < TotalBins; ++i)
        {
            player_totals[i] += other.player_totals[i];
            dealer_totals[i] += other.dealer_totals[i];
        }
        counters.rounds += other.counters.rounds;
        counters.hands += other.counters.hands;
        counters.player_bust += other.counters.player_bust;
        counters.dealer_bust += other.counters.dealer_bust;
        counters.doubles += other.counters.doubles;
        counters.splits += other.counters.splits;
        counters.dealer_played += other.counters.dealer_played;
        round_payoff.Combine(other.round_payoff);
        total_units += other.total_units;
    }

    auto Trackers::Wins() const noexcept -> uint64_t
    {
        return Count(ResultKind::Win) + Count(ResultKind::BlackjackWin) + Count(ResultKind::DealerBustWin);
    }

    auto Trackers::Losses() const noexcept -> uint64_t
    {
        return Count(ResultKind::Loss) + Count(ResultKind::Surrender) + Count(ResultKind::DealerBlackjack);
    }

    auto Trackers::Pushes() const noexcept -> uint64_t
    {
        return Count(ResultKind::Push) + Count(ResultKind::BlackjackPush);
    }

    auto Trackers::Resolved() const noexcept -> uint64_t
    {
        return Wins() + Losses() + Pushes();
    }

    auto Summarize(Trackers const& trackers, std::string_view const rule_label) -> Summary
    {
        constexpr double z95 = 1.96;

        Summary s{};
        s.hands_simulated = trackers.counters.rounds;
        s.rule = std::string(rule_label);
        s.total_units = trackers.total_units;
        s.resolved_hands = trackers.Resolved();

        if (s.resolved_hands != 0)
        {
            auto const resolved = static_cast<double>(s.resolved_hands);
            s.win_rate = static_cast<double>(trackers.Wins()) / resolved;
            s.loss_rate = static_cast<double>(trackers.Losses()) / resolved;
            s.push_rate = static_cast<double>(trackers.Pushes()) / resolved;
        }

        if (s.hands_simulated != 0)
        {
            auto const n = static_cast<double>(s.hands_simulated);
            s.ev_per_hand = s.total_units / n;
            s.stddev_per_hand = trackers.round_payoff.StdDev();
            double const half_width = z95 * s.stddev_per_hand / std::sqrt(n);
            s.ci95_low = s.ev_per_hand - half_width;
            s.ci95_high = s.ev_per_hand + half_width;
        }
        return s;
    }
}
