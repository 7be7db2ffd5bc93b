//
// Created by Malik T on 02/09/2025.
//

#ifndef BJSIM_TRACKERS_HPP
#define BJSIM_TRACKERS_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include "../core/Actions.hpp"
#include "../core/Round.hpp"

namespace bjsim::sim
{
    inline constexpr size_t TotalBins = 22; // index = hand total, 0..21

    // Running mean/variance of the per-round net payoff; mergeable across workers.
    struct OnlineStats
    {
        uint64_t count{0};
        double mean{0.0};
        double m2{0.0};

        auto Update(double value) -> void;
        auto Combine(OnlineStats const& other) -> void;
        [[nodiscard]] auto Variance() const noexcept -> double;
        [[nodiscard]] auto StdDev() const noexcept -> double;

        auto operator==(OnlineStats const&) const -> bool = default;
    };

    struct Counters
    {
        uint64_t rounds{0};
        uint64_t hands{0};
        uint64_t player_bust{0};
        uint64_t dealer_bust{0};
        uint64_t doubles{0};
        uint64_t splits{0};
        uint64_t dealer_played{0};

        auto operator==(Counters const&) const -> bool = default;
    };

    // Aggregate state of one simulation run. Owned by the run that fills it;
    // parallel workers each fill their own and are merged afterwards.
    struct Trackers
    {
        std::array<uint64_t, core::ResultKindCount> outcomes{};
        Counters counters{};
        // totals of hands that stood or doubled without busting and met the dealer
        std::array<uint64_t, TotalBins> player_totals{};
        // dealer final totals 17..21 when the dealer played; busts go to counters.dealer_bust
        std::array<uint64_t, TotalBins> dealer_totals{};
        OnlineStats round_payoff{};
        double total_units{0.0};

        [[nodiscard]] auto Count(core::ResultKind k) const noexcept -> uint64_t
        {
            return outcomes[static_cast<size_t>(k)];
        }

        auto Record(core::RoundResult const& round) -> void;
        auto Merge(Trackers const& other) -> void;

        [[nodiscard]] auto Wins() const noexcept -> uint64_t;
        [[nodiscard]] auto Losses() const noexcept -> uint64_t;
        [[nodiscard]] auto Pushes() const noexcept -> uint64_t;
        [[nodiscard]] auto Resolved() const noexcept -> uint64_t;

        auto operator==(Trackers const&) const -> bool = default;
    };

    struct Summary
    {
        uint64_t hands_simulated{0};
        std::string rule{};
        double total_units{0.0};
        double ev_per_hand{0.0};
        double win_rate{0.0};
        double loss_rate{0.0};
        double push_rate{0.0};
        uint64_t resolved_hands{0};
        double stddev_per_hand{0.0};
        double ci95_low{0.0};
        double ci95_high{0.0};

        auto operator==(Summary const&) const -> bool = default;
    };

    [[nodiscard]]
    auto Summarize(Trackers const& trackers, std::string_view rule_label) -> Summary;
}

#endif //BJSIM_TRACKERS_HPP
