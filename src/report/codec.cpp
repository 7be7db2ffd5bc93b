//
// codec.cpp
//
#include "codec.hpp"

#include <array>
#include <vector>

namespace bjsim::report
{
    namespace fb = bjsim::gen::report;

    auto ToFbKind(core::ResultKind const k) noexcept -> fb::ResultKind
    {
        switch (k)
        {
        case core::ResultKind::Win: return fb::ResultKind::Win;
        case core::ResultKind::Loss: return fb::ResultKind::Loss;
        case core::ResultKind::Push: return fb::ResultKind::Push;
        case core::ResultKind::BlackjackWin: return fb::ResultKind::BlackjackWin;
        case core::ResultKind::BlackjackPush: return fb::ResultKind::BlackjackPush;
        case core::ResultKind::Surrender: return fb::ResultKind::Surrender;
        case core::ResultKind::DealerBlackjack: return fb::ResultKind::DealerBlackjack;
        case core::ResultKind::DealerBustWin: return fb::ResultKind::DealerBustWin;
        }
        return fb::ResultKind::Push;
    }

    auto FromFbKind(fb::ResultKind const k) noexcept -> core::ResultKind
    {
        switch (k)
        {
        case fb::ResultKind::Win: return core::ResultKind::Win;
        case fb::ResultKind::Loss: return core::ResultKind::Loss;
        case fb::ResultKind::Push: return core::ResultKind::Push;
        case fb::ResultKind::BlackjackWin: return core::ResultKind::BlackjackWin;
        case fb::ResultKind::BlackjackPush: return core::ResultKind::BlackjackPush;
        case fb::ResultKind::Surrender: return core::ResultKind::Surrender;
        case fb::ResultKind::DealerBlackjack: return core::ResultKind::DealerBlackjack;
        case fb::ResultKind::DealerBustWin: return core::ResultKind::DealerBustWin;
        }
        return core::ResultKind::Push;
    }
}

namespace
{
    // Verify enum layouts (first and last value catch drift)
    static_assert((int)bjsim::core::ResultKind::Win == (int)bjsim::gen::report::ResultKind::Win);
    static_assert((int)bjsim::core::ResultKind::DealerBustWin == (int)bjsim::gen::report::ResultKind::DealerBustWin);

    template <size_t N>
    auto ReadBins(flatbuffers::Vector<uint64_t> const* src, std::array<uint64_t, N>& dst) -> bool
    {
        if (!src || src->size() != N) return false;
        for (flatbuffers::uoffset_t i{}; i < src->size(); ++i) dst[i] = src->Get(i);
        return true;
    }
} // anonymous

namespace bjsim::report
{
    auto EncodeReport(sim::SimulationResult const& result) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        sim::Summary const& s = result.summary;
        sim::Trackers const& t = result.trackers;

        auto const rule = fbb.CreateString(s.rule);
        fb::SummaryBuilder sb(fbb);
        sb.add_hands_simulated(s.hands_simulated);
        sb.add_rule(rule);
        sb.add_total_units(s.total_units);
        sb.add_ev_per_hand(s.ev_per_hand);
        sb.add_win_rate(s.win_rate);
        sb.add_loss_rate(s.loss_rate);
        sb.add_push_rate(s.push_rate);
        sb.add_resolved_hands(s.resolved_hands);
        sb.add_stddev_per_hand(s.stddev_per_hand);
        sb.add_ci95_low(s.ci95_low);
        sb.add_ci95_high(s.ci95_high);
        auto const summary = sb.Finish();

        std::vector<flatbuffers::Offset<fb::KindCount>> kinds;
        kinds.reserve(core::ResultKindCount);
        for (size_t i{}; i < core::ResultKindCount; ++i)
        {
            kinds.push_back(fb::CreateKindCount(fbb, ToFbKind(static_cast<core::ResultKind>(i)), t.outcomes[i]));
        }
        auto const outcomes = fbb.CreateVector(kinds);
        auto const player_totals = fbb.CreateVector(t.player_totals.data(), t.player_totals.size());
        auto const dealer_totals = fbb.CreateVector(t.dealer_totals.data(), t.dealer_totals.size());

        fb::Counters const counters(t.counters.rounds,
                                    t.counters.hands,
                                    t.counters.player_bust,
                                    t.counters.dealer_bust,
                                    t.counters.doubles,
                                    t.counters.splits,
                                    t.counters.dealer_played);
        fb::Moments const moments(t.round_payoff.count, t.round_payoff.mean, t.round_payoff.m2);

        fb::ReportBuilder rb(fbb);
        rb.add_summary(summary);
        rb.add_outcomes(outcomes);
        rb.add_counters(&counters);
        rb.add_player_totals(player_totals);
        rb.add_dealer_totals(dealer_totals);
        rb.add_round_payoff(&moments);
        rb.add_total_units(t.total_units);
        fb::FinishReportBuffer(fbb, rb.Finish());
        return fbb.Release();
    }

    auto DecodeReport(std::span<std::byte const> bytes) -> std::expected<sim::SimulationResult, ParseError>
    {
        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        if (bytes.size() < sizeof(flatbuffers::uoffset_t) + flatbuffers::kFileIdentifierLength)
            return std::unexpected(ParseError{"buffer too small"});
        if (!fb::ReportBufferHasIdentifier(data))
            return std::unexpected(ParseError{"not a report buffer"});

        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyReportBuffer(verifier))
            return std::unexpected(ParseError{"buffer failed verification"});

        fb::Report const* r = fb::GetReport(data);
        if (!r->summary() || !r->outcomes() || !r->counters() || !r->round_payoff())
            return std::unexpected(ParseError{"missing report section"});

        sim::SimulationResult out{};
        fb::Summary const* s = r->summary();
        out.summary.hands_simulated = s->hands_simulated();
        out.summary.rule = s->rule() ? s->rule()->str() : std::string{};
        out.summary.total_units = s->total_units();
        out.summary.ev_per_hand = s->ev_per_hand();
        out.summary.win_rate = s->win_rate();
        out.summary.loss_rate = s->loss_rate();
        out.summary.push_rate = s->push_rate();
        out.summary.resolved_hands = s->resolved_hands();
        out.summary.stddev_per_hand = s->stddev_per_hand();
        out.summary.ci95_low = s->ci95_low();
        out.summary.ci95_high = s->ci95_high();

        sim::Trackers& t = out.trackers;
        for (fb::KindCount const* kc : *r->outcomes())
        {
            auto const idx = static_cast<size_t>(kc->kind());
            if (idx >= core::ResultKindCount)
                return std::unexpected(ParseError{"unknown result kind"});
            t.outcomes[static_cast<size_t>(FromFbKind(kc->kind()))] += kc->count();
        }

        fb::Counters const* c = r->counters();
        t.counters.rounds = c->rounds();
        t.counters.hands = c->hands();
        t.counters.player_bust = c->player_bust();
        t.counters.dealer_bust = c->dealer_bust();
        t.counters.doubles = c->doubles();
        t.counters.splits = c->splits();
        t.counters.dealer_played = c->dealer_played();

        if (!ReadBins(r->player_totals(), t.player_totals) || !ReadBins(r->dealer_totals(), t.dealer_totals))
            return std::unexpected(ParseError{"histogram has the wrong number of bins"});

        fb::Moments const* m = r->round_payoff();
        t.round_payoff.count = m->count();
        t.round_payoff.mean = m->mean();
        t.round_payoff.m2 = m->m2();
        t.total_units = r->total_units();
        return out;
    }
}
