#ifndef BJSIM_CODEC_HPP
#define BJSIM_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <flatbuffers/flatbuffers.h>

#include "../core/Actions.hpp"
#include "../sim/Simulator.hpp"

#include "generated/flatbuffers/bjsim_report_generated.h"

namespace bjsim::report
{
    struct ParseError
    {
        std::string message;
    };

    auto ToFbKind(core::ResultKind k) noexcept -> gen::report::ResultKind;
    auto FromFbKind(gen::report::ResultKind k) noexcept -> core::ResultKind;

    // Summary, result-kind counts, counters, histograms and payoff moments.
    auto EncodeReport(sim::SimulationResult const& result) -> flatbuffers::DetachedBuffer;

    // Verifies the buffer before touching it; malformed input never throws.
    auto DecodeReport(std::span<std::byte const> bytes) -> std::expected<sim::SimulationResult, ParseError>;
} // namespace bjsim::report

#endif //BJSIM_CODEC_HPP
