#include <gtest/gtest.h>

#include <cstddef>
#include <span>
#include <vector>

#include "../report/codec.hpp"
#include "../sim/Simulator.hpp"

using namespace bjsim;

namespace
{
    auto as_bytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
}

TEST(ReportCodec, Encode_Decode_Simulation)
{
    sim::SimulationResult const res = sim::Simulate(3000, true, 42);
    flatbuffers::DetachedBuffer const buf = report::EncodeReport(res);

    auto const decoded = report::DecodeReport(as_bytes(buf));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded->summary, res.summary);
    EXPECT_EQ(decoded->trackers, res.trackers);
}

TEST(ReportCodec, Rejects_Foreign_And_Damaged_Buffers)
{
    std::vector<std::byte> const tiny(4, std::byte{0});
    auto const small = report::DecodeReport(tiny);
    ASSERT_FALSE(small.has_value());
    EXPECT_EQ(small.error().message, "buffer too small");

    flatbuffers::DetachedBuffer const buf = report::EncodeReport(sim::Simulate(100, true, 1));
    std::span<std::byte const> const view = as_bytes(buf);
    std::vector<std::byte> const bytes(view.begin(), view.end());

    // wrong file identifier
    std::vector<std::byte> foreign = bytes;
    foreign[4] = std::byte{'X'};
    EXPECT_FALSE(report::DecodeReport(foreign).has_value());

    // root offset pointing past the end
    std::vector<std::byte> damaged = bytes;
    damaged[0] = std::byte{0xFF};
    damaged[1] = std::byte{0xFF};
    EXPECT_FALSE(report::DecodeReport(damaged).has_value());
}
