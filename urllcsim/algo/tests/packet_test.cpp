#include <urllcsim/algo/error.hpp>
#include <urllcsim/algo/packet.hpp>

#include <gtest/gtest.h>

using namespace urllcsim::algo;
using namespace urllcsim::core;

TEST(PacketTest, DeadlineIsCreationPlusBudget) {
    Packet packet(1, 0, time_from_seconds(0.5), 1024, 2, duration_from_seconds(0.005));
    EXPECT_EQ(packet.deadline(), time_from_seconds(0.505));
    EXPECT_EQ(packet.size_bits(), 1024U);
    EXPECT_EQ(packet.original_size_bits(), 1024U);
    EXPECT_EQ(packet.fragment_index(), 0U);
}

TEST(PacketTest, ZeroSizeIsRejected) {
    try {
        Packet packet(9, 0, TimePoint::epoch(), 0, 1, duration_from_seconds(0.001));
        FAIL() << "expected PacketError";
    } catch (const PacketError& e) {
        EXPECT_EQ(e.packet_id(), 9U);
    }
}

TEST(PacketTest, NegativeBudgetIsRejected) {
    EXPECT_THROW(Packet(1, 0, TimePoint::epoch(), 10, 1, duration_from_seconds(-0.001)),
                 PacketError);
}

TEST(PacketTest, ContinuationKeepsIdentity) {
    Packet packet(3, 2, time_from_seconds(1.0), 2500, 4, duration_from_seconds(0.01));
    packet.set_dispatch_key(0.25);

    Packet next = packet.continuation(1500);

    EXPECT_EQ(next.id(), 3U);
    EXPECT_EQ(next.device_id(), 2U);
    EXPECT_EQ(next.size_bits(), 1500U);
    EXPECT_EQ(next.original_size_bits(), 2500U);
    EXPECT_EQ(next.deadline(), packet.deadline());
    EXPECT_EQ(next.fragment_index(), 1U);
    EXPECT_DOUBLE_EQ(next.dispatch_key(), 0.25);
    EXPECT_EQ(next.continuation(500).original_size_bits(), 2500U);
}

TEST(PacketTest, ContinuationMustShrink) {
    Packet packet(3, 2, TimePoint::epoch(), 100, 1, duration_from_seconds(0.01));
    EXPECT_THROW((void)packet.continuation(0), PacketError);
    EXPECT_THROW((void)packet.continuation(100), PacketError);
}

TEST(PacketTest, IdsAreUniqueAndIncreasing) {
    PacketIdGenerator ids;
    EXPECT_EQ(ids.issued(), 0U);
    EXPECT_EQ(ids.next(), 1U);
    EXPECT_EQ(ids.next(), 2U);
    EXPECT_EQ(ids.issued(), 2U);
}
