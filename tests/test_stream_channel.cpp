#include <gtest/gtest.h>
#include "stream/stream_channel.h"
#include "stream/stream_slot.h"
#include <atomic>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;
using stream::Chunk;
using stream::ChannelStatus;
using stream::StreamChannel;
using stream::StreamSlot;

namespace {

Chunk chunkOf(uint8_t value, size_t size = 4) {
    return Chunk(size, value);
}

} // namespace

TEST(StreamChannel, BackpressureBlocksAtCapacity) {
    StreamChannel channel(2);
    EXPECT_EQ(channel.send(chunkOf(1)), ChannelStatus::OK);
    EXPECT_EQ(channel.send(chunkOf(2)), ChannelStatus::OK);
    EXPECT_EQ(channel.buffered(), 2u);
    // a stalled consumer stops the producer instead of growing the buffer
    EXPECT_EQ(channel.trySendFor(chunkOf(3), 30ms), lf::QueueStatus::TIMEOUT);

    Chunk out;
    EXPECT_EQ(channel.receive(out), ChannelStatus::OK);
    EXPECT_EQ(out[0], 1);
    EXPECT_EQ(channel.trySendFor(chunkOf(3), 30ms), lf::QueueStatus::OK);
}

TEST(StreamChannel, CloseIsEndOfStreamAfterDrain) {
    StreamChannel channel(4);
    channel.send(chunkOf(1));
    channel.close();

    Chunk out;
    EXPECT_EQ(channel.receive(out), ChannelStatus::OK);
    EXPECT_EQ(channel.receive(out), ChannelStatus::END_OF_STREAM);
    EXPECT_FALSE(channel.broken());
}

TEST(StreamChannel, AbortIsBrokenForBothSides) {
    StreamChannel channel(1);
    channel.send(chunkOf(1));

    std::atomic<bool> woke{false};
    std::thread producer([&] {
        EXPECT_EQ(channel.send(chunkOf(2)), ChannelStatus::BROKEN);
        woke = true;
    });
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(woke.load());
    channel.abort();
    producer.join();
    EXPECT_TRUE(woke.load());

    Chunk out;
    EXPECT_EQ(channel.receive(out), ChannelStatus::BROKEN);
    EXPECT_TRUE(channel.broken());
}

TEST(StreamSlot, SecondRoleStartsStreaming) {
    StreamSlot slot(StreamKey("a.bin"), StreamRole::PRODUCER, 4, std::nullopt);
    EXPECT_EQ(slot.state(), SlotState::AWAITING_PEER);
    EXPECT_TRUE(slot.hasRole(StreamRole::PRODUCER));
    EXPECT_FALSE(slot.attach(StreamRole::PRODUCER));
    EXPECT_TRUE(slot.attach(StreamRole::CONSUMER));
    EXPECT_EQ(slot.state(), SlotState::STREAMING);
    EXPECT_TRUE(slot.streamingSince().has_value());
    EXPECT_EQ(slot.waitForPeer(std::nullopt), stream::PeerWait::ATTACHED);
}

TEST(StreamSlot, WaitForPeerWakesOnAttach) {
    StreamSlot slot(StreamKey("a.bin"), StreamRole::CONSUMER, 4, std::nullopt);
    std::thread attacher([&] {
        std::this_thread::sleep_for(20ms);
        slot.attach(StreamRole::PRODUCER);
    });
    EXPECT_EQ(slot.waitForPeer(std::chrono::steady_clock::now() + 2s), stream::PeerWait::ATTACHED);
    attacher.join();
}

TEST(StreamSlot, WaitForPeerHonoursDeadline) {
    StreamSlot slot(StreamKey("a.bin"), StreamRole::PRODUCER, 4, std::nullopt);
    EXPECT_EQ(slot.waitForPeer(std::chrono::steady_clock::now() + 20ms), stream::PeerWait::DEADLINE);
    EXPECT_TRUE(slot.expire());
    EXPECT_EQ(slot.state(), SlotState::CLOSED);
    EXPECT_EQ(slot.closeReason(), stream::CloseReason::EXPIRED);
    EXPECT_FALSE(slot.attach(StreamRole::CONSUMER));
}

TEST(StreamSlot, ExpireLosesAgainstAttach) {
    StreamSlot slot(StreamKey("a.bin"), StreamRole::PRODUCER, 4, std::nullopt);
    slot.attach(StreamRole::CONSUMER);
    EXPECT_FALSE(slot.expire());
    EXPECT_EQ(slot.state(), SlotState::STREAMING);
}

TEST(StreamSlot, AbortBreaksChannelAndWakesWaiter) {
    StreamSlot slot(StreamKey("a.bin"), StreamRole::PRODUCER, 4, std::nullopt);
    std::thread aborter([&] {
        std::this_thread::sleep_for(20ms);
        slot.abort();
    });
    EXPECT_EQ(slot.waitForPeer(std::nullopt), stream::PeerWait::CLOSED);
    aborter.join();
    EXPECT_EQ(slot.closeReason(), stream::CloseReason::ABORTED);
    EXPECT_TRUE(slot.channel().broken());
}

TEST(StreamSlot, WaiterSeesPeerThatAlreadyFinished) {
    StreamSlot slot(StreamKey("a.bin"), StreamRole::CONSUMER, 4, std::nullopt);
    // the producer attaches, sends everything and finishes before the wait starts
    ASSERT_TRUE(slot.attach(StreamRole::PRODUCER));
    ASSERT_EQ(slot.channel().send(Chunk{'h', 'i'}), ChannelStatus::OK);
    slot.channel().close();
    slot.finish();
    ASSERT_EQ(slot.state(), SlotState::CLOSED);

    EXPECT_EQ(slot.waitForPeer(std::nullopt), stream::PeerWait::ATTACHED);
    Chunk out;
    EXPECT_EQ(slot.channel().receive(out), ChannelStatus::OK);
    EXPECT_EQ(out, (Chunk{'h', 'i'}));
    EXPECT_EQ(slot.channel().receive(out), ChannelStatus::END_OF_STREAM);
}

TEST(StreamSlot, AbortAfterPairingIsStillClosed) {
    StreamSlot slot(StreamKey("a.bin"), StreamRole::CONSUMER, 4, std::nullopt);
    ASSERT_TRUE(slot.attach(StreamRole::PRODUCER));
    slot.abort();
    EXPECT_EQ(slot.waitForPeer(std::nullopt), stream::PeerWait::CLOSED);
}

TEST(StreamSlot, AbandonOnlyWhileAwaitingPeer) {
    StreamSlot waiting(StreamKey("a.bin"), StreamRole::CONSUMER, 4, std::nullopt);
    EXPECT_TRUE(waiting.abandon());
    EXPECT_EQ(waiting.closeReason(), stream::CloseReason::ABORTED);
    EXPECT_EQ(waiting.waitForPeer(std::nullopt), stream::PeerWait::CLOSED);
    EXPECT_FALSE(waiting.attach(StreamRole::PRODUCER));

    StreamSlot paired(StreamKey("b.bin"), StreamRole::CONSUMER, 4, std::nullopt);
    ASSERT_TRUE(paired.attach(StreamRole::PRODUCER));
    EXPECT_FALSE(paired.abandon());
    EXPECT_EQ(paired.state(), SlotState::STREAMING);
}
