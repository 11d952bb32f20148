#include <gtest/gtest.h>
#include "auth/token_authority.h"
#include "stream/janitor.h"
#include "stream/stream_registry.h"
#include <chrono>
#include <thread>

using namespace std::chrono_literals;
using stream::Janitor;
using stream::StreamRegistry;

class JanitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auth::TokenPolicy policy;
        policy.initial_lifetime = 50ms;
        policy.extension_window = 50ms;
        tokens_ = std::make_unique<auth::TokenAuthority>(policy);

        stream::SlotOptions options;
        options.peer_timeout = 50ms;
        registry_ = std::make_unique<StreamRegistry>(options);
    }

    std::unique_ptr<auth::TokenAuthority> tokens_;
    std::unique_ptr<StreamRegistry> registry_;
};

TEST_F(JanitorTest, SweepOnceEvictsExpiredState) {
    Janitor janitor(*registry_, tokens_.get(), 1h);
    tokens_->issue();
    StreamRegistry::Attachment waiting, streaming;
    registry_->findOrCreate(StreamKey("waiting"), StreamRole::PRODUCER, waiting);
    registry_->findOrCreate(StreamKey("streaming"), StreamRole::PRODUCER, streaming);
    registry_->findOrCreate(StreamKey("streaming"), StreamRole::CONSUMER, streaming);

    auto early = janitor.sweepOnce();
    EXPECT_EQ(early.tokens_purged, 0u);
    EXPECT_EQ(early.slots_expired, 0u);

    std::this_thread::sleep_for(80ms);
    auto stats = janitor.sweepOnce();
    EXPECT_EQ(stats.tokens_purged, 1u);
    EXPECT_EQ(stats.slots_expired, 1u);
    EXPECT_EQ(tokens_->size(), 0u);
    // streaming slots survive any number of sweeps
    ASSERT_NE(registry_->lookup(StreamKey("streaming")), nullptr);
    EXPECT_EQ(registry_->lookup(StreamKey("waiting")), nullptr);
    EXPECT_EQ(janitor.sweeps(), 2u);
}

TEST_F(JanitorTest, WorksWithoutTokens) {
    Janitor janitor(*registry_, nullptr, 1h);
    auto stats = janitor.sweepOnce();
    EXPECT_EQ(stats.tokens_purged, 0u);
}

TEST_F(JanitorTest, RunsPeriodically) {
    Janitor janitor(*registry_, tokens_.get(), 20ms);
    tokens_->issue();
    janitor.start();
    EXPECT_TRUE(janitor.running());

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (tokens_->size() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(tokens_->size(), 0u);
    EXPECT_GE(janitor.sweeps(), 1u);
    janitor.stop();
    EXPECT_FALSE(janitor.running());
}

TEST_F(JanitorTest, StopDoesNotWaitOutTheInterval) {
    Janitor janitor(*registry_, tokens_.get(), 1h);
    janitor.start();
    auto start = std::chrono::steady_clock::now();
    janitor.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(janitor.sweeps(), 0u);
}

TEST_F(JanitorTest, ExpiredSlotWakesItsWaiter) {
    Janitor janitor(*registry_, nullptr, 1h);
    StreamRegistry::Attachment att;
    registry_->findOrCreate(StreamKey("a"), StreamRole::CONSUMER, att);
    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(janitor.sweepOnce().slots_expired, 1u);
    EXPECT_EQ(att.slot->waitForPeer(std::nullopt), stream::PeerWait::CLOSED);
    EXPECT_EQ(att.slot->closeReason(), stream::CloseReason::EXPIRED);
}

TEST_F(JanitorTest, SweepRunsRegisteredHooks) {
    Janitor janitor(*registry_, nullptr, 1h);
    int calls = 0;
    janitor.onSweep([&calls] { ++calls; });
    janitor.sweepOnce();
    janitor.sweepOnce();
    EXPECT_EQ(calls, 2);
}
