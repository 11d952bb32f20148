#include <gtest/gtest.h>
#include "auth/token_authority.h"
#include "stream/download_coordinator.h"
#include "stream/stream_registry.h"
#include "stream/upload_coordinator.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using stream::ByteSink;
using stream::ByteSource;
using stream::CoordinatorOptions;
using stream::DownloadCoordinator;
using stream::SlotOptions;
using stream::StreamRegistry;
using stream::UploadCoordinator;

namespace {

// Hands out the given pieces one read at a time, optionally failing after them.
class ScriptedSource : public ByteSource {
public:
    explicit ScriptedSource(std::vector<std::string> pieces, bool fail_at_end = false,
                            std::chrono::milliseconds delay = 0ms)
        : pieces_(std::move(pieces)), fail_at_end_(fail_at_end), delay_(delay) {}

    ssize_t read(uint8_t* buffer, size_t length) override {
        ++reads_;
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        if (next_ == pieces_.size()) return fail_at_end_ ? -1 : 0;
        const std::string& piece = pieces_[next_++];
        size_t n = std::min(length, piece.size());
        std::memcpy(buffer, piece.data(), n);
        return static_cast<ssize_t>(n);
    }

    int reads() const { return reads_.load(); }

    bool peerAlive() override { return alive.load(); }
    std::atomic<bool> alive{true};

private:
    std::vector<std::string> pieces_;
    size_t next_{0};
    bool fail_at_end_;
    std::chrono::milliseconds delay_;
    std::atomic<int> reads_{0};
};

// Endless source: counts how many reads the producer managed.
class EndlessSource : public ByteSource {
public:
    ssize_t read(uint8_t* buffer, size_t length) override {
        size_t n = std::min<size_t>(length, 8);
        std::memset(buffer, 'x', n);
        ++reads_;
        return static_cast<ssize_t>(n);
    }
    std::atomic<int> reads_{0};
};

class CollectingSink : public ByteSink {
public:
    explicit CollectingSink(int fail_after_writes = -1, std::chrono::milliseconds delay = 0ms)
        : fail_after_writes_(fail_after_writes), delay_(delay) {}

    bool open() override {
        opened = true;
        return true;
    }
    bool write(const uint8_t* data, size_t length) override {
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        if (fail_after_writes_ >= 0 && writes >= fail_after_writes_) return false;
        ++writes;
        std::lock_guard<std::mutex> lock(mutex);
        chunks.emplace_back(reinterpret_cast<const char*>(data), length);
        return true;
    }
    bool finish() override {
        finished = true;
        return true;
    }

    bool peerAlive() override { return alive.load(); }

    std::string data() {
        std::lock_guard<std::mutex> lock(mutex);
        std::string all;
        for (auto& c : chunks) all += c;
        return all;
    }

    std::atomic<bool> alive{true};
    std::atomic<bool> opened{false};
    std::atomic<bool> finished{false};
    std::atomic<int> writes{0};
    std::mutex mutex;
    std::vector<std::string> chunks;

private:
    int fail_after_writes_;
    std::chrono::milliseconds delay_;
};

} // namespace

class CoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        policy_.initial_lifetime = 2s;
        policy_.extension_window = 2s;
        slot_options_.channel_capacity = 4;
        slot_options_.peer_timeout = 2s;
        options_.chunk_size = 16;
    }

    void build() {
        tokens_ = std::make_unique<auth::TokenAuthority>(policy_);
        registry_ = std::make_unique<StreamRegistry>(slot_options_);
        uploads_ = std::make_unique<UploadCoordinator>(*registry_, tokens_.get(), options_);
        downloads_ = std::make_unique<DownloadCoordinator>(*registry_, tokens_.get(), options_);
    }

    auth::TokenPolicy policy_;
    SlotOptions slot_options_;
    CoordinatorOptions options_;
    std::unique_ptr<auth::TokenAuthority> tokens_;
    std::unique_ptr<StreamRegistry> registry_;
    std::unique_ptr<UploadCoordinator> uploads_;
    std::unique_ptr<DownloadCoordinator> downloads_;
};

// Scenario A, with the 20 minute token lifetime scaled down to 200ms.
TEST_F(CoordinatorTest, UploadWithoutDownloadTimesOutWithTheToken) {
    policy_.initial_lifetime = 200ms;
    policy_.extension_window = 200ms;
    slot_options_.peer_timeout = 5min;
    build();
    Token token = tokens_->issue();
    StreamKey key(token.id, "a.txt");

    ScriptedSource source({"hello"});
    auto start = std::chrono::steady_clock::now();
    Result result = uploads_->upload(key, source);
    auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.code, ResultCode::TIMEOUT);
    EXPECT_GE(waited, 150ms);
    EXPECT_LT(waited, 5s);
    EXPECT_EQ(registry_->lookup(key), nullptr);
    EXPECT_EQ(source.reads(), 0);
}

TEST_F(CoordinatorTest, UploadTimesOutOnPeerDeadline) {
    slot_options_.peer_timeout = 100ms;
    build();
    Token token = tokens_->issue();
    StreamKey key(token.id, "a.txt");
    ScriptedSource source({"hello"});

    EXPECT_EQ(uploads_->upload(key, source).code, ResultCode::TIMEOUT);
    EXPECT_EQ(registry_->size(), 0u);
}

// Scenario B: the download waits, the upload arrives later.
TEST_F(CoordinatorTest, DownloadFirstReceivesLaterUpload) {
    build();
    Token token = tokens_->issue();
    StreamKey key(token.id, "a.txt");

    CollectingSink sink;
    auto download = std::async(std::launch::async, [&] { return downloads_->download(key, sink); });

    std::this_thread::sleep_for(200ms);
    EXPECT_FALSE(sink.opened.load());
    ASSERT_NE(registry_->lookup(key), nullptr);

    ScriptedSource source({"world"});
    Result up = uploads_->upload(key, source);
    Result down = download.get();

    EXPECT_TRUE(up.isOk()) << up.message;
    EXPECT_TRUE(down.isOk()) << down.message;
    EXPECT_EQ(sink.data(), "world");
    EXPECT_TRUE(sink.finished.load());
    EXPECT_EQ(registry_->size(), 0u);
}

// Scenario C: two uploads for one key.
TEST_F(CoordinatorTest, SecondUploadConflictsImmediately) {
    build();
    Token token = tokens_->issue();
    StreamKey key(token.id, "a.txt");

    ScriptedSource first_source({"one"});
    auto first = std::async(std::launch::async, [&] { return uploads_->upload(key, first_source); });
    while (registry_->lookup(key) == nullptr) std::this_thread::sleep_for(1ms);

    ScriptedSource second_source({"two"});
    auto start = std::chrono::steady_clock::now();
    Result second = uploads_->upload(key, second_source);
    EXPECT_EQ(second.code, ResultCode::CONFLICT);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);

    CollectingSink sink;
    EXPECT_TRUE(downloads_->download(key, sink).isOk());
    EXPECT_TRUE(first.get().isOk());
    EXPECT_EQ(sink.data(), "one");
}

TEST_F(CoordinatorTest, ChunksArriveInOrder) {
    build();
    Token token = tokens_->issue();
    StreamKey key(token.id, "big.bin");

    std::vector<std::string> pieces;
    std::string expected;
    for (int i = 0; i < 500; ++i) {
        pieces.push_back(std::to_string(i) + ",");
        expected += pieces.back();
    }

    ScriptedSource source(pieces);
    auto upload = std::async(std::launch::async, [&] { return uploads_->upload(key, source); });
    CollectingSink sink;
    Result down = downloads_->download(key, sink);

    EXPECT_TRUE(upload.get().isOk());
    EXPECT_TRUE(down.isOk());
    EXPECT_EQ(sink.data(), expected);
}

TEST_F(CoordinatorTest, SlowConsumerBoundsTheProducer) {
    slot_options_.channel_capacity = 2;
    build();
    Token token = tokens_->issue();
    StreamKey key(token.id, "endless");

    EndlessSource source;
    // the consumer takes one chunk and then fails, after a pause
    CollectingSink sink(1, 100ms);
    auto upload = std::async(std::launch::async, [&] { return uploads_->upload(key, source); });
    Result down = downloads_->download(key, sink);
    Result up = upload.get();

    EXPECT_EQ(down.code, ResultCode::PEER_DISCONNECTED);
    EXPECT_EQ(up.code, ResultCode::PEER_DISCONNECTED);
    // capacity + the two chunks the consumer took + the one blocked in send
    EXPECT_LE(source.reads_.load(), 2 + 1 + 1 + 1);
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(CoordinatorTest, UploadFailureBreaksTheDownload) {
    build();
    Token token = tokens_->issue();
    StreamKey key(token.id, "a.txt");

    ScriptedSource source({"partial"}, true);
    auto upload = std::async(std::launch::async, [&] { return uploads_->upload(key, source); });
    CollectingSink sink;
    Result down = downloads_->download(key, sink);

    EXPECT_EQ(upload.get().code, ResultCode::PEER_DISCONNECTED);
    EXPECT_EQ(down.code, ResultCode::PEER_DISCONNECTED);
    EXPECT_FALSE(sink.finished.load());
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(CoordinatorTest, DownloadDisconnectStopsTheUpload) {
    build();
    Token token = tokens_->issue();
    StreamKey key(token.id, "a.txt");

    EndlessSource source;
    CollectingSink sink(3);
    auto upload = std::async(std::launch::async, [&] { return uploads_->upload(key, source); });
    Result down = downloads_->download(key, sink);

    ASSERT_EQ(upload.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(upload.get().code, ResultCode::PEER_DISCONNECTED);
    EXPECT_EQ(down.code, ResultCode::PEER_DISCONNECTED);
    EXPECT_EQ(sink.writes.load(), 3);
}

TEST_F(CoordinatorTest, UnknownTokenIsUnauthorized) {
    build();
    ScriptedSource source({"x"});
    CollectingSink sink;
    EXPECT_EQ(uploads_->upload(StreamKey("nope", "a.txt"), source).code, ResultCode::UNAUTHORIZED);
    EXPECT_EQ(downloads_->download(StreamKey("", "a.txt"), sink).code, ResultCode::UNAUTHORIZED);
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(CoordinatorTest, TransferKeepsTheTokenAlive) {
    policy_.initial_lifetime = 300ms;
    policy_.extension_window = 300ms;
    build();
    Token token = tokens_->issue();
    StreamKey key(token.id, "slow.bin");

    // 12 pieces, 50ms apart: the transfer outlives the initial lifetime
    std::vector<std::string> pieces(12, "abcd");
    ScriptedSource source(pieces, false, 50ms);
    auto upload = std::async(std::launch::async, [&] { return uploads_->upload(key, source); });
    CollectingSink sink;
    Result down = downloads_->download(key, sink);

    EXPECT_TRUE(upload.get().isOk());
    EXPECT_TRUE(down.isOk());
    EXPECT_EQ(sink.data().size(), 48u);
    EXPECT_EQ(tokens_->validate(token.id), TokenStatus::AUTHORIZED);
}

TEST_F(CoordinatorTest, RevokedTokenStopsTheTransfer) {
    build();
    Token token = tokens_->issue();
    StreamKey key(token.id, "a.txt");

    std::vector<std::string> pieces(50, "abcd");
    ScriptedSource source(pieces, false, 10ms);
    auto upload = std::async(std::launch::async, [&] { return uploads_->upload(key, source); });
    CollectingSink sink;
    auto download = std::async(std::launch::async, [&] { return downloads_->download(key, sink); });

    while (sink.writes.load() < 2) std::this_thread::sleep_for(1ms);
    tokens_->revoke(token.id);

    Result up = upload.get();
    Result down = download.get();
    EXPECT_NE(up.code, ResultCode::OK);
    EXPECT_NE(down.code, ResultCode::OK);
    EXPECT_FALSE(sink.finished.load());
}

TEST_F(CoordinatorTest, DownloadWithoutUploadIsNotFoundWhenNotWaiting) {
    options_.auth_mode = AuthMode::OPEN;
    options_.wait_for_uploader = false;
    build();
    CollectingSink sink;
    EXPECT_EQ(downloads_->download(StreamKey("a.txt"), sink).code, ResultCode::NOT_FOUND);
    EXPECT_FALSE(sink.opened.load());

    ScriptedSource source({"open"});
    auto upload = std::async(std::launch::async, [&] { return uploads_->upload(StreamKey("a.txt"), source); });
    while (registry_->lookup(StreamKey("a.txt")) == nullptr) std::this_thread::sleep_for(1ms);
    EXPECT_TRUE(downloads_->download(StreamKey("a.txt"), sink).isOk());
    EXPECT_TRUE(upload.get().isOk());
    EXPECT_EQ(sink.data(), "open");
}

TEST_F(CoordinatorTest, ShutdownWakesWaitingParty) {
    slot_options_.peer_timeout = 0ms;
    build();
    Token token = tokens_->issue();
    StreamKey key(token.id, "a.txt");
    CollectingSink sink;
    auto download = std::async(std::launch::async, [&] { return downloads_->download(key, sink); });
    while (registry_->lookup(key) == nullptr) std::this_thread::sleep_for(1ms);

    registry_->abortAll();
    ASSERT_EQ(download.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(download.get().code, ResultCode::PEER_DISCONNECTED);
}

// The upload fits in the channel, so it can attach, send and finish before
// the waiting download is scheduled again.
TEST_F(CoordinatorTest, DownloadFirstSmallUploadIsNeverLost) {
    build();
    Token token = tokens_->issue();
    int lost = 0;
    for (int i = 0; i < 50; ++i) {
        StreamKey key(token.id, "small-" + std::to_string(i));
        CollectingSink sink;
        auto download = std::async(std::launch::async, [&] { return downloads_->download(key, sink); });
        while (registry_->lookup(key) == nullptr) std::this_thread::sleep_for(1ms);

        ScriptedSource source({"world"});
        Result up = uploads_->upload(key, source);
        Result down = download.get();
        EXPECT_TRUE(up.isOk()) << up.message;
        if (!down.isOk() || sink.data() != "world" || !sink.finished.load()) ++lost;
    }
    EXPECT_EQ(lost, 0);
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(CoordinatorTest, WaitingDownloaderThatLeavesFreesTheKey) {
    slot_options_.peer_timeout = 0ms;
    options_.liveness_interval = 20ms;
    build();
    Token token = tokens_->issue();
    StreamKey key(token.id, "a.txt");

    CollectingSink gone;
    auto download = std::async(std::launch::async, [&] { return downloads_->download(key, gone); });
    while (registry_->lookup(key) == nullptr) std::this_thread::sleep_for(1ms);
    gone.alive = false;

    ASSERT_EQ(download.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(download.get().code, ResultCode::PEER_DISCONNECTED);
    EXPECT_EQ(registry_->lookup(key), nullptr);
    EXPECT_FALSE(gone.opened.load());

    // the key is free again for a real pair
    CollectingSink sink;
    auto retry = std::async(std::launch::async, [&] { return downloads_->download(key, sink); });
    while (registry_->lookup(key) == nullptr) std::this_thread::sleep_for(1ms);
    ScriptedSource source({"again"});
    EXPECT_TRUE(uploads_->upload(key, source).isOk());
    EXPECT_TRUE(retry.get().isOk());
    EXPECT_EQ(sink.data(), "again");
}

TEST_F(CoordinatorTest, WaitingUploaderThatLeavesFreesTheKey) {
    options_.liveness_interval = 20ms;
    build();
    Token token = tokens_->issue();
    StreamKey key(token.id, "a.txt");

    ScriptedSource source({"never sent"});
    auto upload = std::async(std::launch::async, [&] { return uploads_->upload(key, source); });
    while (registry_->lookup(key) == nullptr) std::this_thread::sleep_for(1ms);
    source.alive = false;

    ASSERT_EQ(upload.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(upload.get().code, ResultCode::PEER_DISCONNECTED);
    EXPECT_EQ(source.reads(), 0);
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(CoordinatorTest, RevokeEndsThePeerWait) {
    slot_options_.peer_timeout = 5min;
    options_.liveness_interval = 20ms;
    build();
    Token token = tokens_->issue();
    StreamKey key(token.id, "a.txt");

    CollectingSink sink;
    auto download = std::async(std::launch::async, [&] { return downloads_->download(key, sink); });
    while (registry_->lookup(key) == nullptr) std::this_thread::sleep_for(1ms);
    ASSERT_TRUE(tokens_->revoke(token.id));

    ASSERT_EQ(download.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(download.get().code, ResultCode::UNAUTHORIZED);
    EXPECT_EQ(registry_->size(), 0u);
}
