#pragma once

#include <cstdint>
#include <string>

#include "connection.h"
#include "protocol/request_parser.h"
#include "stream/byte_io.h"

namespace net {

// Request body of an upload, as Content-Length or chunked transfer coding.
// A request announcing neither has an empty body.
class HttpBodySource : public stream::ByteSource {
public:
    static constexpr size_t MAX_CHUNK_LINE = 1024;

    HttpBodySource(Connection& connection, const protocol::HttpRequest& request);

    ssize_t read(uint8_t* buffer, size_t length) override;

    // A client that half-closed after its whole Content-Length body arrived
    // still counts as alive.
    bool peerAlive() override;

    uint64_t consumed() const { return consumed_; }

private:
    enum class Mode { EMPTY, LENGTH, CHUNKED };

    ssize_t readChunked(uint8_t* buffer, size_t length);
    bool nextChunk();
    bool skipTrailers();
    bool sendContinue();

    Connection& connection_;
    Mode mode_{Mode::EMPTY};
    bool expect_continue_{false};
    bool continue_sent_{false};
    bool finished_{false};
    uint64_t remaining_{0};     // bytes left in the body or in the current chunk
    bool first_chunk_{true};
    uint64_t consumed_{0};
};

// Download response: status line and headers on open(), then one HTTP chunk
// per write. Leaving out the terminating chunk tells the client the transfer broke.
class ChunkedResponseSink : public stream::ByteSink {
public:
    ChunkedResponseSink(Connection& connection, std::string file_name);

    bool open() override;
    bool write(const uint8_t* data, size_t length) override;
    bool finish() override;
    bool peerAlive() override;

    // Once opened, an error can no longer be reported with a status code.
    bool opened() const { return opened_; }
    uint64_t written() const { return written_; }

private:
    Connection& connection_;
    std::string file_name_;
    bool opened_{false};
    uint64_t written_{0};
};

} // namespace net
