#pragma once

#include <cstddef>
#include <cstdint>
#include <sys/types.h>

namespace stream {

// Request body handed over by the transport.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    // > 0: bytes read, 0: end of stream, < 0: the uploading peer failed.
    virtual ssize_t read(uint8_t* buffer, size_t length) = 0;
    // Polled while the upload waits for a download client.
    virtual bool peerAlive() { return true; }
};

// Response body handed over by the transport.
class ByteSink {
public:
    virtual ~ByteSink() = default;
    // Called once, right before the first byte, when a producer is attached.
    virtual bool open() = 0;
    virtual bool write(const uint8_t* data, size_t length) = 0;
    // Marks a complete stream. Not called when the producer aborted.
    virtual bool finish() = 0;
    // Polled while the download waits for an upload.
    virtual bool peerAlive() { return true; }
};

} // namespace stream
