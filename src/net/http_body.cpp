#include "http_body.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>

#include "common/debug.h"
#include "protocol/response_builder.h"

namespace net {

HttpBodySource::HttpBodySource(Connection& connection, const protocol::HttpRequest& request)
    : connection_(connection), expect_continue_(request.expectContinue()) {
    if (request.chunked()) {
        mode_ = Mode::CHUNKED;
    } else if (auto length = request.contentLength()) {
        mode_ = Mode::LENGTH;
        remaining_ = *length;
    }
    if (mode_ == Mode::EMPTY || (mode_ == Mode::LENGTH && remaining_ == 0)) {
        finished_ = true;
    }
}

bool HttpBodySource::sendContinue() {
    if (!expect_continue_ || continue_sent_) return true;
    continue_sent_ = true;
    return connection_.sendData(protocol::ResponseBuilder::buildContinue());
}

ssize_t HttpBodySource::read(uint8_t* buffer, size_t length) {
    if (finished_ || length == 0) return 0;
    // the client holds the body back until we are ready for it
    if (!sendContinue()) return -1;

    if (mode_ == Mode::CHUNKED) {
        return readChunked(buffer, length);
    }

    size_t want = static_cast<size_t>(std::min<uint64_t>(remaining_, length));
    ssize_t n = connection_.read(buffer, want);
    if (n <= 0) {
        // the uploader went away before sending the announced length
        log_cpp20("upload body cut short, " + std::to_string(remaining_) + " bytes missing");
        return -1;
    }
    remaining_ -= static_cast<uint64_t>(n);
    consumed_ += static_cast<uint64_t>(n);
    if (remaining_ == 0) finished_ = true;
    return n;
}

bool HttpBodySource::peerAlive() {
    if (!connection_.peerHungUp()) return true;
    return mode_ != Mode::CHUNKED && (finished_ || connection_.pendingBytes() >= remaining_);
}

ssize_t HttpBodySource::readChunked(uint8_t* buffer, size_t length) {
    if (remaining_ == 0) {
        if (!nextChunk()) return -1;
        if (finished_) return 0;
    }
    size_t want = static_cast<size_t>(std::min<uint64_t>(remaining_, length));
    ssize_t n = connection_.read(buffer, want);
    if (n <= 0) {
        log_cpp20("chunked upload body cut short");
        return -1;
    }
    remaining_ -= static_cast<uint64_t>(n);
    consumed_ += static_cast<uint64_t>(n);
    return n;
}

// Consumes the CRLF after the previous chunk and the next size line.
bool HttpBodySource::nextChunk() {
    std::string line;
    if (!first_chunk_) {
        if (!connection_.readLine(line, MAX_CHUNK_LINE) || !line.empty()) {
            error_cpp20("malformed chunk terminator");
            return false;
        }
    }
    first_chunk_ = false;

    if (!connection_.readLine(line, MAX_CHUNK_LINE)) {
        return false;
    }
    auto semicolon = line.find(';');
    std::string size_str = line.substr(0, semicolon);
    while (!size_str.empty() && (size_str.back() == ' ' || size_str.back() == '\t')) {
        size_str.pop_back();
    }
    if (size_str.empty() || size_str.size() > 16 ||
        size_str.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
        error_cpp20("malformed chunk size line: " + line);
        return false;
    }
    remaining_ = std::strtoull(size_str.c_str(), nullptr, 16);
    if (remaining_ == 0) {
        if (!skipTrailers()) return false;
        finished_ = true;
    }
    return true;
}

bool HttpBodySource::skipTrailers() {
    std::string line;
    for (;;) {
        if (!connection_.readLine(line, MAX_CHUNK_LINE)) {
            return false;
        }
        if (line.empty()) return true;
    }
}


ChunkedResponseSink::ChunkedResponseSink(Connection& connection, std::string file_name)
    : connection_(connection), file_name_(std::move(file_name)) {}

bool ChunkedResponseSink::open() {
    if (opened_) return true;
    opened_ = true;
    return connection_.sendData(protocol::ResponseBuilder::buildDownloadHead(file_name_));
}

bool ChunkedResponseSink::write(const uint8_t* data, size_t length) {
    if (length == 0) return true;
    char size_line[24];
    int n = std::snprintf(size_line, sizeof(size_line), "%zx\r\n", length);
    if (!connection_.sendData(size_line, static_cast<size_t>(n))) return false;
    if (!connection_.sendData(reinterpret_cast<const char*>(data), length)) return false;
    if (!connection_.sendData("\r\n", 2)) return false;
    written_ += length;
    return true;
}

bool ChunkedResponseSink::finish() {
    return connection_.sendData("0\r\n\r\n", 5);
}

bool ChunkedResponseSink::peerAlive() {
    return !connection_.peerHungUp();
}

} // namespace net
