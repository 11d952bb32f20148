#ifndef RESULT_H
#define RESULT_H

#include <string>

// Outcome of an upload or download as seen by the transport layer.
enum class ResultCode {
    OK,
    CONFLICT,
    TIMEOUT,
    UNAUTHORIZED,
    PEER_DISCONNECTED,
    NOT_FOUND
};

struct Result {
    ResultCode code;
    std::string message;

    Result(ResultCode code, const std::string& message)
        : code(code), message(message) {}

    static Result ok(const std::string& message = "ok") {
        return Result(ResultCode::OK, message);
    }

    bool isOk() const { return code == ResultCode::OK; }
};

inline const char* toString(ResultCode code) {
    switch (code) {
        case ResultCode::OK: return "ok";
        case ResultCode::CONFLICT: return "conflict";
        case ResultCode::TIMEOUT: return "timeout";
        case ResultCode::UNAUTHORIZED: return "unauthorized";
        case ResultCode::PEER_DISCONNECTED: return "peer_disconnected";
        case ResultCode::NOT_FOUND: return "not_found";
    }
    return "unknown";
}

#endif // RESULT_H
