#ifndef ERROR_CODES_H
#define ERROR_CODES_H

#include "types/result.h"

namespace protocol {

// HTTP status codes used by the relay
enum class HttpStatus {
    CONTINUE = 100,
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    REQUEST_TIMEOUT = 408,
    CONFLICT = 409,
    PAYLOAD_TOO_LARGE = 413,
    INTERNAL_SERVER_ERROR = 500,
    BAD_GATEWAY = 502,
    SERVICE_UNAVAILABLE = 503
};

inline HttpStatus toHttpStatus(ResultCode code) {
    switch (code) {
        case ResultCode::OK: return HttpStatus::OK;
        case ResultCode::CONFLICT: return HttpStatus::CONFLICT;
        case ResultCode::TIMEOUT: return HttpStatus::REQUEST_TIMEOUT;
        case ResultCode::UNAUTHORIZED: return HttpStatus::UNAUTHORIZED;
        case ResultCode::PEER_DISCONNECTED: return HttpStatus::BAD_GATEWAY;
        case ResultCode::NOT_FOUND: return HttpStatus::NOT_FOUND;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

inline const char* reasonPhrase(HttpStatus status) {
    switch (status) {
        case HttpStatus::CONTINUE: return "Continue";
        case HttpStatus::OK: return "OK";
        case HttpStatus::CREATED: return "Created";
        case HttpStatus::NO_CONTENT: return "No Content";
        case HttpStatus::BAD_REQUEST: return "Bad Request";
        case HttpStatus::UNAUTHORIZED: return "Unauthorized";
        case HttpStatus::NOT_FOUND: return "Not Found";
        case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
        case HttpStatus::REQUEST_TIMEOUT: return "Request Timeout";
        case HttpStatus::CONFLICT: return "Conflict";
        case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
        case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
        case HttpStatus::BAD_GATEWAY: return "Bad Gateway";
        case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
    }
    return "Unknown";
}

} // namespace protocol

#endif // ERROR_CODES_H
