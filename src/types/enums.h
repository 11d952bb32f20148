#ifndef ENUMS_H
#define ENUMS_H

enum class StreamRole {
    PRODUCER,
    CONSUMER
};

enum class SlotState {
    AWAITING_PEER,
    STREAMING,
    CLOSED
};

enum class TokenStatus {
    AUTHORIZED,
    EXPIRED,
    NOT_FOUND
};

// TOKEN: keys are (token, filename) and every stream needs a live token.
// OPEN: keys are the filename alone.
enum class AuthMode {
    TOKEN,
    OPEN
};

inline const char* toString(StreamRole role) {
    return role == StreamRole::PRODUCER ? "producer" : "consumer";
}

inline const char* toString(SlotState state) {
    switch (state) {
        case SlotState::AWAITING_PEER: return "awaiting_peer";
        case SlotState::STREAMING: return "streaming";
        case SlotState::CLOSED: return "closed";
    }
    return "unknown";
}

inline const char* toString(AuthMode mode) {
    return mode == AuthMode::TOKEN ? "token" : "open";
}

#endif // ENUMS_H
