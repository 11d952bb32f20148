#pragma once

#include <string>

// HTTP Basic credential check. The plain password only lives in the
// constructor; afterwards only the salted hash is kept.
// With an empty username the manager is disabled and authorizes everything.
class AuthManager {
public:
    AuthManager() = default;
    AuthManager(const std::string& username, const std::string& password);
    ~AuthManager() = default;

    bool enabled() const { return !username_.empty(); }

    // `authorization` is the raw Authorization header value ("" when absent).
    bool authorize(const std::string& authorization, std::string* error_message = nullptr) const;

private:
    std::string username_;
    std::string salt_;
    std::string password_hash_;
};
