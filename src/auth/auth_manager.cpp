#include "auth_manager.h"

#include <cctype>

#include "password_hash.h"
#include "utils/hash_utils.h"
#include "common/debug.h"

AuthManager::AuthManager(const std::string& username, const std::string& password)
    : username_(username) {
    if (username_.empty()) return;
    salt_ = PasswordHash::generateSalt();
    password_hash_ = PasswordHash::serverHash(password, salt_);
}

bool AuthManager::authorize(const std::string& authorization, std::string* error_message) const {
    if (!enabled()) return true;
    if (authorization.empty()) {
        if (error_message) *error_message = "missing Authorization header";
        return false;
    }
    static const std::string scheme = "basic ";
    if (authorization.size() <= scheme.size()) {
        if (error_message) *error_message = "malformed Authorization header";
        return false;
    }
    for (size_t i = 0; i < scheme.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(authorization[i])) != scheme[i]) {
            if (error_message) *error_message = "unsupported authorization scheme";
            return false;
        }
    }
    size_t begin = authorization.find_first_not_of(' ', scheme.size());
    size_t end = authorization.find_last_not_of(' ');
    if (begin == std::string::npos) {
        if (error_message) *error_message = "malformed Authorization header";
        return false;
    }
    auto decoded = utils::HashUtils::base64Decode(authorization.substr(begin, end - begin + 1));
    if (!decoded) {
        if (error_message) *error_message = "malformed Authorization header";
        return false;
    }
    auto colon = decoded->find(':');
    if (colon == std::string::npos) {
        if (error_message) *error_message = "malformed Basic credential";
        return false;
    }
    std::string user = decoded->substr(0, colon);
    std::string password = decoded->substr(colon + 1);
    if (user != username_) {
        log_cpp20("[AuthManager] unknown username supplied: " + user);
        if (error_message) *error_message = "invalid username or password";
        return false;
    }
    if (password.empty()) {
        if (error_message) *error_message = "invalid username or password";
        return false;
    }
    if (!PasswordHash::verify(password, salt_, password_hash_)) {
        if (error_message) *error_message = "invalid username or password";
        return false;
    }
    return true;
}
