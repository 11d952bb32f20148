#include "password_hash.h"

#include "utils/hash_utils.h"

std::string PasswordHash::generateSalt(size_t size) {
    return utils::HashUtils::randomHex(size);
}

std::string PasswordHash::serverHash(const std::string& password, const std::string& salt) {
    return utils::HashUtils::sha256Hex(password + salt);
}

bool PasswordHash::verify(const std::string& password, const std::string& salt, const std::string& stored_hash) {
    return utils::HashUtils::secureEquals(serverHash(password, salt), stored_hash);
}
