#ifndef PASSWORD_HASH_H
#define PASSWORD_HASH_H

#include <string>

// Salted password hashing for the operator credential.
// stored_hash = SHA256(password + salt), salt randomly generated at startup.
class PasswordHash {
public:
    static std::string generateSalt(size_t size = 16);
    static std::string serverHash(const std::string& password, const std::string& salt);
    static bool verify(const std::string& password,
                       const std::string& salt,
                       const std::string& stored_hash);
};

#endif // PASSWORD_HASH_H
