#pragma once

#include <string>
#include <cstddef>
#include <optional>

namespace utils {

class HashUtils {
public:
    static std::string sha256Hex(const std::string& input);
    // Hex string of `bytes` bytes from the OpenSSL CSPRNG. Throws std::runtime_error
    // if the generator is not seeded.
    static std::string randomHex(size_t bytes);
    static std::optional<std::string> base64Decode(const std::string& encoded);
    static std::string base64Encode(const std::string& raw);
    static bool secureEquals(const std::string& a, const std::string& b);
private:
    static std::string hashToHexString(const unsigned char* hash, size_t length);
};

} // namespace utils
