#include "hash_utils.h"

#include <sstream>
#include <iomanip>
#include <vector>
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include "common/debug.h"

namespace utils {

std::string HashUtils::sha256Hex(const std::string& input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);
    return hashToHexString(hash, SHA256_DIGEST_LENGTH);
}

std::string HashUtils::randomHex(size_t bytes) {
    std::vector<unsigned char> buf(bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return hashToHexString(buf.data(), buf.size());
}

std::optional<std::string> HashUtils::base64Decode(const std::string& encoded) {
    if (encoded.empty()) return std::string();
    if (encoded.size() % 4 != 0) {
        log_cpp20("base64 input length is not a multiple of 4");
        return std::nullopt;
    }
    std::vector<unsigned char> out(encoded.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
                            static_cast<int>(encoded.size()));
    if (n < 0) {
        log_cpp20("EVP_DecodeBlock rejected input");
        return std::nullopt;
    }
    // EVP_DecodeBlock counts padding bytes as output
    size_t len = static_cast<size_t>(n);
    if (encoded[encoded.size() - 1] == '=') --len;
    if (encoded[encoded.size() - 2] == '=') --len;
    return std::string(reinterpret_cast<const char*>(out.data()), len);
}

std::string HashUtils::base64Encode(const std::string& raw) {
    std::vector<unsigned char> out(4 * ((raw.size() + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(raw.data()),
                            static_cast<int>(raw.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(n));
}

bool HashUtils::secureEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string HashUtils::hashToHexString(const unsigned char* hash, size_t length) {
    std::stringstream ss;
    for (size_t i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace utils
