#include "utils/digest.hpp"

#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace minter::utils {
std::string toHex(const uint8_t *data, size_t size)
{
    static const char digits[] = "0123456789abcdef";
    std::string result(size * 2, '\0');
    for (size_t i = 0; i < size; i++) {
        result[2 * i] = digits[data[i] >> 4];
        result[2 * i + 1] = digits[data[i] & 0x0F];
    }
    return result;
}

std::string toHex(const std::string &bytes)
{
    return toHex(reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size());
}

std::string hmacSha256Hex(const std::string &key, const std::string &data)
{
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int digestLength = 0;
    const auto result
        = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
               reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest,
               &digestLength);
    if (result == nullptr) {
        throw std::runtime_error("HMAC-SHA-256 failed");
    }
    return toHex(digest, digestLength);
}

bool constantTimeEquals(const std::string &lhs, const std::string &rhs)
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}
} // namespace minter::utils
