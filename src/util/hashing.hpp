#ifndef PRIVACYGUARD_UTIL_HASHING_HPP
#define PRIVACYGUARD_UTIL_HASHING_HPP

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <openssl/evp.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 digests used to key stored restoration tables.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * USAGE:
 *   @code
 *   std::string id = privacyguard::util::hashing::sha256Hex(sanitizedText);
 *   // id is a 64-hex-character string
 *   @endcode
 */

namespace privacyguard {
namespace util {
namespace hashing {

/**
 * @brief Lowercase hex encoding of a byte buffer.
 */
inline std::string toHex(const unsigned char *data, size_t len)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

/**
 * @brief Compute a SHA-256 digest of the input, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256Hex(const std::string &input)
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("hashing::sha256Hex: Failed to create EVP_MD_CTX.");
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("hashing::sha256Hex: EVP_DigestInit_ex failed.");
    }
    if (EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
        throw std::runtime_error("hashing::sha256Hex: EVP_DigestUpdate failed.");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
        throw std::runtime_error("hashing::sha256Hex: EVP_DigestFinal_ex failed.");
    }
    return toHex(digest, digestLen);
}

} // namespace hashing
} // namespace util
} // namespace privacyguard

#endif // PRIVACYGUARD_UTIL_HASHING_HPP
