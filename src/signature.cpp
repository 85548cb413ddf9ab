#include "signature.hpp"
#include "util.hpp"

#ifdef HOOKDEPLOY_USE_COMMONCRYPTO
#include <CommonCrypto/CommonHMAC.h>
#else
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#endif

#include <stdexcept>

namespace hookdeploy {

std::string compute_signature(const std::string& body, const std::string& secret) {
#ifdef HOOKDEPLOY_USE_COMMONCRYPTO
    unsigned char digest[CC_SHA256_DIGEST_LENGTH];
    CCHmac(kCCHmacAlgSHA256, secret.data(), secret.size(),
           body.data(), body.size(), digest);
    return std::string(kSignaturePrefix) + hex_encode(digest, CC_SHA256_DIGEST_LENGTH);
#else
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()),
             reinterpret_cast<const unsigned char*>(body.data()), body.size(),
             digest, &digest_len) == nullptr) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return std::string(kSignaturePrefix) + hex_encode(digest, digest_len);
#endif
}

bool constant_time_equals(const std::string& a, const std::string& b) {
    // Always walk the full length of `a` so a length mismatch costs the same
    // as a content mismatch.
    const std::string& rhs = a.size() == b.size() ? b : a;
    unsigned char diff = a.size() == b.size() ? 0 : 1;
#ifdef HOOKDEPLOY_USE_COMMONCRYPTO
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ rhs[i]);
    }
#else
    if (!a.empty() && CRYPTO_memcmp(a.data(), rhs.data(), a.size()) != 0) {
        diff |= 1;
    }
#endif
    return diff == 0;
}

bool verify_signature(const std::string& body,
                      const std::optional<std::string>& presented,
                      const std::string& secret) {
    if (!presented) return false;
    std::string expected;
    try {
        expected = compute_signature(body, secret);
    } catch (const std::runtime_error&) {
        return false;
    }
    return constant_time_equals(expected, *presented);
}

} // namespace hookdeploy
