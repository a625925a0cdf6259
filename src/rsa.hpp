#pragma once

#include <openssl/evp.h>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace jwtkit::internal {

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

/// Big-endian unsigned RSA parameters as decoded from a JWK.
/// Private fields are empty for a public key; dp, dq and qi may be empty
/// on a private key, in which case they are derived from d, p and q.
struct RsaComponents {
    std::vector<std::uint8_t> n;
    std::vector<std::uint8_t> e;
    std::vector<std::uint8_t> d;
    std::vector<std::uint8_t> p;
    std::vector<std::uint8_t> q;
    std::vector<std::uint8_t> dp;
    std::vector<std::uint8_t> dq;
    std::vector<std::uint8_t> qi;
};

/// Build an OpenSSL public key from (n, e)
/// @throws jwtkit::Error (Invalid) if OpenSSL rejects the components
EvpPkeyPtr buildRsaPublicKey(const RsaComponents& components);

/// Build an OpenSSL key pair from (n, e, d, p, q[, dp, dq, qi])
/// @throws jwtkit::Error (Invalid) if OpenSSL rejects the components
EvpPkeyPtr buildRsaPrivateKey(const RsaComponents& components);

/// RSASSA-PKCS1-v1_5 with SHA-256 over message
/// @throws jwtkit::Error (Internal) on any OpenSSL failure
std::vector<std::uint8_t> rs256Sign(EVP_PKEY* key, std::span<const std::uint8_t> message);

/// Verify an RSASSA-PKCS1-v1_5 / SHA-256 signature
/// @return true only if the signature matches the message under the key
bool rs256Verify(EVP_PKEY* key,
                 std::span<const std::uint8_t> message,
                 std::span<const std::uint8_t> signature);

/// Drain the OpenSSL error queue into a printable string
std::string opensslError();

} // namespace jwtkit::internal
