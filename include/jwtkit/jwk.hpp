#pragma once

#include "jwtkit/json.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jwtkit {

/// RSA public key parameters (base64url, big-endian, unsigned)
struct RsaPublic {
    std::string n;
    std::string e;

    friend bool operator==(const RsaPublic&, const RsaPublic&) = default;
};

/// RSA private key parameters (base64url, big-endian, unsigned)
struct RsaPrivate {
    std::string n;
    std::string e;
    std::string d;
    std::string p;
    std::string q;
    std::optional<std::string> dp;
    std::optional<std::string> dq;
    std::optional<std::string> qi;

    friend bool operator==(const RsaPrivate&, const RsaPrivate&) = default;
};

/// Key-type specific part of a JWK, discriminated by the presence of "d"
using KeyBody = std::variant<RsaPublic, RsaPrivate>;

/**
 * JSON Web Key as described in RFC 7517.
 *
 * A Jwk is immutable once parsed. Copies share the same OpenSSL key
 * material, so a Jwk can be handed to several threads and used for
 * concurrent sign/verify calls.
 */
class Jwk {
public:
    /// Parse a single JWK JSON object
    /// @throws Error (Invalid) on malformed JSON, unsupported kty,
    ///         missing members or key material OpenSSL rejects
    [[nodiscard]] static Jwk parse(std::string_view json);

    /// Build a JWK from an already parsed JSON object
    [[nodiscard]] static Jwk fromJson(const json& object);

    [[nodiscard]] const std::string& kty() const;
    [[nodiscard]] const std::optional<std::string>& kid() const;
    [[nodiscard]] const std::optional<std::vector<std::string>>& keyOps() const;
    [[nodiscard]] const std::optional<std::string>& x5u() const;
    [[nodiscard]] const std::optional<std::vector<std::string>>& x5c() const;
    [[nodiscard]] const std::optional<std::string>& x5t() const;
    [[nodiscard]] const std::optional<std::string>& x5tS256() const;
    [[nodiscard]] const KeyBody& body() const;

    /// The "alg" member, or the algorithm implied by the key type
    [[nodiscard]] std::string alg() const;

    /// True if the key holds the private exponent and can sign
    [[nodiscard]] bool isPrivate() const;

    /// Public projection: same metadata, private members dropped
    [[nodiscard]] Jwk publicKey() const;

    /// Verify an RS256 signature over message
    /// @throws Error (Certificate) if the signature does not match
    void verify(std::span<const std::uint8_t> message,
                std::span<const std::uint8_t> signature) const;

    /// Sign message with RS256
    /// @throws Error (Invalid) for a public key, (Internal) on backend failure
    [[nodiscard]] std::vector<std::uint8_t> sign(std::span<const std::uint8_t> message) const;

    /// Serialize back to RFC 7517 JSON (absent members omitted)
    [[nodiscard]] json toJsonObject() const;
    [[nodiscard]] std::string toJson() const;

    /// Compare metadata and key parameters
    friend bool operator==(const Jwk& lhs, const Jwk& rhs);

private:
    class Impl;
    explicit Jwk(std::shared_ptr<const Impl> impl);

    std::shared_ptr<const Impl> impl_;
};

} // namespace jwtkit
