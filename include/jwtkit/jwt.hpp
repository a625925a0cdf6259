#pragma once

#include "jwtkit/error.hpp"
#include "jwtkit/json.hpp"
#include "jwtkit/jwk.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace jwtkit {

/// JOSE header of a signed JWT
struct Header {
    std::string alg;
    std::string typ;
    std::optional<std::string> kid;
    std::optional<std::string> enc;
    std::optional<std::string> cty;

    friend bool operator==(const Header&, const Header&) = default;
};

/// Serialize in the order alg, typ, kid, enc, cty; absent members omitted
void to_json(json& j, const Header& header);

/// Requires a string "alg"; a missing "typ" reads as empty; unknown members are ignored
void from_json(const json& j, Header& header);

namespace detail {

/// A token split and decoded, payload not yet converted to the caller's type
struct DecodedToken {
    Header header;
    json payload;
    std::string signingInput;  // segments[0] "." segments[1], byte for byte
    std::string signature;     // segments[2], still base64url
};

/// Split a compact token and decode header and payload JSON
/// @throws Error (Invalid)
DecodedToken decodeToken(std::string_view token);

/// Check the header against the key and the signature against the signing input
/// @throws Error (Header), (Invalid) or (Certificate)
void verifyToken(const DecodedToken& token, const Jwk& key);

/// Build the header for key, sign header.payload and return the compact token
/// @param header Receives the header that was signed
/// @param signature Receives the base64url signature segment
std::string signToken(const json& payload, const Jwk& key, Header& header, std::string& signature);

} // namespace detail

template <typename T>
class Parser;

/**
 * JSON Web Token as described in RFC 7519.
 *
 * T is the claim shape. It is converted through nlohmann_json, so it needs
 * to_json(jwtkit::json&, const T&) for signing and
 * from_json(const jwtkit::json&, T&) for parsing.
 */
template <typename T>
class Jwt {
public:
    Header header;
    T payload{};
    std::string signature;

    Jwt() = default;

    /// Unsigned token holding payload; header and signature stay empty until sign()
    explicit Jwt(T claims) : payload(std::move(claims)) {}

    Jwt(Header h, T claims, std::string sig)
        : header(std::move(h)), payload(std::move(claims)), signature(std::move(sig)) {}

    /// Sign with key and return the compact serialization.
    /// The header and signature of this instance are replaced by what was signed.
    /// @throws Error (Invalid) for a public key or an unserializable payload,
    ///         (Internal) on backend failure
    std::string sign(const Jwk& key) {
        json encoded;
        try {
            encoded = payload;
        } catch (const json::exception&) {
            throw Error(ErrorKind::Invalid, "Failed to encode segment");
        }
        return detail::signToken(encoded, key, header, signature);
    }

    /// Start parsing a compact token
    [[nodiscard]] static Parser<T> from(std::string token) {
        return Parser<T>(std::move(token));
    }
};

/**
 * Parser for a compact token.
 *
 *   Jwt<Claims>::from(token).withVerificationKey(key).parse();
 *
 * Without a verification key parse() decodes the token but does not check
 * the signature.
 */
template <typename T>
class Parser {
public:
    explicit Parser(std::string token) : token_(std::move(token)) {}

    /// Verify the signature with key when parsing; the last key set wins
    Parser& withVerificationKey(const Jwk& key) & {
        key_ = key;
        return *this;
    }

    Parser&& withVerificationKey(const Jwk& key) && {
        key_ = key;
        return std::move(*this);
    }

    /// @throws Error (Invalid), and with a key also (Header) or (Certificate)
    [[nodiscard]] Jwt<T> parse() const {
        auto decoded = detail::decodeToken(token_);

        T claims{};
        try {
            claims = decoded.payload.template get<T>();
        } catch (const json::exception&) {
            throw Error(ErrorKind::Invalid, "Failed to decode payload");
        }

        if (key_) {
            detail::verifyToken(decoded, *key_);
        }

        return Jwt<T>(std::move(decoded.header), std::move(claims), std::move(decoded.signature));
    }

private:
    std::string token_;
    std::optional<Jwk> key_;
};

/// Sign payload with key and return the compact token
template <typename T>
[[nodiscard]] std::string encode(const T& payload, const Jwk& key) {
    Jwt<T> token(payload);
    return token.sign(key);
}

/// Decode a token without checking its signature
template <typename T = json>
[[nodiscard]] Jwt<T> decode(std::string_view token) {
    return Jwt<T>::from(std::string(token)).parse();
}

/// Decode a token and verify its signature with key
template <typename T = json>
[[nodiscard]] Jwt<T> verify(std::string_view token, const Jwk& key) {
    return Jwt<T>::from(std::string(token)).withVerificationKey(key).parse();
}

} // namespace jwtkit
