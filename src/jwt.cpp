#include "jwtkit/jwt.hpp"
#include "jwtkit/jwt_constants.hpp"
#include "jwtkit/log.hpp"
#include "base64url.hpp"
#include "jwt_utils.hpp"

namespace jwtkit {

namespace {
    void readOptional(const json& j, const char* member, std::optional<std::string>& out) {
        if (auto it = j.find(member); it != j.end() && !it->is_null()) {
            out = it->get<std::string>();
        }
    }
}

void to_json(json& j, const Header& header) {
    j = json::object();
    j["alg"] = header.alg;
    j["typ"] = header.typ;
    if (header.kid) j["kid"] = *header.kid;
    if (header.enc) j["enc"] = *header.enc;
    if (header.cty) j["cty"] = *header.cty;
}

void from_json(const json& j, Header& header) {
    header.alg = j.at("alg").get<std::string>();
    header.typ.clear();
    if (auto it = j.find("typ"); it != j.end() && !it->is_null()) {
        header.typ = it->get<std::string>();
    }
    header.kid.reset();
    header.enc.reset();
    header.cty.reset();
    readOptional(j, "kid", header.kid);
    readOptional(j, "enc", header.enc);
    readOptional(j, "cty", header.cty);
}

namespace detail {

DecodedToken decodeToken(std::string_view token) {
    using namespace internal;

    if (token.size() > MAX_JWT_SIZE) {
        throw Error(ErrorKind::Invalid, "JWT exceeds maximum size");
    }

    auto parts = parseJwt(token);

    DecodedToken decoded;
    try {
        auto header = decodeSegment(parts.header_b64);
        if (!header.is_object()) {
            throw Error(ErrorKind::Invalid, "Failed to decode header");
        }
        decoded.header = header.get<Header>();
    } catch (const Error&) {
        throw Error(ErrorKind::Invalid, "Failed to decode header");
    } catch (const json::exception&) {
        throw Error(ErrorKind::Invalid, "Failed to decode header");
    }

    try {
        decoded.payload = decodeSegment(parts.payload_b64);
    } catch (const Error&) {
        throw Error(ErrorKind::Invalid, "Failed to decode payload");
    } catch (const json::exception&) {
        throw Error(ErrorKind::Invalid, "Failed to decode payload");
    }

    decoded.signingInput = std::move(parts.signing_input);
    decoded.signature = std::move(parts.signature_b64);

    log::debug("Decoded JWT (alg: {}, kid: {})",
               decoded.header.alg, decoded.header.kid.value_or("<none>"));
    return decoded;
}

void verifyToken(const DecodedToken& token, const Jwk& key) {
    using namespace internal;

    if (isUnsecuredAlgorithm(token.header.alg)) {
        log::warning("Rejected unsigned JWT (alg: {})", token.header.alg);
        throw Error(ErrorKind::Header, "Unsigned tokens are not accepted");
    }
    if (token.header.alg != key.alg()) {
        log::warning("JWT algorithm '{}' does not match key algorithm '{}'",
                     token.header.alg, key.alg());
        throw Error(ErrorKind::Header, "Token algorithm does not match key");
    }

    std::vector<std::uint8_t> signature;
    try {
        signature = base64url_decode(token.signature);
    } catch (const Error&) {
        throw Error(ErrorKind::Invalid, "Failed to decode signature");
    }

    key.verify(as_bytes(token.signingInput), signature);
}

std::string signToken(const json& payload, const Jwk& key, Header& header, std::string& signature) {
    using namespace internal;

    auto headerJson = createHeader(key);
    std::string signing_input = encodeSegment(headerJson) + "." + encodeSegment(payload);

    auto signature_bytes = key.sign(as_bytes(signing_input));
    std::string signature_b64 = base64url_encode(signature_bytes);

    header = headerJson.get<Header>();
    signature = signature_b64;

    log::debug("Signed JWT (alg: {}, kid: {})", header.alg, header.kid.value_or("<none>"));
    return signing_input + "." + signature_b64;
}

} // namespace detail
} // namespace jwtkit
