#pragma once

#include "jwtkit/json.hpp"
#include "jwtkit/jwk.hpp"
#include <string>
#include <string_view>

namespace jwtkit::internal {

/// The three segments of a compact JWT
struct JwtParts {
    std::string header_b64;
    std::string payload_b64;
    std::string signature_b64;
    std::string signing_input;  // "header.payload"
};

/// Split a compact JWT on '.'
/// @param jwt JWT string in format "header.payload.signature"
/// @return JwtParts with the segments exactly as they appear in jwt
/// @throws jwtkit::Error (Invalid) unless there are exactly 3 segments
JwtParts parseJwt(std::string_view jwt);

/// Create the JOSE header for a token signed by key
/// @return {"alg":<key alg>,"typ":"JWT"[,"kid":<key kid>]}
json createHeader(const Jwk& key);

/// Serialize a JSON value and base64url-encode it
/// @throws jwtkit::Error (Invalid) if the value cannot be serialized
std::string encodeSegment(const json& value);

/// Base64url-decode a segment and parse it as JSON
/// @throws jwtkit::Error or json::exception on malformed input
json decodeSegment(std::string_view segment);

/// True for "none" in any letter case
bool isUnsecuredAlgorithm(std::string_view alg);

}
