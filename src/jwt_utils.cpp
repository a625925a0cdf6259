#include "jwt_utils.hpp"
#include "jwtkit/error.hpp"
#include "jwtkit/jwt_constants.hpp"
#include "base64url.hpp"
#include <algorithm>
#include <cctype>

namespace jwtkit::internal {

JwtParts parseJwt(std::string_view jwt) {
    size_t first_dot = jwt.find('.');
    size_t second_dot = first_dot == std::string_view::npos
                            ? std::string_view::npos
                            : jwt.find('.', first_dot + 1);

    if (second_dot == std::string_view::npos ||
        jwt.find('.', second_dot + 1) != std::string_view::npos) {
        throw Error(ErrorKind::Invalid, "JWT does not have 3 segments");
    }

    std::string header_b64(jwt.substr(0, first_dot));
    std::string payload_b64(jwt.substr(first_dot + 1, second_dot - first_dot - 1));
    std::string signature_b64(jwt.substr(second_dot + 1));

    // What was actually signed: the original bytes, never a reserialization
    std::string signing_input(jwt.substr(0, second_dot));

    return JwtParts{
        std::move(header_b64),
        std::move(payload_b64),
        std::move(signature_b64),
        std::move(signing_input)
    };
}

json createHeader(const Jwk& key) {
    json header;
    header["alg"] = key.alg();
    header["typ"] = JWT_TYPE;
    if (key.kid()) {
        header["kid"] = *key.kid();
    }
    return header;
}

std::string encodeSegment(const json& value) {
    std::string text;
    try {
        text = value.dump();
    } catch (const json::exception&) {
        // invalid UTF-8 in a string member
        throw Error(ErrorKind::Invalid, "Failed to encode segment");
    }
    return base64url_encode(text);
}

json decodeSegment(std::string_view segment) {
    return json::parse(base64url_decode_string(segment));
}

bool isUnsecuredAlgorithm(std::string_view alg) {
    return std::equal(alg.begin(), alg.end(),
                      std::string_view(ALG_NONE).begin(), std::string_view(ALG_NONE).end(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) == b;
                      });
}

}
