#include "jwtkit/validation.hpp"
#include "jwtkit/log.hpp"
#include <algorithm>
#include <chrono>
#include <limits>

namespace jwtkit {

namespace {
    template <typename V>
    void readOptional(const json& j, const char* member, std::optional<V>& out) {
        out.reset();
        if (auto it = j.find(member); it != j.end() && !it->is_null()) {
            out = it->get<V>();
        }
    }

    // Claim times come from the token, so the skew adjustment must not overflow
    std::int64_t saturatingAdd(std::int64_t a, std::int64_t b) {
        constexpr auto max = std::numeric_limits<std::int64_t>::max();
        constexpr auto min = std::numeric_limits<std::int64_t>::min();
        if (b > 0 && a > max - b) return max;
        if (b < 0 && a < min - b) return min;
        return a + b;
    }

    std::int64_t saturatingSub(std::int64_t a, std::int64_t b) {
        constexpr auto max = std::numeric_limits<std::int64_t>::max();
        constexpr auto min = std::numeric_limits<std::int64_t>::min();
        if (b < 0 && a > max + b) return max;
        if (b > 0 && a < min + b) return min;
        return a - b;
    }
}

void to_json(json& j, const RegisteredClaims& claims) {
    j = json::object();
    if (claims.iss) j["iss"] = *claims.iss;
    if (claims.sub) j["sub"] = *claims.sub;
    if (claims.aud.size() == 1) {
        j["aud"] = claims.aud.front();
    } else if (!claims.aud.empty()) {
        j["aud"] = claims.aud;
    }
    if (claims.exp) j["exp"] = *claims.exp;
    if (claims.nbf) j["nbf"] = *claims.nbf;
    if (claims.iat) j["iat"] = *claims.iat;
    if (claims.jti) j["jti"] = *claims.jti;
}

void from_json(const json& j, RegisteredClaims& claims) {
    readOptional(j, "iss", claims.iss);
    readOptional(j, "sub", claims.sub);
    readOptional(j, "exp", claims.exp);
    readOptional(j, "nbf", claims.nbf);
    readOptional(j, "iat", claims.iat);
    readOptional(j, "jti", claims.jti);

    claims.aud.clear();
    if (auto it = j.find("aud"); it != j.end() && !it->is_null()) {
        if (it->is_string()) {
            claims.aud.push_back(it->get<std::string>());
        } else {
            claims.aud = it->get<std::vector<std::string>>();
        }
    }
}

std::int64_t currentTimestamp() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

ValidationResult validateExpiration(const RegisteredClaims& claims, std::int64_t now,
                                    std::int64_t clockSkewSeconds) {
    if (!claims.exp) {
        return ValidationResult::success();
    }

    if (now > saturatingAdd(*claims.exp, clockSkewSeconds)) {
        log::debug("JWT has expired (exp: {}, now: {})", *claims.exp, now);
        return ValidationResult::failure(ErrorKind::Expired, "Token has expired");
    }

    return ValidationResult::success();
}

ValidationResult validateNotBefore(const RegisteredClaims& claims, std::int64_t now,
                                   std::int64_t clockSkewSeconds) {
    if (!claims.nbf) {
        return ValidationResult::success();
    }

    if (now < saturatingSub(*claims.nbf, clockSkewSeconds)) {
        log::debug("JWT is not yet valid (nbf: {}, now: {})", *claims.nbf, now);
        return ValidationResult::failure(ErrorKind::Early, "Token is not valid yet");
    }

    return ValidationResult::success();
}

ValidationResult validateIssuer(const RegisteredClaims& claims, const std::string& issuer) {
    if (!claims.iss || *claims.iss != issuer) {
        log::debug("Issuer mismatch: expected '{}', got '{}'", issuer,
                   claims.iss.value_or("<none>"));
        return ValidationResult::failure(ErrorKind::Payload, "Unexpected issuer");
    }
    return ValidationResult::success();
}

ValidationResult validateAudience(const RegisteredClaims& claims, const std::string& audience) {
    if (std::find(claims.aud.begin(), claims.aud.end(), audience) == claims.aud.end()) {
        log::debug("Audience '{}' not present in token", audience);
        return ValidationResult::failure(ErrorKind::Payload, "Unexpected audience");
    }
    return ValidationResult::success();
}

ValidationResult validate(const RegisteredClaims& claims, const ValidationOptions& opts,
                          std::int64_t now) {
    if (opts.requireExpiration && !claims.exp) {
        return ValidationResult::failure(ErrorKind::Payload, "Missing expiration");
    }

    if (opts.checkNotBefore) {
        auto nbfResult = validateNotBefore(claims, now, opts.clockSkewSeconds);
        if (!nbfResult.valid) {
            return nbfResult;
        }
    }

    if (opts.checkExpiration) {
        auto expResult = validateExpiration(claims, now, opts.clockSkewSeconds);
        if (!expResult.valid) {
            return expResult;
        }
    }

    if (opts.issuer) {
        auto issResult = validateIssuer(claims, *opts.issuer);
        if (!issResult.valid) {
            return issResult;
        }
    }

    if (opts.audience) {
        auto audResult = validateAudience(claims, *opts.audience);
        if (!audResult.valid) {
            return audResult;
        }
    }

    return ValidationResult::success();
}

ValidationResult validate(const RegisteredClaims& claims, const ValidationOptions& opts) {
    return validate(claims, opts, currentTimestamp());
}

ValidationResult validate(const json& payload, const ValidationOptions& opts) {
    RegisteredClaims claims;
    try {
        claims = payload.get<RegisteredClaims>();
    } catch (const json::exception& e) {
        log::debug("Registered claims have the wrong type: {}", e.what());
        return ValidationResult::failure(ErrorKind::Payload, "Malformed registered claims");
    }
    return validate(claims, opts);
}

}
