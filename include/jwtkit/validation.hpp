#pragma once

#include "jwtkit/error.hpp"
#include "jwtkit/json.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace jwtkit {

/**
 * Registered claims of RFC 7519 section 4.1.
 * Readable from any payload: unknown members are ignored and "aud" may be
 * a single string or a list.
 */
struct RegisteredClaims {
    std::optional<std::string> iss;
    std::optional<std::string> sub;
    std::vector<std::string> aud;
    std::optional<std::int64_t> exp;
    std::optional<std::int64_t> nbf;
    std::optional<std::int64_t> iat;
    std::optional<std::string> jti;

    friend bool operator==(const RegisteredClaims&, const RegisteredClaims&) = default;
};

void to_json(json& j, const RegisteredClaims& claims);
void from_json(const json& j, RegisteredClaims& claims);

/**
 * Validation result indicating success or failure with the error to report
 */
struct ValidationResult {
    bool valid;
    std::optional<Error> error;

    explicit operator bool() const { return valid; }

    /// Throw the recorded error if validation failed
    void throwIfInvalid() const {
        if (!valid && error) {
            throw *error;
        }
    }

    static ValidationResult success() {
        return ValidationResult{true, std::nullopt};
    }

    static ValidationResult failure(ErrorKind kind, const std::string& msg) {
        return ValidationResult{false, Error(kind, msg)};
    }
};

/**
 * Options for configuring claim validation
 */
struct ValidationOptions {
    // Time-based validation
    bool checkExpiration = true;        // Reject tokens past "exp"
    bool checkNotBefore = true;         // Reject tokens before "nbf"
    bool requireExpiration = false;     // Reject tokens without "exp"
    std::int64_t clockSkewSeconds = 0;  // Allow clock skew tolerance

    // Identity validation
    std::optional<std::string> issuer;    // Expected "iss"
    std::optional<std::string> audience;  // Must appear in "aud"

    static ValidationOptions strict() {
        ValidationOptions opts;
        opts.checkExpiration = true;
        opts.checkNotBefore = true;
        opts.requireExpiration = true;
        opts.clockSkewSeconds = 0;
        return opts;
    }

    static ValidationOptions permissive() {
        ValidationOptions opts;
        opts.checkExpiration = false;
        opts.checkNotBefore = false;
        opts.requireExpiration = false;
        opts.clockSkewSeconds = 300;  // 5 minutes
        return opts;
    }
};

/// Current Unix time in seconds
[[nodiscard]] std::int64_t currentTimestamp();

/**
 * Check "exp" against now
 * @return failure (Expired) once now is past exp + clockSkewSeconds
 */
ValidationResult validateExpiration(const RegisteredClaims& claims, std::int64_t now,
                                    std::int64_t clockSkewSeconds = 0);

/**
 * Check "nbf" against now
 * @return failure (Early) while now is before nbf - clockSkewSeconds
 */
ValidationResult validateNotBefore(const RegisteredClaims& claims, std::int64_t now,
                                   std::int64_t clockSkewSeconds = 0);

/// Check "iss" equals the expected issuer; failure kind is Payload
ValidationResult validateIssuer(const RegisteredClaims& claims, const std::string& issuer);

/// Check the expected audience is listed in "aud"; failure kind is Payload
ValidationResult validateAudience(const RegisteredClaims& claims, const std::string& audience);

/**
 * Run every check enabled in opts, stopping at the first failure
 * @param now Unix time to validate against
 */
ValidationResult validate(const RegisteredClaims& claims, const ValidationOptions& opts,
                          std::int64_t now);

/// Same as above, validating against the current time
ValidationResult validate(const RegisteredClaims& claims,
                          const ValidationOptions& opts = ValidationOptions{});

/// Read the registered claims of a decoded payload and validate them
ValidationResult validate(const json& payload,
                          const ValidationOptions& opts = ValidationOptions{});

}
