#pragma once
#include <cstddef>

namespace jwtkit {

// JWT header type
inline constexpr const char* JWT_TYPE = "JWT";

// RSASSA-PKCS1-v1_5 using SHA-256
inline constexpr const char* ALG_RS256 = "RS256";

// Unsecured JWS (RFC 7515 appendix A.5), never accepted for verification
inline constexpr const char* ALG_NONE = "none";

// JWK key type for RSA keys
inline constexpr const char* KTY_RSA = "RSA";

// Maximum JWT size for parsing (10MB)
inline constexpr std::size_t MAX_JWT_SIZE = 10 * 1024 * 1024;

} // namespace jwtkit
