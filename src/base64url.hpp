#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <cstdint>

namespace jwtkit {
namespace internal {

/// Encode bytes to Base64 URL format (RFC 4648 section 5, no padding)
/// @param data Input bytes to encode
/// @return Base64 URL encoded string without '=' padding
std::string base64url_encode(std::span<const std::uint8_t> data);

/// Encode the bytes of a string (JSON segments, signing input)
std::string base64url_encode(std::string_view text);

/// Decode unpadded Base64 URL text to bytes
/// @param input Base64 URL encoded string
/// @return Decoded bytes
/// @throws jwtkit::Error (Invalid) on a character outside the alphabet,
///         '=' included, or a length of 1 mod 4
std::vector<std::uint8_t> base64url_decode(std::string_view input);

/// Decode unpadded Base64 URL text into a string (JSON segments)
std::string base64url_decode_string(std::string_view input);

/// View a string's bytes as an unsigned byte span
inline std::span<const std::uint8_t> as_bytes(std::string_view text) {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

} // namespace internal
} // namespace jwtkit
