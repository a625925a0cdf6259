#include "base64url.hpp"
#include "jwtkit/error.hpp"
#include <array>

namespace jwtkit {
namespace internal {

namespace {
    constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    constexpr std::uint8_t INVALID = 0xFF;

    // Maps ASCII value to 6-bit value. Padding is not part of the alphabet.
    constexpr std::array<std::uint8_t, 256> createDecodeLookup() {
        std::array<std::uint8_t, 256> lookup{};
        for (auto& val : lookup) val = INVALID;

        for (std::uint8_t i = 0; i < 64; ++i) {
            lookup[static_cast<std::uint8_t>(alphabet[i])] = i;
        }
        return lookup;
    }

    constexpr auto decode_lookup = createDecodeLookup();

    std::uint32_t sextet(char c) {
        std::uint8_t value = decode_lookup[static_cast<std::uint8_t>(c)];
        if (value == INVALID) {
            throw Error(ErrorKind::Invalid, "Invalid Base64 URL character");
        }
        return value;
    }

    template <typename Out>
    void decodeInto(std::string_view input, Out& result) {
        if (input.size() % 4 == 1) {
            throw Error(ErrorKind::Invalid, "Invalid Base64 URL length");
        }
        result.reserve((input.size() * 3) / 4);

        size_t i = 0;
        while (i + 3 < input.size()) {
            std::uint32_t quad = (sextet(input[i]) << 18) |
                                 (sextet(input[i + 1]) << 12) |
                                 (sextet(input[i + 2]) << 6) |
                                  sextet(input[i + 3]);

            result.push_back(static_cast<typename Out::value_type>((quad >> 16) & 0xFF));
            result.push_back(static_cast<typename Out::value_type>((quad >> 8) & 0xFF));
            result.push_back(static_cast<typename Out::value_type>(quad & 0xFF));
            i += 4;
        }

        // 2 chars -> 1 byte, 3 chars -> 2 bytes. The bits of the last char
        // past the final byte must be zero, so each byte string has one encoding.
        size_t remaining = input.size() - i;
        if (remaining >= 2) {
            std::uint32_t last = sextet(input[i + remaining - 1]);
            if ((remaining == 2 && (last & 0x0F) != 0) ||
                (remaining == 3 && (last & 0x03) != 0)) {
                throw Error(ErrorKind::Invalid, "Non-canonical Base64 URL encoding");
            }

            std::uint32_t partial = (sextet(input[i]) << 18) | (sextet(input[i + 1]) << 12);
            if (remaining == 3) {
                partial |= sextet(input[i + 2]) << 6;
            }
            result.push_back(static_cast<typename Out::value_type>((partial >> 16) & 0xFF));
            if (remaining == 3) {
                result.push_back(static_cast<typename Out::value_type>((partial >> 8) & 0xFF));
            }
        }
    }
}

std::string base64url_encode(std::span<const std::uint8_t> data) {
    std::string result;
    result.reserve((data.size() * 4 + 2) / 3);

    size_t i = 0;
    while (i + 2 < data.size()) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                                (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                 static_cast<std::uint32_t>(data[i + 2]);

        result.push_back(alphabet[(triple >> 18) & 0x3F]);
        result.push_back(alphabet[(triple >> 12) & 0x3F]);
        result.push_back(alphabet[(triple >> 6) & 0x3F]);
        result.push_back(alphabet[triple & 0x3F]);

        i += 3;
    }

    // 1 trailing byte -> 2 chars, 2 trailing bytes -> 3 chars
    if (i < data.size()) {
        std::uint32_t remaining = static_cast<std::uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) {
            remaining |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        }
        result.push_back(alphabet[(remaining >> 18) & 0x3F]);
        result.push_back(alphabet[(remaining >> 12) & 0x3F]);
        if (i + 1 < data.size()) {
            result.push_back(alphabet[(remaining >> 6) & 0x3F]);
        }
    }

    return result;
}

std::string base64url_encode(std::string_view text) {
    return base64url_encode(as_bytes(text));
}

std::vector<std::uint8_t> base64url_decode(std::string_view input) {
    std::vector<std::uint8_t> result;
    decodeInto(input, result);
    return result;
}

std::string base64url_decode_string(std::string_view input) {
    std::string result;
    decodeInto(input, result);
    return result;
}

} // namespace internal
} // namespace jwtkit
