#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace jwtkit {

/// Type of error encountered
enum class ErrorKind {
    Invalid,      ///< Token or key is malformed
    Expired,      ///< Token has expired (exp)
    Early,        ///< Token is not valid yet (nbf)
    Certificate,  ///< Signature does not verify against the key
    Key,          ///< No usable key for the token
    Connection,   ///< Key set could not be fetched
    Header,       ///< Header is well formed but not acceptable
    Payload,      ///< Payload is well formed but not acceptable
    Signature,    ///< Signature segment is malformed
    Internal      ///< Failure inside the crypto backend
};

/// Name of an error kind ("Invalid", "Certificate", ...)
[[nodiscard]] std::string_view toString(ErrorKind kind);

/**
 * Error thrown by every jwtkit operation.
 *
 * The message is short and meant for logs, not for end users.
 * what() renders "<Kind>: <message>".
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, std::string message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    friend bool operator==(const Error& lhs, const Error& rhs) {
        return lhs.kind_ == rhs.kind_ && lhs.message_ == rhs.message_;
    }

private:
    ErrorKind kind_;
    std::string message_;
};

} // namespace jwtkit
