#include "jwtkit/error.hpp"

#include <utility>

namespace jwtkit {

std::string_view toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Invalid: return "Invalid";
        case ErrorKind::Expired: return "Expired";
        case ErrorKind::Early: return "Early";
        case ErrorKind::Certificate: return "Certificate";
        case ErrorKind::Key: return "Key";
        case ErrorKind::Connection: return "Connection";
        case ErrorKind::Header: return "Header";
        case ErrorKind::Payload: return "Payload";
        case ErrorKind::Signature: return "Signature";
        case ErrorKind::Internal: return "Internal";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, std::string message)
    : std::runtime_error(std::string(toString(kind)) + ": " + message),
      kind_(kind),
      message_(std::move(message)) {}

}
