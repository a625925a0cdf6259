#pragma once

#include <nlohmann/json.hpp>

namespace jwtkit {

/// JSON value used for headers, payloads and keys.
/// Insertion order is kept, so a payload serializes in the order its
/// to_json() writes the members.
using json = nlohmann::ordered_json;

} // namespace jwtkit
