#pragma once

// Main public API - include all headers
#include "jwtkit/jwt_constants.hpp"
#include "jwtkit/error.hpp"
#include "jwtkit/json.hpp"
#include "jwtkit/log.hpp"
#include "jwtkit/jwk.hpp"
#include "jwtkit/jwt.hpp"
#include "jwtkit/key_set.hpp"
#include "jwtkit/validation.hpp"

namespace jwtkit {}
