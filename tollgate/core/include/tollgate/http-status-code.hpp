#pragma once

#include <cstdint>

namespace tollgate::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;

inline constexpr StatusCode StatusCodeNotFound = 404;

inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeServiceUnavailable = 503;

}  // namespace tollgate::http
