#pragma once

// All tollgate logging goes through spdlog, header-only. SPDLOG_HEADER_ONLY is defined here only, never as a
// public compile definition of the tollgate targets.
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace tollgate {

namespace log = spdlog;

}  // namespace tollgate
