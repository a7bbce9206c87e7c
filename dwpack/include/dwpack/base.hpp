// SPDX-FileCopyrightText: 2025 Contributors to dwpack
//
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#pragma once
#include <cstdint>

#ifdef DWPACK_ASSERTS
  // make sure this always works even if NDEBUG is set
  #ifdef NDEBUG
    #undef NDEBUG
    #include <cassert>
    #define NDEBUG
  #else
    #include <cassert>
  #endif
#else
  #include <cassert>
#endif

#ifdef DWPACK_LOGGING
  #include <spdlog/spdlog.h>
  #define DWPACK_LOG(level, ...)                                               \
    (spdlog::should_log(level) ? spdlog::log(level, __VA_ARGS__) : (void)0)
  #ifndef NDEBUG
    #define DWPACK_LOG_TRACE(...) DWPACK_LOG(spdlog::level::trace, __VA_ARGS__)
    #define DWPACK_LOG_DBG(...) DWPACK_LOG(spdlog::level::debug, __VA_ARGS__)
  #else
    #define DWPACK_LOG_TRACE(...)
    #define DWPACK_LOG_DBG(...)
  #endif
  #define DWPACK_LOG_INFO(...) DWPACK_LOG(spdlog::level::info, __VA_ARGS__)
  #define DWPACK_LOG_WARN(...) DWPACK_LOG(spdlog::level::warn, __VA_ARGS__)
  #define DWPACK_LOG_ERR(...) DWPACK_LOG(spdlog::level::err, __VA_ARGS__)
#else
  #define DWPACK_LOG_TRACE(...)
  #define DWPACK_LOG_DBG(...)
  #define DWPACK_LOG_INFO(...)
  #define DWPACK_LOG_WARN(...)
  #define DWPACK_LOG_ERR(...)
#endif

#define DWPACK_FATAL(msg) ::dwpack::fatal_error(msg)

namespace dwpack {
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

/// Abort program with a fatal error
[[noreturn]] void fatal_error(const char *msg) noexcept;

/// Set the global log level from the numeric command line value:
/// 0=NONE, 1=ERR, 2=WARN, 3=INFO, 4=DEBUG, >=5=TRACE. No-op without logging.
void set_log_level(unsigned level) noexcept;

} // namespace dwpack
