// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "dwpack/base.hpp"

#include <cstdlib>

namespace dwpack {

[[noreturn]] void fatal_error([[maybe_unused]] const char *msg) noexcept {
  DWPACK_LOG_ERR("DWPACK FATAL ERROR: {}", msg);
  abort();
}

void set_log_level([[maybe_unused]] unsigned level) noexcept {
#ifdef DWPACK_LOGGING
  spdlog::level::level_enum spd_level = spdlog::level::off;
  switch (level) {
  case 0: spd_level = spdlog::level::off; break;
  case 1: spd_level = spdlog::level::err; break;
  case 2: spd_level = spdlog::level::warn; break;
  case 3: spd_level = spdlog::level::info; break;
  case 4: spd_level = spdlog::level::debug; break;
  default: spd_level = spdlog::level::trace; break;
  }
  spdlog::set_level(spd_level);
#endif
}

} // end namespace dwpack
