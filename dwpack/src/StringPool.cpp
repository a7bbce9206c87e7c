// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "dwpack/StringPool.hpp"

namespace dwpack {

StringOffset StringPool::get_or_insert(std::string_view str) noexcept {
  if (str.find('\0') != std::string_view::npos) [[unlikely]] {
    DWPACK_FATAL("string inserted into pool contains a NUL byte");
  }

  auto [it, inserted] = ids.try_emplace(
      llvm::StringRef{str.data(), str.size()}, StringId{offsets.size()});
  if (!inserted) {
    return offsets[it->second.idx];
  }

  StringOffset off{data.size()};
  offsets.push_back(off);

  data.insert(data.end(), str.begin(), str.end());
  data.push_back(0);
  return off;
}

} // end namespace dwpack
