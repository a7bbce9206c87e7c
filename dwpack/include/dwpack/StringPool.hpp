// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
#pragma once

#include "dwpack/base.hpp"

#include <string_view>
#include <vector>

#include <llvm/ADT/StringMap.h>

namespace dwpack {

/// Index of a distinct string in insertion order.
struct StringId {
  u64 idx;

  bool operator==(const StringId &) const noexcept = default;
};

/// Offset of a string in the merged .debug_str section.
struct StringOffset {
  u64 off;

  bool operator==(const StringOffset &) const noexcept = default;
};

/// Accumulates the merged .debug_str section of a package. Strings are
/// deduplicated and never move once inserted, so every rebuilt
/// .debug_str_offsets section can refer to the same table.
class StringPool {
  std::vector<u8> data;
  llvm::StringMap<StringId> ids;
  /// Offset of each distinct string, indexed by StringId.
  std::vector<StringOffset> offsets;

public:
  StringPool() = default;

  StringPool(const StringPool &) = delete;
  StringPool(StringPool &&) = default;

  StringPool &operator=(const StringPool &) = delete;
  StringPool &operator=(StringPool &&) = default;

  /// Insert a string and return its offset. If the string is already in the
  /// pool, its existing offset is returned and the pool is unchanged.
  /// The string must not contain a NUL byte.
  StringOffset get_or_insert(std::string_view str) noexcept;

  /// Size of the accumulated section in bytes.
  u64 size() const noexcept { return data.size(); }
  /// Number of distinct strings.
  u64 string_count() const noexcept { return offsets.size(); }

  /// Take the accumulated .debug_str section. The pool must not be used
  /// afterwards.
  std::vector<u8> finish() && noexcept { return std::move(data); }
};

} // namespace dwpack
