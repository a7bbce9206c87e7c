// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
#pragma once

#include <optional>
#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include "dwpack/Encoding.hpp"
#include "dwpack/StringPool.hpp"
#include "dwpack/base.hpp"

namespace dwpack {

/// String sections of one split DWARF object. The referenced data must stay
/// alive until PackageStrings::add_object returns.
struct DwoStrSections {
  /// Name used in diagnostics, usually the path of the object.
  std::string name;
  llvm::StringRef debug_str;
  /// Not present for objects that do not use DW_FORM_strx.
  std::optional<llvm::StringRef> debug_str_offsets;
  /// Size of .debug_str_offsets as declared by the object's section header.
  u64 str_offsets_size = 0;
  Encoding encoding;
  Endian endian = Endian::little;
};

/// Slice of an object's rebuilt section in the concatenated package section.
struct Contribution {
  u64 offset = 0;
  u64 size = 0;

  bool operator==(const Contribution &) const noexcept = default;
};

/// Merged string sections of a package.
struct PackageStrSections {
  std::vector<u8> debug_str;
  std::vector<u8> debug_str_offsets;
  /// Contribution of each added object, in the order of add_object calls.
  std::vector<Contribution> contributions;
};

/// Merges the .debug_str sections of all objects of a package and rebuilds
/// and concatenates their .debug_str_offsets sections.
class PackageStrings {
  Endian endian;
  StringPool pool;
  std::vector<u8> debug_str_offsets;
  std::vector<Contribution> contributions;

public:
  explicit PackageStrings(Endian endian) noexcept : endian(endian) {}

  PackageStrings(const PackageStrings &) = delete;
  PackageStrings &operator=(const PackageStrings &) = delete;

  Endian get_endian() const noexcept { return endian; }
  const StringPool &get_pool() const noexcept { return pool; }

  /// Add the string sections of the next object. On error, the package
  /// .debug_str_offsets section is unchanged and the error names the object.
  llvm::Expected<Contribution> add_object(const DwoStrSections &obj) noexcept;

  PackageStrSections finish() && noexcept;
};

} // namespace dwpack
