// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
#pragma once

#include <vector>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/DataExtractor.h>
#include <llvm/Support/Error.h>

#include "dwpack/Encoding.hpp"
#include "dwpack/StringPool.hpp"
#include "dwpack/base.hpp"
#include "dwpack/util/ByteWriter.hpp"

namespace dwpack {

/// Read-only view of the .debug_str section of an input object.
class LocalStrSection {
  llvm::StringRef data;

public:
  explicit LocalStrSection(llvm::StringRef data) noexcept : data(data) {}

  /// Get the NUL-terminated string starting at offset, without its
  /// terminator.
  llvm::Expected<llvm::StringRef> get_str(u64 offset) const noexcept;
};

/// Read-only view of the .debug_str_offsets section of an input object.
class LocalStrOffsetsSection {
  llvm::DataExtractor data;

public:
  LocalStrOffsetsSection(llvm::StringRef data, Endian endian) noexcept
      : data(data, endian == Endian::little, /*AddressSize=*/8) {}

  /// Get entry index, counted from the first entry after the header.
  llvm::Expected<u64> get_str_offset(StrOffsetsLayout layout,
                                     u64 index) const noexcept;
};

/// Write the header of a .debug_str_offsets section whose total size,
/// including the header, is section_size. Nothing is written for layouts
/// without header.
llvm::Error write_str_offsets_header(util::ByteWriter &writer,
                                     StrOffsetsLayout layout,
                                     u64 section_size) noexcept;

/// Write a single entry of a .debug_str_offsets section.
llvm::Error write_str_offset(util::ByteWriter &writer,
                             StrOffsetsLayout layout,
                             StringOffset offset) noexcept;

/// Rebuilds .debug_str_offsets sections of input objects so that they point
/// into a shared StringPool.
class StrOffsetsRebuilder {
  StringPool &pool;

public:
  explicit StrOffsetsRebuilder(StringPool &pool) noexcept : pool(pool) {}

  /// Insert all strings referenced by debug_str_offsets into the pool and
  /// return an equivalent .debug_str_offsets section pointing into the pool.
  /// Entry i of the result refers to the same string as entry i of the
  /// input. On error, strings inserted so far remain in the pool.
  llvm::Expected<std::vector<u8>>
      remap(const LocalStrSection &debug_str,
            const LocalStrOffsetsSection &debug_str_offsets,
            u64 section_size,
            StrOffsetsLayout layout,
            Endian endian) noexcept;
};

} // namespace dwpack
