// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
#pragma once

#include "dwpack/base.hpp"

#include <string_view>

namespace dwpack {

enum class Endian : u8 {
  little,
  big,
};

enum class DwarfFormat : u8 {
  dwarf32,
  dwarf64,
};

/// Encoding of the units in a split DWARF object, as read from its unit
/// headers.
struct Encoding {
  DwarfFormat format = DwarfFormat::dwarf32;
  u16 version = 5;

  /// DWARF 5 standardized the package format; earlier versions use the GNU
  /// split DWARF extension, which has no section headers.
  constexpr bool is_std_package_format() const noexcept {
    return version >= 5;
  }
};

/// Shape of a .debug_str_offsets section: entry width and header together.
class StrOffsetsLayout {
public:
  enum class Kind : u8 {
    gnu32,
    gnu64,
    std32,
    std64,
  };

private:
  Kind kind;

  constexpr explicit StrOffsetsLayout(Kind kind) noexcept : kind(kind) {}

public:
  static constexpr StrOffsetsLayout gnu32() noexcept {
    return StrOffsetsLayout{Kind::gnu32};
  }
  static constexpr StrOffsetsLayout gnu64() noexcept {
    return StrOffsetsLayout{Kind::gnu64};
  }
  static constexpr StrOffsetsLayout std32() noexcept {
    return StrOffsetsLayout{Kind::std32};
  }
  static constexpr StrOffsetsLayout std64() noexcept {
    return StrOffsetsLayout{Kind::std64};
  }

  static constexpr StrOffsetsLayout get(DwarfFormat format,
                                        bool with_header) noexcept {
    if (format == DwarfFormat::dwarf32) {
      return with_header ? std32() : gnu32();
    }
    return with_header ? std64() : gnu64();
  }

  static constexpr StrOffsetsLayout for_encoding(Encoding enc) noexcept {
    return get(enc.format, enc.is_std_package_format());
  }

  constexpr Kind get_kind() const noexcept { return kind; }

  constexpr DwarfFormat format() const noexcept {
    return (kind == Kind::gnu32 || kind == Kind::std32) ? DwarfFormat::dwarf32
                                                        : DwarfFormat::dwarf64;
  }

  constexpr bool is_dwarf64() const noexcept {
    return format() == DwarfFormat::dwarf64;
  }

  constexpr bool has_header() const noexcept {
    return kind == Kind::std32 || kind == Kind::std64;
  }

  /// Size of a section offset, i.e. of one entry.
  constexpr u32 offset_size() const noexcept { return is_dwarf64() ? 8 : 4; }

  /// Size of the header: unit length (4, or 4 + 8 for DWARF64), version (2)
  /// and padding (2). Entries start right after the header, so this is also
  /// the base offset of entry 0.
  constexpr u32 header_size() const noexcept {
    if (!has_header()) {
      return 0;
    }
    return is_dwarf64() ? 16 : 8;
  }

  constexpr bool operator==(const StrOffsetsLayout &) const noexcept = default;
};

std::string_view layout_name(StrOffsetsLayout layout) noexcept;
std::string_view endian_name(Endian endian) noexcept;

namespace dwarf {
/// Version written into rebuilt .debug_str_offsets headers.
constexpr u16 STR_OFFSETS_VERSION = 5;
/// Unit length escape announcing a 64-bit unit length.
constexpr u32 DWARF64_UNIT_LENGTH_ESCAPE = 0xffff'ffff;
} // namespace dwarf

} // namespace dwpack
