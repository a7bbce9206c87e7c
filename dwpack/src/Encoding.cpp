// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "dwpack/Encoding.hpp"

namespace dwpack {

std::string_view layout_name(StrOffsetsLayout layout) noexcept {
  switch (layout.get_kind()) {
  case StrOffsetsLayout::Kind::gnu32: return "gnu32";
  case StrOffsetsLayout::Kind::gnu64: return "gnu64";
  case StrOffsetsLayout::Kind::std32: return "std32";
  case StrOffsetsLayout::Kind::std64: return "std64";
  }
  return "<invalid>";
}

std::string_view endian_name(Endian endian) noexcept {
  return endian == Endian::little ? "little" : "big";
}

} // end namespace dwpack
