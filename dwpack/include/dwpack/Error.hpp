// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
#pragma once

#include "dwpack/base.hpp"

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

namespace dwpack {

/// No entry at the given index of a local .debug_str_offsets section.
class OffsetIndexError : public llvm::ErrorInfo<OffsetIndexError> {
  u64 index;

public:
  static char ID;

  explicit OffsetIndexError(u64 index) noexcept : index(index) {}

  u64 get_index() const noexcept { return index; }

  void log(llvm::raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;
};

/// The offset read from .debug_str_offsets does not locate a valid string in
/// the local .debug_str section.
class StringDecodeError : public llvm::ErrorInfo<StringDecodeError> {
public:
  enum class Reason : u8 {
    out_of_range,
    unterminated,
    invalid_utf8,
  };

private:
  u64 offset;
  Reason reason;

public:
  static char ID;

  StringDecodeError(u64 offset, Reason reason) noexcept
      : offset(offset), reason(reason) {}

  u64 get_offset() const noexcept { return offset; }
  Reason get_reason() const noexcept { return reason; }

  void log(llvm::raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;
};

/// A size or offset does not fit into the field it is written to.
class FieldOverflowError : public llvm::ErrorInfo<FieldOverflowError> {
  const char *field;
  u64 value;
  u32 field_size;

public:
  static char ID;

  FieldOverflowError(const char *field, u64 value, u32 field_size) noexcept
      : field(field), value(value), field_size(field_size) {}

  u64 get_value() const noexcept { return value; }
  u32 get_field_size() const noexcept { return field_size; }

  void log(llvm::raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;
};

/// The declared size of a .debug_str_offsets section is inconsistent with
/// its layout.
class SectionSizeError : public llvm::ErrorInfo<SectionSizeError> {
public:
  enum class Reason : u8 {
    smaller_than_header,
    partial_entry,
  };

private:
  u64 section_size;
  Reason reason;

public:
  static char ID;

  SectionSizeError(u64 section_size, Reason reason) noexcept
      : section_size(section_size), reason(reason) {}

  u64 get_section_size() const noexcept { return section_size; }
  Reason get_reason() const noexcept { return reason; }

  void log(llvm::raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;
};

} // namespace dwpack
