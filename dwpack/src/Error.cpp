// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "dwpack/Error.hpp"

#include <llvm/Support/Format.h>

namespace dwpack {

char OffsetIndexError::ID = 0;
char StringDecodeError::ID = 0;
char FieldOverflowError::ID = 0;
char SectionSizeError::ID = 0;

void OffsetIndexError::log(llvm::raw_ostream &os) const {
  os << "no string offset at index " << index << " in .debug_str_offsets";
}

std::error_code OffsetIndexError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

void StringDecodeError::log(llvm::raw_ostream &os) const {
  os << "no valid string at offset " << llvm::format_hex(offset, 1)
     << " in .debug_str: ";
  switch (reason) {
  case Reason::out_of_range: os << "offset out of range"; break;
  case Reason::unterminated: os << "missing terminator"; break;
  case Reason::invalid_utf8: os << "invalid UTF-8"; break;
  }
}

std::error_code StringDecodeError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

void FieldOverflowError::log(llvm::raw_ostream &os) const {
  os << field << ' ' << llvm::format_hex(value, 1) << " does not fit in "
     << field_size << " bytes";
}

std::error_code FieldOverflowError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

void SectionSizeError::log(llvm::raw_ostream &os) const {
  os << ".debug_str_offsets size " << llvm::format_hex(section_size, 1);
  switch (reason) {
  case Reason::smaller_than_header: os << " is smaller than its header"; break;
  case Reason::partial_entry: os << " is not a whole number of entries"; break;
  }
}

std::error_code SectionSizeError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}

} // end namespace dwpack
