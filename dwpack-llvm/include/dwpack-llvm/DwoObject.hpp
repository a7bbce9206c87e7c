// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
#pragma once

#include <deque>

#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include "dwpack/PackageStrings.hpp"

namespace llvm::object {
class ObjectFile;
} // namespace llvm::object

namespace dwpack_llvm {

/// Owns the decompressed contents of compressed sections. Elements are never
/// moved, so references into them stay valid while the container lives.
using UncompressedSections = std::deque<llvm::SmallString<32>>;

/// Collect the string sections and encoding of a split DWARF object. The
/// returned sections reference the object's data, or an element appended to
/// \p uncompressed for sections stored compressed (SHF_COMPRESSED or
/// .zdebug_*).
llvm::Expected<dwpack::DwoStrSections>
    load_dwo_str_sections(const llvm::object::ObjectFile &obj,
                          llvm::StringRef name,
                          UncompressedSections &uncompressed) noexcept;

} // namespace dwpack_llvm
