// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "dwpack-llvm/DwoObject.hpp"

#include <llvm/BinaryFormat/Dwarf.h>
#include <llvm/DebugInfo/DWARF/DWARFContext.h>
#include <llvm/DebugInfo/DWARF/DWARFUnit.h>
#include <llvm/Object/Decompressor.h>
#include <llvm/Object/ObjectFile.h>

namespace dwpack_llvm {

namespace {

constexpr llvm::StringLiteral DEBUG_STR_DWO = ".debug_str.dwo";
constexpr llvm::StringLiteral DEBUG_STR_OFFSETS_DWO = ".debug_str_offsets.dwo";

/// Matches \p sec_name against a .debug_* name, also accepting the GNU
/// .zdebug_* spelling of compressed sections.
bool is_section(llvm::StringRef sec_name, llvm::StringRef debug_name) {
  if (sec_name == debug_name) {
    return true;
  }
  return sec_name.consume_front(".z") && debug_name.consume_front(".") &&
         sec_name == debug_name;
}

llvm::Expected<llvm::StringRef>
    section_contents(const llvm::object::ObjectFile &obj,
                     const llvm::object::SectionRef &sec,
                     llvm::StringRef sec_name,
                     UncompressedSections &uncompressed) {
  auto contents = sec.getContents();
  if (!contents) {
    return contents.takeError();
  }
  if (!llvm::object::Decompressor::isCompressed(sec)) {
    return *contents;
  }

  const bool is_64bit = obj.getBytesInAddress() == 8;
  auto decompressor = llvm::object::Decompressor::create(
      sec_name, *contents, obj.isLittleEndian(), is_64bit);
  if (!decompressor) {
    return decompressor.takeError();
  }
  llvm::SmallString<32> &buf = uncompressed.emplace_back();
  if (auto err = decompressor->resizeAndDecompress(buf)) {
    return std::move(err);
  }
  DWPACK_LOG_DBG("decompressed {}: {:#x} -> {:#x} bytes",
                 sec_name.str(),
                 contents->size(),
                 buf.size());
  return buf.str();
}

llvm::Expected<dwpack::Encoding>
    read_encoding(const llvm::object::ObjectFile &obj) {
  // Relocations are not applied to split DWARF objects.
  auto ctx = llvm::DWARFContext::create(
      obj, llvm::DWARFContext::ProcessDebugRelocations::Ignore);
  for (const auto &unit : ctx->dwo_info_section_units()) {
    dwpack::Encoding enc;
    enc.format = unit->getFormat() == llvm::dwarf::DWARF64
                     ? dwpack::DwarfFormat::dwarf64
                     : dwpack::DwarfFormat::dwarf32;
    enc.version = unit->getVersion();
    return enc;
  }
  return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                 "no units in .debug_info.dwo");
}

} // namespace

llvm::Expected<dwpack::DwoStrSections>
    load_dwo_str_sections(const llvm::object::ObjectFile &obj,
                          llvm::StringRef name,
                          UncompressedSections &uncompressed) noexcept {
  dwpack::DwoStrSections res;
  res.name = name.str();
  res.endian =
      obj.isLittleEndian() ? dwpack::Endian::little : dwpack::Endian::big;

  for (const llvm::object::SectionRef &sec : obj.sections()) {
    auto sec_name = sec.getName();
    if (!sec_name) {
      return llvm::createFileError(name, sec_name.takeError());
    }
    const bool is_str = is_section(*sec_name, DEBUG_STR_DWO);
    if (!is_str && !is_section(*sec_name, DEBUG_STR_OFFSETS_DWO)) {
      continue;
    }

    auto contents = section_contents(obj, sec, *sec_name, uncompressed);
    if (!contents) {
      return llvm::createFileError(name, contents.takeError());
    }
    if (is_str) {
      res.debug_str = *contents;
    } else {
      res.debug_str_offsets = *contents;
      res.str_offsets_size = contents->size();
    }
  }

  if (!res.debug_str_offsets) {
    return res;
  }

  auto enc = read_encoding(obj);
  if (!enc) {
    return llvm::createFileError(name, enc.takeError());
  }
  res.encoding = *enc;
  return res;
}

} // namespace dwpack_llvm
