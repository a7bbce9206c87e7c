// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "dwpack/StrOffsets.hpp"
#include "dwpack/Error.hpp"

#include <limits>

#include <llvm/Support/ConvertUTF.h>

namespace dwpack {

llvm::Expected<llvm::StringRef>
    LocalStrSection::get_str(u64 offset) const noexcept {
  if (offset >= data.size()) {
    return llvm::make_error<StringDecodeError>(
        offset, StringDecodeError::Reason::out_of_range);
  }

  size_t end = data.find('\0', offset);
  if (end == llvm::StringRef::npos) {
    return llvm::make_error<StringDecodeError>(
        offset, StringDecodeError::Reason::unterminated);
  }

  llvm::StringRef str = data.slice(offset, end);
  const auto *src = reinterpret_cast<const llvm::UTF8 *>(str.begin());
  const auto *src_end = reinterpret_cast<const llvm::UTF8 *>(str.end());
  if (!llvm::isLegalUTF8String(&src, src_end)) {
    return llvm::make_error<StringDecodeError>(
        offset, StringDecodeError::Reason::invalid_utf8);
  }
  return str;
}

llvm::Expected<u64>
    LocalStrOffsetsSection::get_str_offset(StrOffsetsLayout layout,
                                           u64 index) const noexcept {
  const u64 base = layout.header_size();
  const u64 entry_size = layout.offset_size();
  const u64 data_size = data.size();
  const u64 entry_count = data_size > base ? (data_size - base) / entry_size : 0;
  if (index >= entry_count) {
    return llvm::make_error<OffsetIndexError>(index);
  }

  u64 off = base + index * entry_size;
  return data.getUnsigned(&off, entry_size);
}

llvm::Error write_str_offsets_header(util::ByteWriter &writer,
                                     StrOffsetsLayout layout,
                                     u64 section_size) noexcept {
  if (!layout.has_header()) {
    return llvm::Error::success();
  }

  const u64 header_size = layout.header_size();
  if (section_size < header_size) {
    return llvm::make_error<SectionSizeError>(
        section_size, SectionSizeError::Reason::smaller_than_header);
  }

  // The unit length covers everything after the unit length field itself;
  // for .debug_str_offsets.dwo that is the section size without the header.
  const u64 unit_length = section_size - header_size;
  if (layout.is_dwarf64()) {
    writer.write<u32>(dwarf::DWARF64_UNIT_LENGTH_ESCAPE);
    writer.write<u64>(unit_length);
  } else {
    if (unit_length > std::numeric_limits<u32>::max()) {
      return llvm::make_error<FieldOverflowError>("unit length", unit_length, 4);
    }
    writer.write<u32>(static_cast<u32>(unit_length));
  }
  writer.write<u16>(dwarf::STR_OFFSETS_VERSION);
  // padding
  writer.write<u16>(0);
  return llvm::Error::success();
}

llvm::Error write_str_offset(util::ByteWriter &writer,
                             StrOffsetsLayout layout,
                             StringOffset offset) noexcept {
  if (layout.is_dwarf64()) {
    writer.write<u64>(offset.off);
    return llvm::Error::success();
  }

  if (offset.off > std::numeric_limits<u32>::max()) {
    return llvm::make_error<FieldOverflowError>("string offset", offset.off, 4);
  }
  writer.write<u32>(static_cast<u32>(offset.off));
  return llvm::Error::success();
}

llvm::Expected<std::vector<u8>>
    StrOffsetsRebuilder::remap(const LocalStrSection &debug_str,
                               const LocalStrOffsetsSection &debug_str_offsets,
                               u64 section_size,
                               StrOffsetsLayout layout,
                               Endian endian) noexcept {
  std::vector<u8> data;
  util::ByteWriter writer{data, endian};

  if (auto err = write_str_offsets_header(writer, layout, section_size)) {
    return std::move(err);
  }

  // write_str_offsets_header rejects sections smaller than the header.
  const u64 base_offset = layout.header_size();
  const u64 entry_size = layout.offset_size();
  const u64 num_entries = (section_size - base_offset) / entry_size;
  DWPACK_LOG_DBG("remapping .debug_str_offsets: layout={} section_size={:#x} "
                 "base_offset={:#x} num_entries={}",
                 layout_name(layout),
                 section_size,
                 base_offset,
                 num_entries);

  for (u64 i = 0; i < num_entries; ++i) {
    auto local_off = debug_str_offsets.get_str_offset(layout, i);
    if (!local_off) {
      return local_off.takeError();
    }

    auto str = debug_str.get_str(*local_off);
    if (!str) {
      return str.takeError();
    }

    StringOffset pool_off = pool.get_or_insert({str->data(), str->size()});
    DWPACK_LOG_TRACE("  [{}] {:#x} -> {:#x} \"{}\"",
                     i,
                     *local_off,
                     pool_off.off,
                     std::string_view{str->data(), str->size()});

    if (auto err = write_str_offset(writer, layout, pool_off)) {
      return std::move(err);
    }
  }

  return data;
}

} // end namespace dwpack
