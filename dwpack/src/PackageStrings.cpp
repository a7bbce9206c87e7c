// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "dwpack/PackageStrings.hpp"
#include "dwpack/Error.hpp"
#include "dwpack/StrOffsets.hpp"

namespace dwpack {

namespace {

llvm::Error check_section_size(u64 section_size, StrOffsetsLayout layout) {
  const u64 header_size = layout.header_size();
  if (section_size < header_size) {
    return llvm::make_error<SectionSizeError>(
        section_size, SectionSizeError::Reason::smaller_than_header);
  }
  if ((section_size - header_size) % layout.offset_size() != 0) {
    return llvm::make_error<SectionSizeError>(
        section_size, SectionSizeError::Reason::partial_entry);
  }
  return llvm::Error::success();
}

} // namespace

llvm::Expected<Contribution>
    PackageStrings::add_object(const DwoStrSections &obj) noexcept {
  if (!obj.debug_str_offsets) {
    DWPACK_LOG_DBG("{}: no .debug_str_offsets.dwo, skipping", obj.name);
    Contribution contrib{debug_str_offsets.size(), 0};
    contributions.push_back(contrib);
    return contrib;
  }

  if (obj.endian != endian) {
    return llvm::createFileError(
        obj.name,
        llvm::createStringError(llvm::inconvertibleErrorCode(),
                                "object is %s-endian, package is %s-endian",
                                endian_name(obj.endian).data(),
                                endian_name(endian).data()));
  }

  const StrOffsetsLayout layout = StrOffsetsLayout::for_encoding(obj.encoding);
  const u64 section_size = obj.str_offsets_size;
  if (auto err = check_section_size(section_size, layout)) {
    return llvm::createFileError(obj.name, std::move(err));
  }

  DWPACK_LOG_DBG("{}: DWARF v{} {}, .debug_str size={:#x}",
                 obj.name,
                 obj.encoding.version,
                 layout_name(layout),
                 obj.debug_str.size());

  StrOffsetsRebuilder rebuilder{pool};
  auto rebuilt = rebuilder.remap(LocalStrSection{obj.debug_str},
                                 LocalStrOffsetsSection{*obj.debug_str_offsets,
                                                        obj.endian},
                                 section_size,
                                 layout,
                                 endian);
  if (!rebuilt) {
    return llvm::createFileError(obj.name, rebuilt.takeError());
  }

  Contribution contrib{debug_str_offsets.size(), rebuilt->size()};
  debug_str_offsets.insert(
      debug_str_offsets.end(), rebuilt->begin(), rebuilt->end());
  contributions.push_back(contrib);
  return contrib;
}

PackageStrSections PackageStrings::finish() && noexcept {
  DWPACK_LOG_INFO("merged {} distinct strings into .debug_str ({:#x} bytes), "
                  ".debug_str_offsets is {:#x} bytes",
                  pool.string_count(),
                  pool.size(),
                  debug_str_offsets.size());
  return PackageStrSections{
      .debug_str = std::move(pool).finish(),
      .debug_str_offsets = std::move(debug_str_offsets),
      .contributions = std::move(contributions),
  };
}

} // end namespace dwpack
