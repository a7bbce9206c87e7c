// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

// The string sections of split DWARF objects are described in a small text
// format so that package merging can be tested without a compiler.
//
// Quick description of the format:
// Comments are done using ; and run until the end of the line, so strings
// have to spell ; as \x3b
//
// clang-format off
// object <name> <dwarf32|dwarf64> <gnu|std> [little|big]
// ; Append NUL-terminated strings to .debug_str, \\, \" and \xNN are escapes
//     strtab "<str>" "<str>" ...
// ; Entries of .debug_str_offsets, @<n> is the offset of the n-th string
// ; Without an offsets line, the object has no .debug_str_offsets section
//     offsets <num|@n> <num|@n> ...
// ; Override the section size declared for .debug_str_offsets
//     size <num>
// end
//
// object <name> ...
// clang-format on
//
// gnu objects are DWARF 4 (no .debug_str_offsets header), std objects are
// DWARF 5. Numbers are decimal or hexadecimal with 0x prefix.

#include <cctype>
#include <charconv>
#include <limits>

#include <llvm/Support/Error.h>

#include "TestObject.hpp"
#include "dwpack/StrOffsets.hpp"
#include "dwpack/util/ByteWriter.hpp"

namespace dwpack::test {

namespace {

class TestInputParser {
  std::string_view text;
  TestInput &input;
  u32 line_no = 0;

  // Per-object state
  std::vector<u64> str_starts;

public:
  TestInputParser(std::string_view text, TestInput &input)
      : text(text), input(input) {}

private:
  bool error([[maybe_unused]] std::string_view msg) {
    DWPACK_LOG_ERR("line {}: {}", line_no, msg);
    return false;
  }

  std::string_view next_line() {
    ++line_no;
    auto len = text.find('\n');
    if (len == std::string_view::npos) {
      len = text.size();
    }
    std::string_view line = text.substr(0, len);
    text.remove_prefix(len < text.size() ? len + 1 : len);

    auto comment = line.find(';');
    if (comment != std::string_view::npos) {
      line = line.substr(0, comment);
    }
    return line;
  }

  static void skip_whitespace(std::string_view &line) {
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line[0]))) {
      line.remove_prefix(1);
    }
  }

  static std::string_view next_word(std::string_view &line) {
    skip_whitespace(line);
    size_t len = 0;
    while (len < line.size() &&
           !std::isspace(static_cast<unsigned char>(line[len]))) {
      ++len;
    }
    std::string_view word = line.substr(0, len);
    line.remove_prefix(len);
    return word;
  }

  static bool parse_num(std::string_view word, u64 &value) {
    int base = 10;
    if (word.starts_with("0x")) {
      word.remove_prefix(2);
      base = 16;
    }
    if (word.empty()) {
      return false;
    }
    auto [ptr, ec] =
        std::from_chars(word.data(), word.data() + word.size(), value, base);
    return ec == std::errc{} && ptr == word.data() + word.size();
  }

  static int hex_digit(char c) {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
      return c - 'A' + 10;
    }
    return -1;
  }

  bool parse_string(std::string_view &line, std::string &out) {
    skip_whitespace(line);
    if (line.empty() || line[0] != '"') {
      return error("expected string");
    }
    line.remove_prefix(1);
    while (!line.empty() && line[0] != '"') {
      if (line[0] != '\\') {
        out += line[0];
        line.remove_prefix(1);
        continue;
      }
      if (line.size() >= 2 && (line[1] == '\\' || line[1] == '"')) {
        out += line[1];
        line.remove_prefix(2);
        continue;
      }
      if (line.size() >= 4 && line[1] == 'x') {
        int hi = hex_digit(line[2]), lo = hex_digit(line[3]);
        if (hi < 0 || lo < 0) {
          return error("invalid \\x escape");
        }
        out += static_cast<char>(hi << 4 | lo);
        line.remove_prefix(4);
        continue;
      }
      return error("invalid escape");
    }
    if (line.empty()) {
      return error("unterminated string");
    }
    line.remove_prefix(1);
    return true;
  }

  bool parse_header(std::string_view line, TestObject &obj) {
    obj.name = std::string{next_word(line)};
    if (obj.name.empty()) {
      return error("expected object name");
    }

    std::string_view format = next_word(line);
    if (format == "dwarf32") {
      obj.encoding.format = DwarfFormat::dwarf32;
    } else if (format == "dwarf64") {
      obj.encoding.format = DwarfFormat::dwarf64;
    } else {
      return error("expected dwarf32 or dwarf64");
    }

    std::string_view kind = next_word(line);
    if (kind == "gnu") {
      obj.encoding.version = 4;
    } else if (kind == "std") {
      obj.encoding.version = 5;
    } else {
      return error("expected gnu or std");
    }

    std::string_view endian = next_word(line);
    if (endian.empty() || endian == "little") {
      obj.endian = Endian::little;
    } else if (endian == "big") {
      obj.endian = Endian::big;
    } else {
      return error("expected little or big");
    }

    if (!next_word(line).empty()) {
      return error("trailing characters after object header");
    }
    return true;
  }

  bool parse_strtab(std::string_view line, TestObject &obj) {
    skip_whitespace(line);
    while (!line.empty()) {
      std::string str;
      if (!parse_string(line, str)) {
        return false;
      }
      str_starts.push_back(obj.debug_str.size());
      obj.debug_str += str;
      obj.debug_str += '\0';
      skip_whitespace(line);
    }
    return true;
  }

  bool parse_offsets(std::string_view line, TestObject &obj) {
    if (!obj.entries) {
      obj.entries.emplace();
    }
    for (auto word = next_word(line); !word.empty(); word = next_word(line)) {
      if (word[0] == '@') {
        u64 idx;
        if (!parse_num(word.substr(1), idx) || idx >= str_starts.size()) {
          return error("invalid string reference");
        }
        obj.entries->push_back(str_starts[idx]);
        continue;
      }
      u64 value;
      if (!parse_num(word, value)) {
        return error("invalid offset");
      }
      obj.entries->push_back(value);
    }
    return true;
  }

  bool parse_object(std::string_view header) {
    TestObject obj;
    str_starts.clear();
    if (!parse_header(header, obj)) {
      return false;
    }

    while (!text.empty()) {
      std::string_view line = next_line();
      std::string_view keyword = next_word(line);
      if (keyword.empty()) {
        continue;
      }
      if (keyword == "end") {
        if (!obj.build()) {
          return error("unable to encode .debug_str_offsets");
        }
        input.objects.push_back(std::move(obj));
        return true;
      }

      bool ok = true;
      if (keyword == "strtab") {
        ok = parse_strtab(line, obj);
      } else if (keyword == "offsets") {
        ok = parse_offsets(line, obj);
      } else if (keyword == "size") {
        u64 size;
        ok = parse_num(next_word(line), size);
        if (!ok) {
          return error("invalid size");
        }
        obj.section_size = size;
      } else {
        return error("unknown keyword");
      }
      if (!ok) {
        return false;
      }
    }
    return error("missing end");
  }

public:
  bool parse() {
    while (!text.empty()) {
      std::string_view line = next_line();
      std::string_view keyword = next_word(line);
      if (keyword.empty()) {
        continue;
      }
      if (keyword != "object") {
        return error("expected object");
      }
      if (!parse_object(line)) {
        return false;
      }
    }
    return true;
  }
};

} // namespace

bool TestObject::build() noexcept {
  debug_str_offsets.clear();
  if (!entries) {
    return true;
  }

  const StrOffsetsLayout layout = this->layout();
  const u64 size = layout.header_size() + entries->size() * layout.offset_size();
  util::ByteWriter writer{debug_str_offsets, endian};
  if (auto err = write_str_offsets_header(writer, layout, size)) {
    DWPACK_LOG_ERR("{}", llvm::toString(std::move(err)));
    llvm::consumeError(std::move(err));
    return false;
  }
  for (u64 entry : *entries) {
    if (auto err = write_str_offset(writer, layout, StringOffset{entry})) {
      DWPACK_LOG_ERR("{}", llvm::toString(std::move(err)));
      llvm::consumeError(std::move(err));
      return false;
    }
  }
  return true;
}

DwoStrSections TestObject::sections() const noexcept {
  DwoStrSections res;
  res.name = name;
  res.debug_str = llvm::StringRef{debug_str.data(), debug_str.size()};
  if (entries) {
    res.debug_str_offsets = llvm::StringRef{
        reinterpret_cast<const char *>(debug_str_offsets.data()),
        debug_str_offsets.size()};
    res.str_offsets_size = section_size.value_or(debug_str_offsets.size());
  }
  res.encoding = encoding;
  res.endian = endian;
  return res;
}

bool TestInput::parse(std::string_view text) noexcept {
  objects.clear();
  return TestInputParser{text, *this}.parse();
}

} // namespace dwpack::test
