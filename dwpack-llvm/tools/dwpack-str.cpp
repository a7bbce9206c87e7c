// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
#include <llvm/Object/ObjectFile.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/Format.h>
#include <llvm/Support/raw_ostream.h>

#include "dwpack-llvm/DwoObject.hpp"
#include "dwpack/PackageStrings.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#define ARGS_NOEXCEPT
#include <args/args.hxx>

namespace {

bool write_file(const std::string &path, const std::vector<uint8_t> &data) {
  std::ofstream out{path, std::ios::binary};
  if (!out.is_open()) {
    return false;
  }
  out.write(reinterpret_cast<const char *>(data.data()), data.size());
  return out.good();
}

void print_strings(const dwpack::PackageStrSections &sections,
                   const std::vector<std::string> &inputs) {
  llvm::raw_ostream &os = llvm::outs();
  os << ".debug_str_offsets contributions:\n";
  for (size_t i = 0; i < sections.contributions.size(); ++i) {
    const auto &contrib = sections.contributions[i];
    os << "  " << inputs[i] << ": offset=" << llvm::format_hex(contrib.offset, 1)
       << " size=" << llvm::format_hex(contrib.size, 1) << '\n';
  }

  os << ".debug_str:\n";
  const auto &str = sections.debug_str;
  size_t start = 0;
  for (size_t i = 0; i < str.size(); ++i) {
    if (str[i] != 0) {
      continue;
    }
    llvm::StringRef s{reinterpret_cast<const char *>(str.data()) + start,
                      i - start};
    os << "  " << llvm::format_hex(start, 10) << " \"";
    os.write_escaped(s);
    os << "\"\n";
    start = i + 1;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  args::ArgumentParser parser(
      "Merge .debug_str.dwo and rebuild .debug_str_offsets.dwo of split DWARF "
      "objects into package string sections");
  args::HelpFlag help(parser, "help", "Display help", {'h', "help"});

  args::ValueFlag<unsigned> log_level(
      parser,
      "log_level",
      "Set the log level to 0=NONE, 1=ERR, 2=WARN(default), 3=INFO, 4=DEBUG, "
      ">5=TRACE",
      {'l', "log-level"},
      2);
  args::Flag print(parser,
                   "print",
                   "Print the merged strings and the contributions",
                   {"print"});

  args::ValueFlag<std::string> str_out_path(
      parser,
      "str_path",
      "Path where the merged .debug_str section should be written",
      {"str-out"},
      args::Options::None);
  args::ValueFlag<std::string> str_offsets_out_path(
      parser,
      "str_offsets_path",
      "Path where the merged .debug_str_offsets section should be written",
      {"str-offsets-out"},
      args::Options::None);

  args::PositionalList<std::string> inputs(
      parser, "dwo", "Split DWARF objects, in package order");

  parser.ParseCLI(argc, argv);
  if (parser.GetError() == args::Error::Help) {
    std::cout << parser;
    return 0;
  }

  if (parser.GetError() != args::Error::None) {
    std::cerr << "Error parsing arguments: " << parser.GetErrorMsg() << '\n';
    return 1;
  }

  dwpack::set_log_level(log_level.Get());

  const std::vector<std::string> input_paths = args::get(inputs);
  if (input_paths.empty()) {
    std::cerr << "No input objects\n";
    return 1;
  }

  // Objects and decompressed sections must stay alive until their sections
  // have been merged.
  std::vector<llvm::object::OwningBinary<llvm::object::ObjectFile>> objects;
  dwpack_llvm::UncompressedSections uncompressed;
  std::optional<dwpack::PackageStrings> package;
  for (const std::string &path : input_paths) {
    auto obj = llvm::object::ObjectFile::createObjectFile(path);
    if (!obj) {
      llvm::logAllUnhandledErrors(
          llvm::createFileError(path, obj.takeError()),
          llvm::errs(),
          "dwpack-str: error: ");
      return 1;
    }
    objects.push_back(std::move(*obj));

    auto sections = dwpack_llvm::load_dwo_str_sections(
        *objects.back().getBinary(), path, uncompressed);
    if (!sections) {
      llvm::logAllUnhandledErrors(
          sections.takeError(), llvm::errs(), "dwpack-str: error: ");
      return 1;
    }

    if (!package) {
      package.emplace(sections->endian);
    }
    if (auto contrib = package->add_object(*sections); !contrib) {
      llvm::logAllUnhandledErrors(
          contrib.takeError(), llvm::errs(), "dwpack-str: error: ");
      return 1;
    }
  }

  dwpack::PackageStrSections merged = std::move(*package).finish();

  if (print) {
    print_strings(merged, input_paths);
  }

  if (str_out_path && !write_file(str_out_path.Get(), merged.debug_str)) {
    std::cerr << "Failed to write " << str_out_path.Get() << '\n';
    return 1;
  }
  if (str_offsets_out_path &&
      !write_file(str_offsets_out_path.Get(), merged.debug_str_offsets)) {
    std::cerr << "Failed to write " << str_offsets_out_path.Get() << '\n';
    return 1;
  }

  return 0;
}
