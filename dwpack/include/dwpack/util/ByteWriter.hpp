// SPDX-FileCopyrightText: 2025 Contributors to dwpack
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
#pragma once

#include <concepts>
#include <cstring>
#include <vector>

#include <llvm/Support/Endian.h>

#include "dwpack/Encoding.hpp"
#include "dwpack/base.hpp"

namespace dwpack::util {

/// Appends fixed-width integers in a fixed byte order to a vector.
class ByteWriter {
  std::vector<u8> *vector;
  llvm::support::endianness endian;

public:
  ByteWriter(std::vector<u8> &vector, Endian endian) noexcept
      : vector(&vector),
        endian(endian == Endian::little ? llvm::support::little
                                        : llvm::support::big) {}

  ByteWriter(const ByteWriter &) = delete;
  ByteWriter &operator=(const ByteWriter &) = delete;

  template <std::unsigned_integral T>
  void write(T t) {
    t = llvm::support::endian::byte_swap<T>(t, endian);
    size_t off = vector->size();
    vector->resize(off + sizeof(T));
    std::memcpy(vector->data() + off, &t, sizeof(T));
  }
};

} // end namespace dwpack::util
