// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CHECKSUM_CHECKSUM_MD5_ACCUMULATOR_H_
#define CHECKSUM_CHECKSUM_MD5_ACCUMULATOR_H_

#include <cstddef>
#include <cstdint>

#include "checksum/md5_block.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLFunctionalExtras.h"

namespace Checksum {

// Splits a byte stream delivered in arbitrary pieces into complete blocks.
//
// Bytes that don't yet fill a block are held until a later `Append` completes
// it, so at most 63 bytes are ever buffered regardless of how much input has
// been seen. The accumulator also keeps the total input length in bits,
// modulo 2^64, for the final length encoding.
class Md5BlockAccumulator {
 public:
  // Appends `bytes` to the stream. Every block completed by them is passed to
  // `process_block` in stream order before this returns.
  auto Append(llvm::ArrayRef<std::byte> bytes,
              llvm::function_ref<void(const Md5Block&)> process_block) -> void;

  // The trailing bytes that don't form a complete block yet.
  auto pending() const -> llvm::ArrayRef<std::byte> {
    return llvm::ArrayRef<std::byte>(pending_).take_front(pending_size_);
  }

  auto bit_count() const -> uint64_t { return bit_count_; }

 private:
  Md5Block pending_ = {};
  int64_t pending_size_ = 0;
  uint64_t bit_count_ = 0;
};

}  // namespace Checksum

#endif  // CHECKSUM_CHECKSUM_MD5_ACCUMULATOR_H_
