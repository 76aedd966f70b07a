// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "checksum/md5_accumulator.h"

#include <algorithm>
#include <cstring>

#include "common/check.h"

namespace Checksum {

auto Md5BlockAccumulator::Append(
    llvm::ArrayRef<std::byte> bytes,
    llvm::function_ref<void(const Md5Block&)> process_block) -> void {
  // Lengths past 2^61 bytes wrap, matching the 64-bit length field.
  bit_count_ += static_cast<uint64_t>(bytes.size()) * 8;

  while (!bytes.empty()) {
    int64_t copy_size = std::min<int64_t>(Md5BlockSize - pending_size_,
                                          static_cast<int64_t>(bytes.size()));
    std::memcpy(pending_.data() + pending_size_, bytes.data(), copy_size);
    pending_size_ += copy_size;
    bytes = bytes.drop_front(copy_size);

    if (pending_size_ == Md5BlockSize) {
      process_block(pending_);
      pending_size_ = 0;
    }
  }

  CHECKSUM_DCHECK(pending_size_ < Md5BlockSize);
}

}  // namespace Checksum
