// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "checksum/md5_padding.h"

#include <iterator>

#include "common/check.h"
#include "llvm/Support/Endian.h"

namespace Checksum {

auto Md5Padding(uint64_t bit_count, int64_t pending_size) -> Md5PaddingBytes {
  CHECKSUM_CHECK(pending_size >= 0 && pending_size < Md5BlockSize)
      << "Pending size " << pending_size << " is not a partial block.";
  // The bit count is a multiple of 8 modulo 2^64, and 2^61 is a multiple of
  // the block size, so the pending size is always recoverable from it.
  CHECKSUM_DCHECK(static_cast<int64_t>((bit_count / 8) % Md5BlockSize) ==
                  pending_size)
      << "Bit count " << bit_count << " disagrees with " << pending_size
      << " pending bytes.";

  int64_t zero_count =
      (Md5LengthOffset - 1 - pending_size + Md5BlockSize) % Md5BlockSize;

  Md5PaddingBytes padding;
  padding.push_back(std::byte{0x80});
  padding.append(zero_count, std::byte{0});
  std::byte length[8];
  llvm::support::endian::write64le(length, bit_count);
  padding.append(std::begin(length), std::end(length));

  CHECKSUM_DCHECK((pending_size + static_cast<int64_t>(padding.size())) %
                      Md5BlockSize ==
                  0);
  return padding;
}

}  // namespace Checksum
