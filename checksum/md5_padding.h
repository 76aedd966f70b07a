// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CHECKSUM_CHECKSUM_MD5_PADDING_H_
#define CHECKSUM_CHECKSUM_MD5_PADDING_H_

#include <cstddef>
#include <cstdint>

#include "checksum/md5_constants.h"
#include "llvm/ADT/SmallVector.h"

namespace Checksum {

// Padding never exceeds one block plus the 0x80 marker and the length, so
// this is enough inline storage to never allocate.
using Md5PaddingBytes = llvm::SmallVector<std::byte, Md5BlockSize + 9>;

// Builds the trailer appended to a message before its final compression.
//
// `bit_count` is the message length in bits modulo 2^64, and `pending_size` is
// the number of message bytes still waiting to form a block, which must be in
// [0, 64). The result is a single 0x80 byte, then zero bytes until the
// message length is 56 modulo 64, then `bit_count` as a little-endian 64-bit
// integer. Appending it to the pending bytes always yields one block, or two
// when more than 55 bytes are pending.
auto Md5Padding(uint64_t bit_count, int64_t pending_size) -> Md5PaddingBytes;

}  // namespace Checksum

#endif  // CHECKSUM_CHECKSUM_MD5_PADDING_H_
