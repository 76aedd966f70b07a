// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CHECKSUM_CHECKSUM_MD5_BLOCK_H_
#define CHECKSUM_CHECKSUM_MD5_BLOCK_H_

#include <array>
#include <cstddef>

#include "checksum/md5_constants.h"

namespace Checksum {

// One complete unit of compressor input. Interpreted as 16 little-endian
// 32-bit words.
using Md5Block = std::array<std::byte, Md5BlockSize>;

// Runs the MD5 compression function over `block`, returning the chaining value
// that follows `state`.
//
// This is the 64-step, four-round transformation of RFC 1321 section 3.4,
// including the final feed-forward addition of the incoming state. It is a
// pure function; all arithmetic wraps modulo 2^32.
auto Md5CompressBlock(Md5ChainingValue state, const Md5Block& block)
    -> Md5ChainingValue;

}  // namespace Checksum

#endif  // CHECKSUM_CHECKSUM_MD5_BLOCK_H_
