// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "checksum/md5_block.h"

#include <bit>

#include "llvm/ADT/Sequence.h"
#include "llvm/Support/Endian.h"

namespace Checksum {

auto Md5CompressBlock(Md5ChainingValue state, const Md5Block& block)
    -> Md5ChainingValue {
  std::array<uint32_t, 16> words;
  for (int i : llvm::seq(0, 16)) {
    words[i] = llvm::support::endian::read32le(block.data() + i * 4);
  }

  uint32_t a = state[0];
  uint32_t b = state[1];
  uint32_t c = state[2];
  uint32_t d = state[3];

  for (int i : llvm::seq(0, 64)) {
    int round = i / 16;
    uint32_t mixed;
    int word_index;
    switch (round) {
      case 0:
        mixed = (b & c) | (~b & d);
        word_index = i;
        break;
      case 1:
        mixed = (b & d) | (c & ~d);
        word_index = (5 * i + 1) % 16;
        break;
      case 2:
        mixed = b ^ c ^ d;
        word_index = (3 * i + 5) % 16;
        break;
      default:
        mixed = c ^ (b | ~d);
        word_index = (7 * i) % 16;
        break;
    }

    uint32_t sum = a + mixed + words[word_index] + Md5RoundConstants[i];
    // Rotate the registers right by one, injecting the new value into B.
    a = d;
    d = c;
    c = b;
    b += std::rotl(sum, Md5RoundShifts[round][i % 4]);
  }

  state[0] += a;
  state[1] += b;
  state[2] += c;
  state[3] += d;
  return state;
}

}  // namespace Checksum
