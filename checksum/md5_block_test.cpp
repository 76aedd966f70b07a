// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "checksum/md5_block.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstring>

#include "llvm/ADT/StringRef.h"

namespace Checksum::Testing {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Ne;

auto MakeBlock(llvm::StringRef prefix) -> Md5Block {
  Md5Block block = {};
  std::memcpy(block.data(), prefix.data(), prefix.size());
  return block;
}

TEST(Md5BlockTest, PaddedEmptyMessage) {
  // The only block of the empty message: the 0x80 marker and a zero length.
  Md5Block block = {};
  block[0] = std::byte{0x80};
  // These words serialize to the digest d41d8cd98f00b204e9800998ecf8427e.
  EXPECT_THAT(Md5CompressBlock(Md5InitialChainingValue, block),
              ElementsAre(0xd98c1dd4, 0x04b2008f, 0x980980e9, 0x7e42f8ec));
}

TEST(Md5BlockTest, PaddedAbc) {
  Md5Block block = MakeBlock("abc\x80");
  block[Md5LengthOffset] = std::byte{24};
  EXPECT_THAT(Md5CompressBlock(Md5InitialChainingValue, block),
              ElementsAre(0x98500190, 0xb04fd23c, 0x7d3f96d6, 0x727fe128));
}

TEST(Md5BlockTest, ZeroBlock) {
  Md5Block block = {};
  EXPECT_THAT(Md5CompressBlock(Md5InitialChainingValue, block),
              ElementsAre(0x031f1dac, 0x6ea58ed0, 0x1fab67b7, 0x74317791));
}

TEST(Md5BlockTest, Pure) {
  Md5Block block = MakeBlock("The quick brown fox jumps over the lazy dog");
  Md5ChainingValue state = Md5InitialChainingValue;
  Md5ChainingValue first = Md5CompressBlock(state, block);
  EXPECT_THAT(state, Eq(Md5InitialChainingValue));
  EXPECT_THAT(Md5CompressBlock(state, block), Eq(first));
  EXPECT_THAT(first, Ne(state));
}

TEST(Md5BlockTest, ChainingValueMatters) {
  Md5Block block = {};
  Md5ChainingValue chained =
      Md5CompressBlock(Md5CompressBlock(Md5InitialChainingValue, block), block);
  EXPECT_THAT(chained, Ne(Md5CompressBlock(Md5InitialChainingValue, block)));
}

}  // namespace
}  // namespace Checksum::Testing
