// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "checksum/md5_padding.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Sequence.h"

namespace Checksum::Testing {
namespace {

using ::testing::Each;
using ::testing::ElementsAre;
using ::testing::Eq;

TEST(Md5PaddingTest, EmptyMessage) {
  Md5PaddingBytes padding = Md5Padding(0, 0);
  ASSERT_THAT(padding.size(), Eq(64U));
  EXPECT_THAT(padding[0], Eq(std::byte{0x80}));
  EXPECT_THAT(llvm::ArrayRef<std::byte>(padding).drop_front(),
              Each(Eq(std::byte{0})));
}

TEST(Md5PaddingTest, LengthIsLittleEndian) {
  // 0x123 bytes, so 0x918 bits, with 0x123 % 64 == 35 bytes pending.
  Md5PaddingBytes padding = Md5Padding(0x918, 35);
  ASSERT_THAT(padding.size(), Eq(29U));
  EXPECT_THAT(padding[0], Eq(std::byte{0x80}));
  EXPECT_THAT(llvm::ArrayRef<std::byte>(padding).slice(1, 20),
              Each(Eq(std::byte{0})));
  EXPECT_THAT(llvm::ArrayRef<std::byte>(padding).take_back(8),
              ElementsAre(std::byte{0x18}, std::byte{0x09}, std::byte{0},
                          std::byte{0}, std::byte{0}, std::byte{0},
                          std::byte{0}, std::byte{0}));
}

TEST(Md5PaddingTest, BlockCounts) {
  // Up to 55 pending bytes leave room for the marker and length in one block.
  for (int pending : llvm::seq(0, 56)) {
    SCOPED_TRACE(pending);
    Md5PaddingBytes padding = Md5Padding(pending * 8, pending);
    EXPECT_THAT(pending + padding.size(), Eq(64U));
  }
  for (int pending : llvm::seq(56, 64)) {
    SCOPED_TRACE(pending);
    Md5PaddingBytes padding = Md5Padding(pending * 8, pending);
    EXPECT_THAT(pending + padding.size(), Eq(128U));
  }
}

TEST(Md5PaddingTest, ExactlyFiftyFiveBytes) {
  Md5PaddingBytes padding = Md5Padding(55 * 8, 55);
  EXPECT_THAT(padding, ElementsAre(std::byte{0x80}, std::byte{0xb8},
                                   std::byte{0x01}, std::byte{0}, std::byte{0},
                                   std::byte{0}, std::byte{0}, std::byte{0},
                                   std::byte{0}));
}

TEST(Md5PaddingTest, LongMessagesWrapLength) {
  // A message of 2^61 - 1 bytes has a bit count of 2^64 - 8, the largest
  // representable, and leaves 63 bytes pending.
  Md5PaddingBytes padding = Md5Padding(~uint64_t{7}, 63);
  ASSERT_THAT(padding.size(), Eq(65U));
  EXPECT_THAT(llvm::ArrayRef<std::byte>(padding).take_back(8),
              ElementsAre(std::byte{0xf8}, std::byte{0xff}, std::byte{0xff},
                          std::byte{0xff}, std::byte{0xff}, std::byte{0xff},
                          std::byte{0xff}, std::byte{0xff}));
}

TEST(Md5PaddingDeathTest, PendingFullBlock) {
  ASSERT_DEATH(Md5Padding(64 * 8, 64), "is not a partial block");
}

}  // namespace
}  // namespace Checksum::Testing
