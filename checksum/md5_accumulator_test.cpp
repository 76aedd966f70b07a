// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "checksum/md5_accumulator.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Sequence.h"

namespace Checksum::Testing {
namespace {

using ::testing::ElementsAreArray;
using ::testing::Eq;
using ::testing::IsEmpty;
using ::testing::SizeIs;

// Bytes 0, 1, 2, ... so every block's contents identify its position.
auto CountingBytes(int size) -> std::vector<std::byte> {
  std::vector<std::byte> bytes;
  for (int i : llvm::seq(0, size)) {
    bytes.push_back(static_cast<std::byte>(i));
  }
  return bytes;
}

class Md5BlockAccumulatorTest : public ::testing::Test {
 protected:
  auto Append(llvm::ArrayRef<std::byte> bytes) -> void {
    accumulator_.Append(
        bytes, [this](const Md5Block& block) { blocks_.push_back(block); });
  }

  Md5BlockAccumulator accumulator_;
  std::vector<Md5Block> blocks_;
};

TEST_F(Md5BlockAccumulatorTest, Empty) {
  Append({});
  EXPECT_THAT(blocks_, IsEmpty());
  EXPECT_THAT(accumulator_.pending(), IsEmpty());
  EXPECT_THAT(accumulator_.bit_count(), Eq(0U));
}

TEST_F(Md5BlockAccumulatorTest, BuffersPartialBlock) {
  std::vector<std::byte> bytes = CountingBytes(63);
  Append(bytes);
  EXPECT_THAT(blocks_, IsEmpty());
  EXPECT_THAT(accumulator_.pending(), ElementsAreArray(bytes));
  EXPECT_THAT(accumulator_.bit_count(), Eq(63U * 8));
}

TEST_F(Md5BlockAccumulatorTest, ExactBlock) {
  std::vector<std::byte> bytes = CountingBytes(64);
  Append(bytes);
  ASSERT_THAT(blocks_, SizeIs(1));
  EXPECT_THAT(blocks_[0], ElementsAreArray(bytes));
  EXPECT_THAT(accumulator_.pending(), IsEmpty());
}

TEST_F(Md5BlockAccumulatorTest, LargeAppend) {
  std::vector<std::byte> storage = CountingBytes(3 * 64 + 5);
  llvm::ArrayRef<std::byte> bytes = storage;
  Append(bytes);
  ASSERT_THAT(blocks_, SizeIs(3));
  for (int i : llvm::seq(0, 3)) {
    EXPECT_THAT(blocks_[i], ElementsAreArray(bytes.slice(i * 64, 64)));
  }
  EXPECT_THAT(accumulator_.pending(), ElementsAreArray(bytes.take_back(5)));
  EXPECT_THAT(accumulator_.bit_count(), Eq(uint64_t{197} * 8));
}

TEST_F(Md5BlockAccumulatorTest, BlocksSpanAppends) {
  std::vector<std::byte> storage = CountingBytes(130);
  llvm::ArrayRef<std::byte> bytes = storage;
  llvm::ArrayRef<std::byte> remaining = bytes;
  // Uneven pieces so that blocks are completed mid-piece.
  for (size_t piece_size : {1, 62, 3, 60, 4}) {
    Append(remaining.take_front(piece_size));
    remaining = remaining.drop_front(piece_size);
    EXPECT_THAT(accumulator_.pending().size(),
                Eq((bytes.size() - remaining.size()) % 64));
  }
  ASSERT_THAT(remaining, IsEmpty());
  ASSERT_THAT(blocks_, SizeIs(2));
  EXPECT_THAT(blocks_[0], ElementsAreArray(bytes.slice(0, 64)));
  EXPECT_THAT(blocks_[1], ElementsAreArray(bytes.slice(64, 64)));
  EXPECT_THAT(accumulator_.pending(), ElementsAreArray(bytes.take_back(2)));
  EXPECT_THAT(accumulator_.bit_count(), Eq(uint64_t{130} * 8));
}

}  // namespace
}  // namespace Checksum::Testing
