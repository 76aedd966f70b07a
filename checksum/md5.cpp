// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "checksum/md5.h"

#include <algorithm>

#include "checksum/md5_padding.h"
#include "common/check.h"
#include "llvm/ADT/Sequence.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Endian.h"

namespace Checksum {

char Md5UsageError::ID;

auto Md5UsageError::log(llvm::raw_ostream& out) const -> void {
  out << "cannot " << operation_
      << " an MD5 hasher that has already been finalized";
}

auto Md5Digest::FromHex(llvm::StringRef hex) -> std::optional<Md5Digest> {
  if (hex.size() != 2 * Size) {
    return std::nullopt;
  }
  std::string raw;
  if (!llvm::tryGetFromHex(hex, raw)) {
    return std::nullopt;
  }
  CHECKSUM_CHECK(raw.size() == static_cast<size_t>(Size))
      << "Decoded " << raw.size() << " bytes.";
  std::array<uint8_t, Size> bytes;
  std::copy(raw.begin(), raw.end(), bytes.begin());
  return Md5Digest(bytes);
}

auto Md5Digest::ToHex() const -> std::string {
  return llvm::toHex(bytes_, /*LowerCase=*/true);
}

static auto AsBytes(llvm::StringRef text) -> llvm::ArrayRef<std::byte> {
  return llvm::ArrayRef<std::byte>(
      reinterpret_cast<const std::byte*>(text.data()), text.size());
}

auto Md5Hasher::Hash(llvm::ArrayRef<std::byte> bytes) -> Md5Digest {
  // A fresh hasher can't be finalized, so neither call can fail.
  Md5Hasher hasher;
  llvm::cantFail(hasher.Update(bytes));
  return llvm::cantFail(hasher.Finalize());
}

auto Md5Hasher::Hash(llvm::StringRef text) -> Md5Digest {
  return Hash(AsBytes(text));
}

auto Md5Hasher::Update(llvm::ArrayRef<std::byte> bytes) -> llvm::Error {
  if (is_finalized()) {
    return llvm::make_error<Md5UsageError>("update");
  }
  accumulator_.Append(bytes,
                      [this](const Md5Block& block) { ProcessBlock(block); });
  return llvm::Error::success();
}

auto Md5Hasher::Update(llvm::StringRef text) -> llvm::Error {
  return Update(AsBytes(text));
}

auto Md5Hasher::Finalize() -> llvm::Expected<Md5Digest> {
  if (is_finalized()) {
    return llvm::make_error<Md5UsageError>("finalize");
  }

  llvm::ArrayRef<std::byte> pending = accumulator_.pending();
  Md5PaddingBytes padding = Md5Padding(accumulator_.bit_count(),
                                       static_cast<int64_t>(pending.size()));
  llvm::SmallVector<std::byte, 2 * Md5BlockSize> tail(pending.begin(),
                                                       pending.end());
  tail.append(padding.begin(), padding.end());
  CHECKSUM_CHECK(tail.size() % Md5BlockSize == 0)
      << "Padded tail is " << tail.size() << " bytes.";

  llvm::ArrayRef<std::byte> remaining = tail;
  while (!remaining.empty()) {
    llvm::ArrayRef<std::byte> chunk = remaining.take_front(Md5BlockSize);
    Md5Block block;
    std::copy(chunk.begin(), chunk.end(), block.begin());
    ProcessBlock(block);
    remaining = remaining.drop_front(Md5BlockSize);
  }

  std::array<uint8_t, Md5Digest::Size> bytes;
  for (int i : llvm::seq(0, 4)) {
    llvm::support::endian::write32le(bytes.data() + i * 4, state_[i]);
  }
  digest_ = Md5Digest(bytes);
  return *digest_;
}

auto Md5Hasher::ProcessBlock(const Md5Block& block) -> void {
  state_ = Md5CompressBlock(state_, block);
}

}  // namespace Checksum
