// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CHECKSUM_CHECKSUM_MD5_H_
#define CHECKSUM_CHECKSUM_MD5_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

#include "checksum/md5_accumulator.h"
#include "checksum/md5_block.h"
#include "checksum/md5_constants.h"
#include "common/ostream.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace Checksum {

// The 16-byte result of hashing a message: the final chaining words A, B, C
// and D, each serialized little-endian, in that order.
class Md5Digest : public Printable<Md5Digest> {
 public:
  static constexpr int Size = 16;

  explicit Md5Digest(std::array<uint8_t, Size> bytes) : bytes_(bytes) {}

  // Parses exactly 32 hexadecimal digits of either case. Returns `nullopt` for
  // anything else, including surrounding whitespace.
  static auto FromHex(llvm::StringRef hex) -> std::optional<Md5Digest>;

  // Renders the digest as 32 lowercase hex digits, two per byte in stored
  // order, with no prefix or separators.
  auto ToHex() const -> std::string;

  auto Print(llvm::raw_ostream& out) const -> void { out << ToHex(); }

  auto bytes() const -> llvm::ArrayRef<uint8_t> { return bytes_; }

  friend auto operator==(const Md5Digest& lhs, const Md5Digest& rhs) -> bool {
    return lhs.bytes_ == rhs.bytes_;
  }
  friend auto operator!=(const Md5Digest& lhs, const Md5Digest& rhs) -> bool {
    return lhs.bytes_ != rhs.bytes_;
  }

 private:
  std::array<uint8_t, Size> bytes_;
};

// Error payload for calling `Update` or `Finalize` on a hasher that has
// already been finalized.
class Md5UsageError : public llvm::ErrorInfo<Md5UsageError> {
 public:
  static char ID;

  // `operation` names the rejected call, for example "update".
  explicit Md5UsageError(llvm::StringRef operation) : operation_(operation) {}

  auto log(llvm::raw_ostream& out) const -> void override;
  auto convertToErrorCode() const -> std::error_code override {
    return llvm::inconvertibleErrorCode();
  }

  auto operation() const -> llvm::StringRef { return operation_; }

 private:
  std::string operation_;
};

// Computes an MD5 digest over a message delivered in one or more pieces.
//
// A hasher starts open: any number of `Update` calls append bytes to the
// message, and the split of the message across calls never affects the
// result. `Finalize` pads the message, produces the digest, and moves the
// hasher into its terminal finalized state. Any further `Update` or `Finalize`
// is a usage error; the digest already produced stays available through
// `digest()`.
//
// Memory use is constant: only a partial block is buffered between calls, so
// a stream of any length can be hashed by feeding it in bounded chunks.
//
// This is the MD5 algorithm of RFC 1321 and provides no collision resistance.
// Use it for checksums and fingerprints, never for security.
//
// A hasher must not be mutated from more than one thread at a time.
class Md5Hasher {
 public:
  Md5Hasher() = default;
  Md5Hasher(Md5Hasher&& arg) = default;
  Md5Hasher(const Md5Hasher& arg) = delete;
  auto operator=(Md5Hasher&& rhs) -> Md5Hasher& = default;

  // Hashes `bytes` as a complete message. Equivalent to a fresh hasher given
  // one `Update` with `bytes` and then finalized.
  static auto Hash(llvm::ArrayRef<std::byte> bytes) -> Md5Digest;
  static auto Hash(llvm::StringRef text) -> Md5Digest;

  // Appends `bytes` to the message. Fails with `Md5UsageError` once the hasher
  // is finalized, leaving it unchanged.
  auto Update(llvm::ArrayRef<std::byte> bytes) -> llvm::Error;
  auto Update(llvm::StringRef text) -> llvm::Error;

  // Pads the message and returns its digest. Fails with `Md5UsageError` if the
  // hasher was already finalized.
  auto Finalize() -> llvm::Expected<Md5Digest>;

  auto is_finalized() const -> bool { return digest_.has_value(); }

  // The digest produced by `Finalize`, or `nullopt` while the hasher is open.
  auto digest() const -> std::optional<Md5Digest> { return digest_; }

  // The message length seen so far, in bits modulo 2^64.
  auto bit_count() const -> uint64_t { return accumulator_.bit_count(); }

 private:
  auto ProcessBlock(const Md5Block& block) -> void;

  Md5ChainingValue state_ = Md5InitialChainingValue;
  Md5BlockAccumulator accumulator_;
  std::optional<Md5Digest> digest_;
};

}  // namespace Checksum

#endif  // CHECKSUM_CHECKSUM_MD5_H_
