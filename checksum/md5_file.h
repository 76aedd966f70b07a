// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CHECKSUM_CHECKSUM_MD5_FILE_H_
#define CHECKSUM_CHECKSUM_MD5_FILE_H_

#include <cstdint>
#include <optional>
#include <string>

#include "checksum/md5.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"

namespace Checksum {

// Read size used when a caller has no preference.
inline constexpr int64_t Md5DefaultChunkSize = 64 << 10;

// Hashes everything that can be read from `file`, starting at its current
// position, reading at most `chunk_size` bytes at a time. `chunk_size` must be
// positive. Read failures are returned as errors; the handle is not closed.
auto Md5HashNativeFile(llvm::sys::fs::file_t file,
                       int64_t chunk_size = Md5DefaultChunkSize)
    -> llvm::Expected<Md5Digest>;

// Opens `path`, hashes its contents, and closes it. The path "-" names
// standard input, which is read but left open. Errors name the path.
auto Md5HashFile(llvm::StringRef path,
                 int64_t chunk_size = Md5DefaultChunkSize)
    -> llvm::Expected<Md5Digest>;

// One entry of a checksum list, as written by `md5sum`.
struct Md5ChecksumLine {
  Md5Digest digest;
  std::string path;
};

// Parses `<32 hex digits><space><space or '*'><path>`. A trailing carriage
// return is ignored. Returns `nullopt` if the line doesn't have that shape or
// the path is empty.
auto ParseMd5ChecksumLine(llvm::StringRef line)
    -> std::optional<Md5ChecksumLine>;

}  // namespace Checksum

#endif  // CHECKSUM_CHECKSUM_MD5_FILE_H_
