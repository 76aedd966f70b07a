// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "checksum/md5_file.h"

#include <cstddef>
#include <system_error>
#include <utility>

#include "common/check.h"
#include "llvm/ADT/SmallVector.h"

namespace Checksum {

auto Md5HashNativeFile(llvm::sys::fs::file_t file, int64_t chunk_size)
    -> llvm::Expected<Md5Digest> {
  CHECKSUM_CHECK(chunk_size > 0) << "Invalid chunk size " << chunk_size;

  llvm::SmallVector<char, 0> buffer(chunk_size);
  Md5Hasher hasher;
  while (true) {
    llvm::Expected<size_t> read_size =
        llvm::sys::fs::readNativeFile(file, buffer);
    if (!read_size) {
      return read_size.takeError();
    }
    if (*read_size == 0) {
      break;
    }
    if (llvm::Error error = hasher.Update(llvm::ArrayRef<std::byte>(
            reinterpret_cast<const std::byte*>(buffer.data()), *read_size))) {
      return std::move(error);
    }
  }
  return hasher.Finalize();
}

auto Md5HashFile(llvm::StringRef path, int64_t chunk_size)
    -> llvm::Expected<Md5Digest> {
  if (path == "-") {
    llvm::Expected<Md5Digest> digest =
        Md5HashNativeFile(llvm::sys::fs::getStdinHandle(), chunk_size);
    if (!digest) {
      return llvm::createFileError(path, digest.takeError());
    }
    return digest;
  }

  llvm::Expected<llvm::sys::fs::file_t> file =
      llvm::sys::fs::openNativeFileForRead(path);
  if (!file) {
    return llvm::createFileError(path, file.takeError());
  }
  llvm::Expected<Md5Digest> digest = Md5HashNativeFile(*file, chunk_size);
  std::error_code close_error = llvm::sys::fs::closeFile(*file);
  if (!digest) {
    return llvm::createFileError(path, digest.takeError());
  }
  if (close_error) {
    return llvm::createFileError(path, close_error);
  }
  return digest;
}

auto ParseMd5ChecksumLine(llvm::StringRef line)
    -> std::optional<Md5ChecksumLine> {
  constexpr size_t HexSize = 2 * Md5Digest::Size;
  line.consume_back("\r");
  // The digest, a space, then a mode character: ' ' for text or '*' for binary.
  if (line.size() <= HexSize + 2 || line[HexSize] != ' ' ||
      (line[HexSize + 1] != ' ' && line[HexSize + 1] != '*')) {
    return std::nullopt;
  }
  std::optional<Md5Digest> digest =
      Md5Digest::FromHex(line.take_front(HexSize));
  if (!digest) {
    return std::nullopt;
  }
  return Md5ChecksumLine{.digest = *digest,
                         .path = line.drop_front(HexSize + 2).str()};
}

}  // namespace Checksum
