// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "checksum/md5_sum.h"

#include <chrono>
#include <memory>
#include <optional>
#include <system_error>

#include "checksum/md5.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/WithColor.h"

namespace Checksum {

// Hashes one file, reporting timing when `options.verbose` is set.
static auto HashOne(llvm::StringRef path, const Md5SumOptions& options,
                    llvm::raw_ostream& err) -> llvm::Expected<Md5Digest> {
  auto start = std::chrono::steady_clock::now();
  llvm::Expected<Md5Digest> digest = Md5HashFile(path, options.chunk_size);
  if (options.verbose && digest) {
    std::chrono::duration<double> elapsed =
        std::chrono::steady_clock::now() - start;
    uint64_t size = 0;
    // Standard input and files that can't be stat'ed report zero bytes.
    if (path == "-" || llvm::sys::fs::file_size(path, size)) {
      size = 0;
    }
    err << llvm::formatv(
        "{0}: {1} bytes in {2:f3}s ({3:f1} MiB/s)\n", path, size,
        elapsed.count(),
        elapsed.count() > 0 ? size / elapsed.count() / (1 << 20) : 0.0);
  }
  return digest;
}

auto Md5PrintSums(llvm::ArrayRef<std::string> paths,
                  const Md5SumOptions& options, llvm::raw_ostream& out,
                  llvm::raw_ostream& err) -> bool {
  bool success = true;
  for (const std::string& path : paths) {
    llvm::Expected<Md5Digest> digest = HashOne(path, options, err);
    if (!digest) {
      llvm::WithColor::error(err, options.tool_name)
          << llvm::toString(digest.takeError()) << "\n";
      success = false;
      continue;
    }
    out << *digest << "  " << path << "\n";
  }
  return success;
}

auto Md5CheckList(llvm::StringRef list_path, const Md5SumOptions& options,
                  Md5CheckCounts& counts, llvm::raw_ostream& out,
                  llvm::raw_ostream& err) -> bool {
  llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> list =
      llvm::MemoryBuffer::getFileOrSTDIN(list_path, /*IsText=*/true);
  if (std::error_code error = list.getError()) {
    if (!options.status) {
      llvm::WithColor::error(err, options.tool_name)
          << list_path << ": " << error.message() << "\n";
    }
    return false;
  }

  llvm::SmallVector<llvm::StringRef> lines;
  (*list)->getBuffer().split(lines, '\n', /*MaxSplit=*/-1,
                             /*KeepEmpty=*/false);
  bool any_entry = false;
  for (llvm::StringRef line : lines) {
    std::optional<Md5ChecksumLine> entry = ParseMd5ChecksumLine(line);
    if (!entry) {
      ++counts.malformed;
      continue;
    }
    any_entry = true;

    llvm::Expected<Md5Digest> digest = HashOne(entry->path, options, err);
    llvm::StringRef verdict = "OK";
    if (!digest) {
      if (!options.status) {
        llvm::WithColor::error(err, options.tool_name)
            << llvm::toString(digest.takeError()) << "\n";
      } else {
        llvm::consumeError(digest.takeError());
      }
      ++counts.unreadable;
      verdict = "FAILED open or read";
    } else if (*digest != entry->digest) {
      ++counts.mismatched;
      verdict = "FAILED";
    } else if (options.quiet) {
      continue;
    }
    if (!options.status) {
      out << entry->path << ": " << verdict << "\n";
    }
  }

  if (!any_entry) {
    if (!options.status) {
      llvm::WithColor::error(err, options.tool_name)
          << list_path << ": no properly formatted MD5 checksum lines found\n";
    }
    return false;
  }
  return true;
}

auto Md5CheckSums(llvm::ArrayRef<std::string> list_paths,
                  const Md5SumOptions& options, llvm::raw_ostream& out,
                  llvm::raw_ostream& err) -> bool {
  Md5CheckCounts counts;
  bool success = true;
  for (const std::string& list_path : list_paths) {
    success &= Md5CheckList(list_path, options, counts, out, err);
  }

  if (!options.status) {
    if (counts.malformed > 0) {
      llvm::WithColor::warning(err, options.tool_name) << llvm::formatv(
          "{0} line{1} improperly formatted\n", counts.malformed,
          counts.malformed == 1 ? " is" : "s are");
    }
    if (counts.unreadable > 0) {
      llvm::WithColor::warning(err, options.tool_name) << llvm::formatv(
          "{0} listed file{1} could not be read\n", counts.unreadable,
          counts.unreadable == 1 ? "" : "s");
    }
    if (counts.mismatched > 0) {
      llvm::WithColor::warning(err, options.tool_name) << llvm::formatv(
          "{0} computed checksum{1} did NOT match\n", counts.mismatched,
          counts.mismatched == 1 ? "" : "s");
    }
  }
  return success && counts.mismatched == 0 && counts.unreadable == 0;
}

}  // namespace Checksum
