// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CHECKSUM_CHECKSUM_MD5_SUM_H_
#define CHECKSUM_CHECKSUM_MD5_SUM_H_

#include <cstdint>
#include <string>

#include "checksum/md5_file.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

namespace Checksum {

// Settings shared by printing and checking sums.
struct Md5SumOptions {
  // Prefix for diagnostics.
  llvm::StringRef tool_name = "md5sum";
  int64_t chunk_size = Md5DefaultChunkSize;
  // When checking, don't print `OK` lines.
  bool quiet = false;
  // When checking, print nothing; only the result reports success.
  bool status = false;
  // Report the size and throughput of each hashed file on the error stream.
  bool verbose = false;
};

// Tallies of the problems found while checking one or more lists.
struct Md5CheckCounts {
  int mismatched = 0;
  int unreadable = 0;
  int malformed = 0;
};

// Writes `<hex>  <path>` to `out` for each path, with "-" naming standard
// input. Files that can't be hashed are diagnosed on `err`. Returns true if
// every file was hashed.
auto Md5PrintSums(llvm::ArrayRef<std::string> paths,
                  const Md5SumOptions& options, llvm::raw_ostream& out,
                  llvm::raw_ostream& err) -> bool;

// Re-hashes every file named in the checksum list at `list_path` and writes
// `<path>: OK`, `<path>: FAILED` or `<path>: FAILED open or read` to `out`,
// adding to `counts`. Returns false if the list can't be read or has no
// well-formed line; mismatches are only counted.
auto Md5CheckList(llvm::StringRef list_path, const Md5SumOptions& options,
                  Md5CheckCounts& counts, llvm::raw_ostream& out,
                  llvm::raw_ostream& err) -> bool;

// Checks every list in `list_paths` and warns on `err` with the totals.
// Returns true only if every list was readable and every listed file was
// hashed and matched.
auto Md5CheckSums(llvm::ArrayRef<std::string> list_paths,
                  const Md5SumOptions& options, llvm::raw_ostream& out,
                  llvm::raw_ostream& err) -> bool;

}  // namespace Checksum

#endif  // CHECKSUM_CHECKSUM_MD5_SUM_H_
