// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <cstdlib>
#include <string>

#include "checksum/md5_file.h"
#include "checksum/md5_sum.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

namespace Checksum {
namespace {

constexpr llvm::StringLiteral ToolName = "md5sum";

llvm::cl::OptionCategory ToolCategory("md5sum options");

llvm::cl::list<std::string> InputFiles(
    llvm::cl::Positional, llvm::cl::desc("<file>..."), llvm::cl::ZeroOrMore,
    llvm::cl::cat(ToolCategory));

llvm::cl::opt<bool> CheckMode(
    "check",
    llvm::cl::desc("Read MD5 sums from the files and verify them"),
    llvm::cl::cat(ToolCategory));
llvm::cl::alias CheckModeShort("c", llvm::cl::desc("Alias for --check"),
                               llvm::cl::aliasopt(CheckMode));

llvm::cl::opt<unsigned> ChunkSize(
    "chunk-size", llvm::cl::desc("Bytes read from a file per hash update"),
    llvm::cl::init(static_cast<unsigned>(Md5DefaultChunkSize)),
    llvm::cl::cat(ToolCategory));

llvm::cl::opt<bool> Quiet(
    "quiet",
    llvm::cl::desc("When checking, don't print OK for each verified file"),
    llvm::cl::cat(ToolCategory));

llvm::cl::opt<bool> Status(
    "status",
    llvm::cl::desc("When checking, print nothing; the exit status reports "
                   "success"),
    llvm::cl::cat(ToolCategory));

llvm::cl::opt<bool> Verbose(
    "verbose", llvm::cl::desc("Print the size and throughput of each file"),
    llvm::cl::cat(ToolCategory));

}  // namespace
}  // namespace Checksum

auto main(int argc, char** argv) -> int {
  llvm::InitLLVM init_llvm(argc, argv);
  llvm::cl::HideUnrelatedOptions(Checksum::ToolCategory);
  llvm::cl::ParseCommandLineOptions(
      argc, argv, "Print or check MD5 (128-bit) checksums.\n");

  if (Checksum::ChunkSize == 0) {
    llvm::WithColor::error(llvm::errs(), Checksum::ToolName)
        << "--chunk-size must be positive\n";
    return EXIT_FAILURE;
  }

  llvm::SmallVector<std::string> paths(Checksum::InputFiles.begin(),
                                       Checksum::InputFiles.end());
  if (paths.empty()) {
    paths.push_back("-");
  }

  Checksum::Md5SumOptions options = {.tool_name = Checksum::ToolName,
                                     .chunk_size = Checksum::ChunkSize,
                                     .quiet = Checksum::Quiet,
                                     .status = Checksum::Status,
                                     .verbose = Checksum::Verbose};
  bool success =
      Checksum::CheckMode
          ? Checksum::Md5CheckSums(paths, options, llvm::outs(), llvm::errs())
          : Checksum::Md5PrintSums(paths, options, llvm::outs(), llvm::errs());
  return success ? EXIT_SUCCESS : EXIT_FAILURE;
}
