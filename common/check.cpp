// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "common/check.h"

#include <cstdlib>

#include "llvm/Support/Signals.h"

namespace Checksum::Internal {

auto ExitingStream::Done() -> void {
  llvm::errs() << buffer_.str() << "\n";
  llvm::sys::PrintStackTrace(llvm::errs());
  std::abort();
}

}  // namespace Checksum::Internal
