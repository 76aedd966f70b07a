// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CHECKSUM_COMMON_OSTREAM_H_
#define CHECKSUM_COMMON_OSTREAM_H_

#include <ostream>

#include "llvm/Support/Compiler.h"
#include "llvm/Support/raw_os_ostream.h"
#include "llvm/Support/raw_ostream.h"

namespace Checksum {

// CRTP base class for printable types. Children (DerivedT) must implement:
// - auto Print(llvm::raw_ostream& out) const -> void
template <typename DerivedT>
class Printable {
  // Provides simple printing for debuggers.
  LLVM_DUMP_METHOD void Dump() const {
    static_cast<const DerivedT*>(this)->Print(llvm::errs());
  }

  // Supports printing to llvm::raw_ostream.
  friend auto operator<<(llvm::raw_ostream& out, const DerivedT& obj)
      -> llvm::raw_ostream& {
    obj.Print(out);
    return out;
  }

  // Supports printing to std::ostream.
  friend auto operator<<(std::ostream& out, const DerivedT& obj)
      -> std::ostream& {
    llvm::raw_os_ostream raw_os(out);
    obj.Print(raw_os);
    return out;
  }

  // Allows GoogleTest and GoogleMock to print pretty errors.
  friend auto PrintTo(const DerivedT& obj, std::ostream* out) -> void {
    *out << obj;
  }
};

}  // namespace Checksum

#endif  // CHECKSUM_COMMON_OSTREAM_H_
