// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CHECKSUM_COMMON_CHECK_H_
#define CHECKSUM_COMMON_CHECK_H_

#include <string>

#include "llvm/Support/raw_ostream.h"

namespace Checksum::Internal {

// Wraps a stream and exits once the stream is destroyed. Only used by the
// macros below; the `Helper` overload of `operator|` is what makes the whole
// expression `[[noreturn]]`.
class ExitingStream {
 public:
  // Internal type used in macros to dispatch to the `operator|` overload.
  struct Helper {};

  // Marks the point between the failed condition and any user message.
  struct AddSeparator {};

  ExitingStream() : buffer_(buffer_str_) {}

  ExitingStream(const ExitingStream&) = delete;
  auto operator=(const ExitingStream&) -> ExitingStream& = delete;

  auto operator<<(AddSeparator /*add_separator*/) -> ExitingStream& {
    separator_ = true;
    return *this;
  }

  template <typename T>
  auto operator<<(const T& message) -> ExitingStream& {
    if (separator_) {
      buffer_ << ": ";
      separator_ = false;
    }
    buffer_ << message;
    return *this;
  }

  // Low-precedence binary operator overload used in check.h macros to flush
  // the output and exit the program. We do this in a binary operator rather
  // than the destructor to ensure good debug info and backtraces for errors.
  [[noreturn]] friend auto operator|(Helper /*helper*/, ExitingStream& stream)
      -> void {
    stream.Done();
  }

 private:
  [[noreturn]] auto Done() -> void;

  // Whether a separator should be printed if << is used again.
  bool separator_ = false;

  std::string buffer_str_;
  llvm::raw_string_ostream buffer_;
};

}  // namespace Checksum::Internal

// Raw exiting stream. This should be used when building forms of exiting
// macros. It evaluates to a special object that can be streamed into, and the
// stream is printed and the program aborted once the full expression ends.
#define CHECKSUM_CHECK_INTERNAL_STREAM()            \
  Checksum::Internal::ExitingStream::Helper() |     \
      Checksum::Internal::ExitingStream()

// Checks the given condition, and if it's false, prints an error and aborts.
//
// For example:
//   CHECKSUM_CHECK(is_valid) << "Data is not valid!";
#define CHECKSUM_CHECK(condition)                                     \
  (condition) ? (void)0                                               \
              : CHECKSUM_CHECK_INTERNAL_STREAM()                      \
                    << "CHECK failure at " << __FILE__ << ":"         \
                    << __LINE__ << ": " #condition                    \
                    << Checksum::Internal::ExitingStream::AddSeparator()

// DCHECK calls CHECK in debug mode, and does nothing otherwise. The condition
// is still type-checked in release builds but never evaluated.
#ifndef NDEBUG
#define CHECKSUM_DCHECK(condition) CHECKSUM_CHECK(condition)
#else
#define CHECKSUM_DCHECK(condition) CHECKSUM_CHECK(true || (condition))
#endif

// This is similar to CHECK, but is unconditional. Writing
// `CHECKSUM_FATAL() << "message"` clearly documents that the code path is
// unreachable.
#define CHECKSUM_FATAL()                                              \
  CHECKSUM_CHECK_INTERNAL_STREAM() << "FATAL failure at " << __FILE__ \
                                   << ":" << __LINE__ << ": "

#endif  // CHECKSUM_COMMON_CHECK_H_
