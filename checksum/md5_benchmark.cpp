// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include <benchmark/benchmark.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>

#include "absl/random/random.h"
#include "checksum/md5.h"
#include "common/check.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/MD5.h"

namespace Checksum::Testing {
namespace {

// Large enough for the biggest message benchmarked below. Every iteration
// hashes a prefix of the same pool, so after the first iteration the input is
// warm in cache and the benchmark measures compression rather than memory.
constexpr int EntropySize = 1 << 20;

static const llvm::ArrayRef<std::byte> EntropyBytes =
    []() -> llvm::ArrayRef<std::byte> {
  static llvm::SmallVector<std::byte> bytes;
  bytes.resize(EntropySize);
  absl::BitGen gen;
  for (std::byte& b : bytes) {
    b = static_cast<std::byte>(absl::Uniform<uint8_t>(gen));
  }
  return bytes;
}();

struct Md5OneShot {
  auto operator()(llvm::ArrayRef<std::byte> bytes) -> Md5Digest {
    return Md5Hasher::Hash(bytes);
  }
};

// LLVM's implementation of the same algorithm, as a baseline.
struct LLVMOneShot {
  auto operator()(llvm::ArrayRef<std::byte> bytes) -> std::array<uint8_t, 16> {
    return llvm::MD5::hash(llvm::ArrayRef<uint8_t>(
        reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()));
  }
};

template <typename Hasher>
void BM_Hash(benchmark::State& state) {
  llvm::ArrayRef<std::byte> message = EntropyBytes.take_front(state.range(0));
  Hasher h;
  for (auto _ : state) {
    benchmark::DoNotOptimize(h(message));
  }
  state.SetBytesProcessed(state.iterations() * message.size());
}

BENCHMARK(BM_Hash<Md5OneShot>)->RangeMultiplier(4)->Range(1, EntropySize);
BENCHMARK(BM_Hash<LLVMOneShot>)->RangeMultiplier(4)->Range(1, EntropySize);

// Hashes the whole entropy pool in pieces of `state.range(0)` bytes, the way a
// file is hashed one read at a time.
void BM_Streaming(benchmark::State& state) {
  int64_t chunk_size = state.range(0);
  for (auto _ : state) {
    Md5Hasher hasher;
    llvm::ArrayRef<std::byte> remaining = EntropyBytes;
    while (!remaining.empty()) {
      int64_t size =
          std::min<int64_t>(chunk_size, static_cast<int64_t>(remaining.size()));
      llvm::Error error = hasher.Update(remaining.take_front(size));
      CHECKSUM_CHECK(!error) << "Update failed while benchmarking!";
      remaining = remaining.drop_front(size);
    }
    llvm::Expected<Md5Digest> digest = hasher.Finalize();
    CHECKSUM_CHECK(static_cast<bool>(digest))
        << "Finalize failed while benchmarking!";
    benchmark::DoNotOptimize(*digest);
  }
  state.SetBytesProcessed(state.iterations() * EntropyBytes.size());
}

BENCHMARK(BM_Streaming)->Arg(1)->Arg(13)->Arg(64)->Arg(100)->Arg(4096)->Arg(
    64 << 10);

}  // namespace
}  // namespace Checksum::Testing

BENCHMARK_MAIN();
