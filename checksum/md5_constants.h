// Part of the Checksum project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef CHECKSUM_CHECKSUM_MD5_CONSTANTS_H_
#define CHECKSUM_CHECKSUM_MD5_CONSTANTS_H_

#include <array>
#include <cstdint>

namespace Checksum {

// MD5 consumes its message in blocks of this many bytes.
inline constexpr int Md5BlockSize = 64;

// Offset within the final block where the 64-bit message length is stored.
inline constexpr int Md5LengthOffset = Md5BlockSize - 8;

// The chaining value carried from block to block: the words A, B, C and D.
using Md5ChainingValue = std::array<uint32_t, 4>;

// Chaining value before any block has been processed, from RFC 1321 section
// 3.3. Written as integers, so the byte sequence 01 23 45 67 ... of the RFC
// appears reversed.
inline constexpr Md5ChainingValue Md5InitialChainingValue = {
    0x67452301,
    0xefcdab89,
    0x98badcfe,
    0x10325476,
};

// Per-step additive constants. Entry `i` is the integer part of
// `abs(sin(i + 1)) * 2^32`, with `sin` taken in radians. The initializers here
// can be generated with the following shell script:
//
// ```sh
// gawk 'BEGIN { for (i = 1; i <= 64; ++i) {
//   s = sin(i); if (s < 0) s = -s; printf("0x%08x,\n", int(s * 2^32)) } }'
// ```
inline constexpr std::array<uint32_t, 64> Md5RoundConstants = {
    0xd76aa478, 0xe8c7b756, 0x242070db, 0xc1bdceee,  //
    0xf57c0faf, 0x4787c62a, 0xa8304613, 0xfd469501,  //
    0x698098d8, 0x8b44f7af, 0xffff5bb1, 0x895cd7be,  //
    0x6b901122, 0xfd987193, 0xa679438e, 0x49b40821,  //
    0xf61e2562, 0xc040b340, 0x265e5a51, 0xe9b6c7aa,  //
    0xd62f105d, 0x02441453, 0xd8a1e681, 0xe7d3fbc8,  //
    0x21e1cde6, 0xc33707d6, 0xf4d50d87, 0x455a14ed,  //
    0xa9e3e905, 0xfcefa3f8, 0x676f02d9, 0x8d2a4c8a,  //
    0xfffa3942, 0x8771f681, 0x6d9d6122, 0xfde5380c,  //
    0xa4beea44, 0x4bdecfa9, 0xf6bb4b60, 0xbebfbc70,  //
    0x289b7ec6, 0xeaa127fa, 0xd4ef3085, 0x04881d05,  //
    0xd9d4d039, 0xe6db99e5, 0x1fa27cf8, 0xc4ac5665,  //
    0xf4292244, 0x432aff97, 0xab9423a7, 0xfc93a039,  //
    0x655b59c3, 0x8f0ccc92, 0xffeff47d, 0x85845dd1,  //
    0x6fa87e4f, 0xfe2ce6e0, 0xa3014314, 0x4e0811a1,  //
    0xf7537e82, 0xbd3af235, 0x2ad7d2bb, 0xeb86d391,  //
};

// Left-rotation amounts, indexed by round and then by step modulo 4. Each
// round cycles through its four amounts four times.
inline constexpr std::array<std::array<int, 4>, 4> Md5RoundShifts = {{
    {7, 12, 17, 22},
    {5, 9, 14, 20},
    {4, 11, 16, 23},
    {6, 10, 15, 21},
}};

}  // namespace Checksum

#endif  // CHECKSUM_CHECKSUM_MD5_CONSTANTS_H_
