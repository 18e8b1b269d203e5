#pragma once

#include <ulidkit/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ulidkit {

// GCC/Clang 128-bit unsigned integer; the identifier's native width.
using u128 = unsigned __int128;

// Crockford Base32 for the fixed widths ULIDs are built from.
//
// Encoding always emits uppercase digits of the alphabet
// 0123456789ABCDEFGHJKMNPQRSTVWXYZ. Decoding is case-insensitive and maps
// the look-alikes O -> 0 and I, L -> 1.
namespace crockford {

constexpr std::size_t kBitsPerChar = 5;

// Text widths of the layouts this codec knows about
constexpr std::size_t kTimestampChars = 10;  // 48-bit timestamp field
constexpr std::size_t kRandomChars = 16;     // 80-bit randomness field
constexpr std::size_t kU64Chars = 13;
constexpr std::size_t kU128Chars = 26;

// Appends exactly `count` digits of `value`, most significant first.
// Digits beyond the type's width are written as '0'.
void append_u64(uint64_t value, std::size_t count, std::string& out);
void append_u128(u128 value, std::size_t count, std::string& out);

std::string encode_u64(uint64_t value, std::size_t count);
std::string encode_u128(u128 value, std::size_t count);

// Parses exactly `expected_chars` digits.
//
// Errors, first problem wins:
//   InvalidLength     input.size() != expected_chars, or expected_chars is
//                     wider than the type allows (13 / 26)
//   InvalidChar       symbol outside the alphabet, with char and position
//   DataTypeOverflow  value does not fit the type; a 13-digit u64 must
//                     start with a symbol <= 7
Result<uint64_t> parse_u64(std::string_view input, std::size_t expected_chars);
Result<u128> parse_u128(std::string_view input, std::size_t expected_chars);

// 5-bit value of a symbol, or -1 if it is not a Crockford digit.
int symbol_value(char c);

} // namespace crockford
} // namespace ulidkit
