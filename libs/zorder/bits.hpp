#pragma once

#include <bit>
#include <cassert>
#include <climits>
#include <concepts>
#include <cstdint>

namespace zorder {

using uint128_t = unsigned __int128;

template <typename T>
concept scalar = std::same_as<T, uint8_t> || std::same_as<T, uint16_t> || std::same_as<T, uint32_t> ||
                 std::same_as<T, uint64_t> || std::same_as<T, uint128_t>;

template <scalar T>
constexpr unsigned bit_width_v = sizeof(T) * CHAR_BIT;

// Supported widths are powers of two so log2 is the count of trailing zeroes.
template <scalar T>
constexpr unsigned log2_bit_width_v = std::countr_zero(bit_width_v<T>);

template <unsigned Bits>
struct uint_of_width;

template <>
struct uint_of_width<8> {
  using type = uint8_t;
};
template <>
struct uint_of_width<16> {
  using type = uint16_t;
};
template <>
struct uint_of_width<32> {
  using type = uint32_t;
};
template <>
struct uint_of_width<64> {
  using type = uint64_t;
};
template <>
struct uint_of_width<128> {
  using type = uint128_t;
};

template <unsigned Bits>
using uint_of_width_t = typename uint_of_width<Bits>::type;

/// Value with `bits` least significant bits set.
template <scalar T>
constexpr T low_bits_mask(unsigned bits) noexcept {
  assert(bits > 0 && bits <= bit_width_v<T>);
  return static_cast<T>(static_cast<T>(~T{0}) >> (bit_width_v<T> - bits));
}

/**
 * Periodic comb used as a stage filter by interleaving and deinterleaving.
 *
 * Runs of `bits` set bits start at bit 0 and repeat every `dim * bits` bits up to the top of `T`. The last
 * run is truncated if it does not fit.
 */
template <scalar T>
constexpr T interleave_mask(unsigned dim, unsigned bits) noexcept {
  assert(dim > 0);
  const T run = low_bits_mask<T>(bits);
  T res = 0;
  for (unsigned offset = 0; offset < bit_width_v<T>; offset += dim * bits)
    res |= static_cast<T>(run << offset);
  return res;
}

constexpr unsigned interleave_shift(unsigned stage, unsigned dim) noexcept { return (dim - 1) << stage; }

} // namespace zorder
