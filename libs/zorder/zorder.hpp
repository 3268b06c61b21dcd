#pragma once

#include <array>
#include <concepts>
#include <cstddef>

#include <libs/zorder/bits.hpp>
#include <libs/zorder/interleave.hpp>
#include <libs/zorder/resolution.hpp>

namespace zorder {

/**
 * Z-order curve index of the point `coords`.
 *
 * Bits of axis `i` land at positions i, i + N, i + 2N, ... of the smallest scalar able to hold all of them.
 */
template <scalar T, size_t N>
  requires interleavable<T, N>
constexpr interleave_output_t<T, N> encode(const std::array<T, N>& coords) noexcept {
  using out_t = interleave_output_t<T, N>;
  out_t res = 0;
  for (size_t i = 0; i < N; ++i)
    res |= static_cast<out_t>(interleave<N>(coords[i]) << i);
  return res;
}

template <scalar T, std::same_as<T>... Ts>
  requires interleavable<T, sizeof...(Ts) + 1>
constexpr auto encode(T x, Ts... rest) noexcept {
  return encode(std::array<T, sizeof...(Ts) + 1>{x, rest...});
}

/// Point with the index `index` on the curve of `T` coordinates.
template <scalar T, size_t N>
  requires interleavable<T, N>
constexpr std::array<T, N> decode(interleave_output_t<T, N> index) noexcept {
  std::array<T, N> res;
  for (size_t i = 0; i < N; ++i)
    res[i] = deinterleave<T, N>(index, static_cast<unsigned>(i));
  return res;
}

/**
 * Point with the index `index` on the N-dimensional curve.
 *
 * The dimension count can't be deduced from the index value: 16 bit 2-D points and 8 bit 4-D points both use
 * 32 bit indexes. Coordinate type is the widest one which resolves to `U` for `N` dimensions.
 */
template <size_t N, scalar U>
  requires deinterleavable<U, N>
constexpr std::array<coordinate_t<U, N>, N> decode(U index) noexcept {
  return decode<coordinate_t<U, N>, N>(index);
}

} // namespace zorder
