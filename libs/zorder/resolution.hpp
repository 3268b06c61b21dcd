#pragma once

#include <cstddef>
#include <initializer_list>

#include <libs/zorder/bits.hpp>

namespace zorder {

inline constexpr size_t max_dimensions = 16;

namespace detail {

// clang-format off
// Rows are 8, 16, 32 and 64 bit coordinates, columns are dimension counts. Zero marks a combination whose
// interleaved form does not fit any supported scalar.
inline constexpr unsigned output_widths[4][max_dimensions + 1] = {
  // 0  1    2    3    4    5    6    7    8    9   10   11   12   13   14   15   16
  {0, 0,  16,  32,  32,  64,  64,  64,  64, 128, 128, 128, 128, 128, 128, 128, 128},
  {0, 0,  32,  64,  64, 128, 128, 128, 128,   0,   0,   0,   0,   0,   0,   0,   0},
  {0, 0,  64, 128, 128,   0,   0,   0,   0,   0,   0,   0,   0,   0,   0,   0,   0},
  {0, 0, 128,   0,   0,   0,   0,   0,   0,   0,   0,   0,   0,   0,   0,   0,   0},
};
// clang-format on

} // namespace detail

/// Bit width of the smallest scalar holding `dim` interleaved `width`-bit coordinates or 0 if there is none.
constexpr unsigned output_bit_width(unsigned width, size_t dim) noexcept {
  if (dim > max_dimensions)
    return 0;
  switch (width) {
  case 8:
    return detail::output_widths[0][dim];
  case 16:
    return detail::output_widths[1][dim];
  case 32:
    return detail::output_widths[2][dim];
  case 64:
    return detail::output_widths[3][dim];
  }
  return 0;
}

/// Widest coordinate bit width which resolves to `out_width` for `dim` dimensions or 0 if there is none.
constexpr unsigned coordinate_bit_width(unsigned out_width, size_t dim) noexcept {
  for (unsigned width : {64u, 32u, 16u, 8u}) {
    if (output_bit_width(width, dim) == out_width)
      return width;
  }
  return 0;
}

template <typename T, size_t N>
concept interleavable = scalar<T> && output_bit_width(bit_width_v<T>, N) != 0;

template <typename U, size_t N>
concept deinterleavable = scalar<U> && coordinate_bit_width(bit_width_v<U>, N) != 0;

template <scalar T, size_t N>
  requires interleavable<T, N>
using interleave_output_t = uint_of_width_t<output_bit_width(bit_width_v<T>, N)>;

template <scalar U, size_t N>
  requires deinterleavable<U, N>
using coordinate_t = uint_of_width_t<coordinate_bit_width(bit_width_v<U>, N)>;

} // namespace zorder
