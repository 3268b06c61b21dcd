#pragma once

#include <array>
#include <cassert>
#include <cstddef>

#include <libs/zorder/bits.hpp>
#include <libs/zorder/resolution.hpp>

namespace zorder {

namespace detail {

// Comb for every doubling stage: stage_masks[s] == interleave_mask<U>(N, 1 << s).
template <scalar U, size_t N, unsigned Stages>
inline constexpr std::array<U, Stages + 1> stage_masks = [] {
  std::array<U, Stages + 1> res{};
  for (unsigned stage = 0; stage <= Stages; ++stage)
    res[stage] = interleave_mask<U>(N, 1u << stage);
  return res;
}();

} // namespace detail

/**
 * Spreads bits of `value` so that they occupy positions 0, N, 2N, ... of `U`.
 *
 * Generalization of the "interleave bits by binary magic numbers" trick: every stage moves the upper half of
 * each group of bits `(N - 1) * group / 2` positions up, so the whole spread takes log2(bit width of T)
 * shift-or-mask steps.
 */
template <scalar U, size_t N, scalar T>
  requires(N > 0 && bit_width_v<U> >= N * bit_width_v<T>)
constexpr U interleave_as(T value) noexcept {
  constexpr auto& masks = detail::stage_masks<U, N, log2_bit_width_v<T>>;
  U x = value;
  for (unsigned stage = log2_bit_width_v<T>; stage-- > 0;)
    x = static_cast<U>((x | static_cast<U>(x << interleave_shift(stage, N))) & masks[stage]);
  return x;
}

/// Gathers bits at positions lsb, lsb + N, lsb + 2N, ... of `value` into a contiguous `T`.
template <scalar T, size_t N, scalar U>
  requires(N > 0 && bit_width_v<U> >= N * bit_width_v<T>)
constexpr T deinterleave_as(U value, unsigned lsb) noexcept {
  assert(lsb < N);
  constexpr auto& masks = detail::stage_masks<U, N, log2_bit_width_v<T>>;
  U x = static_cast<U>(static_cast<U>(value >> lsb) & masks[0]);
  for (unsigned stage = 0; stage < log2_bit_width_v<T>; ++stage)
    x = static_cast<U>((x | static_cast<U>(x >> interleave_shift(stage, N))) & masks[stage + 1]);
  return static_cast<T>(x);
}

template <size_t N, scalar T>
  requires interleavable<T, N>
constexpr interleave_output_t<T, N> interleave(T value) noexcept {
  return interleave_as<interleave_output_t<T, N>, N>(value);
}

template <scalar T, size_t N>
  requires interleavable<T, N>
constexpr T deinterleave(interleave_output_t<T, N> value, unsigned lsb) noexcept {
  return deinterleave_as<T, N>(value, lsb);
}

} // namespace zorder
