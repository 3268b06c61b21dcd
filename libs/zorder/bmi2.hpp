#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include <libs/zorder/bits.hpp>
#include <libs/zorder/resolution.hpp>

namespace zorder::bmi2 {

/// Checks if the CPU implements the BMI2 bit deposit and bit extract instructions. Probed once per process.
bool has_hardware_support() noexcept;

/**
 * Proof that BMI2 instructions are available on the current CPU.
 *
 * Token can't be created directly, only obtained from `acquire` on a CPU with BMI2 support. Once acquired it
 * can be copied and passed to any number of conversions without probing the hardware again.
 */
class support_token {
public:
  static std::optional<support_token> acquire() noexcept;

  friend constexpr bool operator==(const support_token&, const support_token&) noexcept = default;

private:
  constexpr support_token() noexcept = default;
};

namespace detail {

// Single pdep/pext instructions. Defined in a translation unit compiled for the bmi2 target so callers don't
// need to be.
uint32_t deposit(uint32_t src, uint32_t mask) noexcept;
uint64_t deposit(uint64_t src, uint64_t mask) noexcept;
uint128_t deposit(uint128_t src, uint128_t mask) noexcept;

uint32_t extract(uint32_t src, uint32_t mask) noexcept;
uint64_t extract(uint64_t src, uint64_t mask) noexcept;
uint128_t extract(uint128_t src, uint128_t mask) noexcept;

inline uint16_t deposit(uint16_t src, uint16_t mask) noexcept {
  return static_cast<uint16_t>(deposit(uint32_t{src}, uint32_t{mask}));
}

inline uint16_t extract(uint16_t src, uint16_t mask) noexcept {
  return static_cast<uint16_t>(extract(uint32_t{src}, uint32_t{mask}));
}

} // namespace detail

/// Same as zorder::encode but deposits every axis with a single BMI2 instruction.
template <scalar T, size_t N>
  requires interleavable<T, N>
interleave_output_t<T, N> encode(const std::array<T, N>& coords, support_token) noexcept {
  using out_t = interleave_output_t<T, N>;
  constexpr out_t mask = interleave_mask<out_t>(N, 1);
  out_t res = 0;
  for (size_t i = 0; i < N; ++i)
    res |= detail::deposit(static_cast<out_t>(coords[i]), static_cast<out_t>(mask << i));
  return res;
}

template <scalar T, size_t N>
  requires interleavable<T, N>
std::array<T, N> decode(interleave_output_t<T, N> index, support_token) noexcept {
  using out_t = interleave_output_t<T, N>;
  constexpr out_t mask = interleave_mask<out_t>(N, 1);
  std::array<T, N> res;
  for (size_t i = 0; i < N; ++i)
    res[i] = static_cast<T>(detail::extract(index, static_cast<out_t>(mask << i)));
  return res;
}

/// Same as zorder::decode but extracts every axis with a single BMI2 instruction.
template <size_t N, scalar U>
  requires deinterleavable<U, N>
std::array<coordinate_t<U, N>, N> decode(U index, support_token token) noexcept {
  return decode<coordinate_t<U, N>, N>(index, token);
}

} // namespace zorder::bmi2
