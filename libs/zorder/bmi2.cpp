#if defined(__x86_64__)
#include <immintrin.h>
#endif

#include <utility>

#include <spdlog/spdlog.h>

#include <libs/zorder/bmi2.hpp>

namespace zorder::bmi2 {

namespace {

bool probe() noexcept {
#if defined(__x86_64__)
  __builtin_cpu_init();
  return __builtin_cpu_supports("bmi2");
#else
  return false;
#endif
}

} // namespace

bool has_hardware_support() noexcept {
  static const bool supported = [] {
    const bool res = probe();
    spdlog::debug("BMI2 bit deposit/extract instructions are {}", res ? "available" : "not available");
    return res;
  }();
  return supported;
}

std::optional<support_token> support_token::acquire() noexcept {
  if (!has_hardware_support())
    return std::nullopt;
  return support_token{};
}

namespace detail {

#if defined(__x86_64__)

__attribute__((target("bmi2"))) uint32_t deposit(uint32_t src, uint32_t mask) noexcept {
  return _pdep_u32(src, mask);
}

__attribute__((target("bmi2"))) uint64_t deposit(uint64_t src, uint64_t mask) noexcept {
  return _pdep_u64(src, mask);
}

// 128 bit scalars are handled as two 64 bit halves. Low half of the mask consumes popcount(mask_lo) low bits
// of the source, the rest goes to the high half.
__attribute__((target("bmi2"))) uint128_t deposit(uint128_t src, uint128_t mask) noexcept {
  const auto mask_lo = static_cast<uint64_t>(mask);
  const auto mask_hi = static_cast<uint64_t>(mask >> 64);
  const int lo_bits = __builtin_popcountll(mask_lo);
  const uint64_t lo = _pdep_u64(static_cast<uint64_t>(src), mask_lo);
  const uint64_t hi = _pdep_u64(static_cast<uint64_t>(src >> lo_bits), mask_hi);
  return (uint128_t{hi} << 64) | lo;
}

__attribute__((target("bmi2"))) uint32_t extract(uint32_t src, uint32_t mask) noexcept {
  return _pext_u32(src, mask);
}

__attribute__((target("bmi2"))) uint64_t extract(uint64_t src, uint64_t mask) noexcept {
  return _pext_u64(src, mask);
}

__attribute__((target("bmi2"))) uint128_t extract(uint128_t src, uint128_t mask) noexcept {
  const auto mask_lo = static_cast<uint64_t>(mask);
  const auto mask_hi = static_cast<uint64_t>(mask >> 64);
  const int lo_bits = __builtin_popcountll(mask_lo);
  const uint64_t lo = _pext_u64(static_cast<uint64_t>(src), mask_lo);
  const uint64_t hi = _pext_u64(static_cast<uint64_t>(src >> 64), mask_hi);
  return (uint128_t{hi} << lo_bits) | lo;
}

#else

// acquire() never issues a token on these targets so nothing can call the primitives.
uint32_t deposit(uint32_t, uint32_t) noexcept { std::unreachable(); }
uint64_t deposit(uint64_t, uint64_t) noexcept { std::unreachable(); }
uint128_t deposit(uint128_t, uint128_t) noexcept { std::unreachable(); }

uint32_t extract(uint32_t, uint32_t) noexcept { std::unreachable(); }
uint64_t extract(uint64_t, uint64_t) noexcept { std::unreachable(); }
uint128_t extract(uint128_t, uint128_t) noexcept { std::unreachable(); }

#endif

} // namespace detail

} // namespace zorder::bmi2
