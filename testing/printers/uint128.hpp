#pragma once

#include <cstdint>
#include <string>

#include <catch2/catch.hpp>

#include <fmt/format.h>

#include <libs/zorder/bits.hpp>

namespace test {

// There are no 128 bit integer literals.
constexpr zorder::uint128_t u128(uint64_t hi, uint64_t lo) noexcept {
  return (zorder::uint128_t{hi} << 64) | lo;
}

} // namespace test

namespace Catch {

template <>
struct StringMaker<zorder::uint128_t> {
  static std::string convert(zorder::uint128_t val) { return fmt::format("{:#x}", val); }
};

} // namespace Catch
