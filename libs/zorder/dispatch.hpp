#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

#include <libs/zorder/bits.hpp>
#include <libs/zorder/bmi2.hpp>

namespace zorder {

enum class errc : int {
  unsupported_width = 1,
  unsupported_dimensions,
  dimension_mismatch,
  coordinate_out_of_range,
  index_out_of_range,
  invalid_number,
  number_too_large,
  no_hardware_support
};

const std::error_category& zorder_category() noexcept;

inline std::error_code make_error_code(errc c) noexcept { return {static_cast<int>(c), zorder_category()}; }

/// Coordinate scalar kinds known at runtime.
enum class width : unsigned { u8 = 8, u16 = 16, u32 = 32, u64 = 64, u128 = 128 };

std::expected<width, std::error_code> width_from_bits(unsigned bits) noexcept;

/// Parses decimal, `0x` prefixed hexadecimal or `0b` prefixed binary unsigned number.
std::expected<uint128_t, std::error_code> parse_scalar(std::string_view text) noexcept;

namespace detail {

struct codec {
  unsigned index_bits = 0;
  uint128_t (*encode)(std::span<const uint128_t> coords) noexcept = nullptr;
  void (*decode)(uint128_t index, std::span<uint128_t> coords) noexcept = nullptr;
  uint128_t (*encode_bmi2)(std::span<const uint128_t> coords, bmi2::support_token token) noexcept = nullptr;
  void (*decode_bmi2)(uint128_t index, std::span<uint128_t> coords, bmi2::support_token token) noexcept =
      nullptr;
};

} // namespace detail

/**
 * Conversions for width and dimension count chosen at runtime.
 *
 * Typed encode/decode instantiation for the requested combination is looked up once on creation. Coordinates
 * and indexes are passed as 128 bit values and checked against the chosen widths on every call.
 */
class converter {
public:
  static std::expected<converter, std::error_code> create(
      width coord_width, size_t dim, std::optional<bmi2::support_token> token = std::nullopt
  ) noexcept;

  [[nodiscard]] size_t dimensions() const noexcept { return dim_; }
  [[nodiscard]] width coordinate_width() const noexcept { return width_; }
  [[nodiscard]] unsigned index_bits() const noexcept { return codec_->index_bits; }
  [[nodiscard]] bool accelerated() const noexcept { return token_.has_value(); }

  std::expected<uint128_t, std::error_code> encode(std::span<const uint128_t> coords) const noexcept;
  std::expected<std::vector<uint128_t>, std::error_code> decode(uint128_t index) const;

private:
  converter(
      width coord_width, size_t dim, const detail::codec& codec, std::optional<bmi2::support_token> token
  ) noexcept
      : width_{coord_width}, dim_{dim}, codec_{&codec}, token_{token} {}

private:
  width width_;
  size_t dim_;
  const detail::codec* codec_;
  std::optional<bmi2::support_token> token_;
};

} // namespace zorder

namespace std {
template <>
struct is_error_code_enum<zorder::errc> : std::true_type {};
} // namespace std
