#include <algorithm>
#include <array>
#include <bit>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include <libs/zorder/dispatch.hpp>
#include <libs/zorder/resolution.hpp>
#include <libs/zorder/zorder.hpp>

namespace zorder {

namespace {

template <scalar T, size_t N>
std::array<T, N> narrow(std::span<const uint128_t> coords) noexcept {
  std::array<T, N> res;
  std::ranges::transform(coords, res.begin(), [](uint128_t c) { return static_cast<T>(c); });
  return res;
}

template <scalar T, size_t N>
uint128_t encode_sw(std::span<const uint128_t> coords) noexcept {
  return zorder::encode(narrow<T, N>(coords));
}

template <scalar T, size_t N>
void decode_sw(uint128_t index, std::span<uint128_t> coords) noexcept {
  std::ranges::copy(zorder::decode<T, N>(static_cast<interleave_output_t<T, N>>(index)), coords.begin());
}

template <scalar T, size_t N>
uint128_t encode_hw(std::span<const uint128_t> coords, bmi2::support_token token) noexcept {
  return bmi2::encode(narrow<T, N>(coords), token);
}

template <scalar T, size_t N>
void decode_hw(uint128_t index, std::span<uint128_t> coords, bmi2::support_token token) noexcept {
  std::ranges::copy(bmi2::decode<T, N>(static_cast<interleave_output_t<T, N>>(index), token), coords.begin());
}

template <scalar T, size_t N>
constexpr detail::codec make_codec() noexcept {
  if constexpr (interleavable<T, N>) {
    return {
        .index_bits = output_bit_width(bit_width_v<T>, N),
        .encode = &encode_sw<T, N>,
        .decode = &decode_sw<T, N>,
        .encode_bmi2 = &encode_hw<T, N>,
        .decode_bmi2 = &decode_hw<T, N>,
    };
  } else {
    return {};
  }
}

using codecs_row = std::array<detail::codec, max_dimensions + 1>;

template <scalar T, size_t... Ns>
constexpr codecs_row make_row(std::index_sequence<Ns...>) noexcept {
  return {make_codec<T, Ns>()...};
}

using all_dims = std::make_index_sequence<max_dimensions + 1>;

// Indexed by [log2(width) - 3][dim]. Gaps of the resolution table are left with null functions.
constexpr std::array<codecs_row, 5> codecs = {
    make_row<uint8_t>(all_dims{}),  make_row<uint16_t>(all_dims{}),  make_row<uint32_t>(all_dims{}),
    make_row<uint64_t>(all_dims{}), make_row<uint128_t>(all_dims{}),
};

} // namespace

const std::error_category& zorder_category() noexcept {
  static const struct : std::error_category {
    const char* name() const noexcept override { return "zorder"; }
    std::string message(int cond) const override {
      switch (static_cast<errc>(cond)) {
      case errc::unsupported_width:
        return "Coordinate width must be one of 8, 16, 32, 64 or 128 bits";
      case errc::unsupported_dimensions:
        return "Interleaved coordinates do not fit into 128 bits";
      case errc::dimension_mismatch:
        return "Number of coordinates differs from the dimension count";
      case errc::coordinate_out_of_range:
        return "Coordinate does not fit into the coordinate width";
      case errc::index_out_of_range:
        return "Index does not fit into the index width";
      case errc::invalid_number:
        return "Invalid unsigned number";
      case errc::number_too_large:
        return "Number does not fit into 128 bits";
      case errc::no_hardware_support:
        return "CPU does not support BMI2 instructions";
      }
      return "unknown zorder error " + std::to_string(cond);
    }
  } instance;
  return instance;
}

std::expected<width, std::error_code> width_from_bits(unsigned bits) noexcept {
  switch (bits) {
  case 8:
    return width::u8;
  case 16:
    return width::u16;
  case 32:
    return width::u32;
  case 64:
    return width::u64;
  case 128:
    return width::u128;
  }
  return std::unexpected{make_error_code(errc::unsupported_width)};
}

std::expected<uint128_t, std::error_code> parse_scalar(std::string_view text) noexcept {
  unsigned base = 10;
  if (text.starts_with("0x") || text.starts_with("0X")) {
    base = 16;
    text.remove_prefix(2);
  } else if (text.starts_with("0b") || text.starts_with("0B")) {
    base = 2;
    text.remove_prefix(2);
  }
  if (text.empty())
    return std::unexpected{make_error_code(errc::invalid_number)};

  constexpr uint128_t max = ~uint128_t{0};
  uint128_t res = 0;
  for (char ch : text) {
    unsigned digit = base;
    if (ch >= '0' && ch <= '9')
      digit = ch - '0';
    else if (ch >= 'a' && ch <= 'f')
      digit = ch - 'a' + 10;
    else if (ch >= 'A' && ch <= 'F')
      digit = ch - 'A' + 10;
    if (digit >= base)
      return std::unexpected{make_error_code(errc::invalid_number)};
    if (res > (max - digit) / base)
      return std::unexpected{make_error_code(errc::number_too_large)};
    res = res * base + digit;
  }
  return res;
}

std::expected<converter, std::error_code> converter::create(
    width coord_width, size_t dim, std::optional<bmi2::support_token> token
) noexcept {
  const unsigned bits = std::to_underlying(coord_width);
  if (!width_from_bits(bits))
    return std::unexpected{make_error_code(errc::unsupported_width)};
  if (dim > max_dimensions)
    return std::unexpected{make_error_code(errc::unsupported_dimensions)};

  const detail::codec& codec = codecs[std::countr_zero(bits) - 3][dim];
  if (codec.encode == nullptr)
    return std::unexpected{make_error_code(errc::unsupported_dimensions)};

  spdlog::debug(
      "{} codec for {} dimensions of {} bit coordinates uses {} bit indexes", token ? "BMI2" : "Software", dim,
      bits, codec.index_bits
  );
  return converter{coord_width, dim, codec, token};
}

std::expected<uint128_t, std::error_code> converter::encode(std::span<const uint128_t> coords) const noexcept {
  if (coords.size() != dim_)
    return std::unexpected{make_error_code(errc::dimension_mismatch)};
  const unsigned bits = std::to_underlying(width_);
  const auto out_of_range = [bits](uint128_t c) { return bits < bit_width_v<uint128_t> && (c >> bits) != 0; };
  if (std::ranges::any_of(coords, out_of_range))
    return std::unexpected{make_error_code(errc::coordinate_out_of_range)};

  if (token_)
    return codec_->encode_bmi2(coords, token_.value());
  return codec_->encode(coords);
}

std::expected<std::vector<uint128_t>, std::error_code> converter::decode(uint128_t index) const {
  // Only indexes encode can produce: bits above dim * width must be clear even if the index type has them.
  const auto used_bits = static_cast<unsigned>(dim_ * std::to_underlying(width_));
  if (used_bits < bit_width_v<uint128_t> && (index >> used_bits) != 0)
    return std::unexpected{make_error_code(errc::index_out_of_range)};

  std::vector<uint128_t> res(dim_);
  if (token_)
    codec_->decode_bmi2(index, res, token_.value());
  else
    codec_->decode(index, res);
  return res;
}

} // namespace zorder
