#include <array>
#include <cstdlib>
#include <expected>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <libs/cli/struct_args.hpp>
#include <libs/zorder/bmi2.hpp>
#include <libs/zorder/dispatch.hpp>
#include <libs/zorder/zorder.hpp>

namespace {

struct opts {
  unsigned width = args::option<unsigned>{"-w", "--width", "Coordinate width in bits: 8, 16, 32, 64 or 128"}
                       .default_value(32);
  std::optional<size_t> dims = args::option<std::optional<size_t>>{
      "-n", "--dims", "Number of dimensions, defaults to the coordinate count or 2 for decoding"
  };
  std::vector<std::string_view> coords = args::option<std::vector<std::string_view>>{
      "-c", "--coord", "Coordinate to encode, repeat once per axis"
  };
  std::optional<std::string_view> index =
      args::option<std::optional<std::string_view>>{"-i", "--index", "Z-order index to decode"};
};

constexpr std::string_view flags_help = "\t--bmi2\tUse BMI2 bit deposit/extract instructions\n"
                                        "\t--probe\tReport if the CPU supports BMI2 instructions\n"
                                        "\t--demo\tConvert a few 3D points back and forth\n"
                                        "\t-h\tPrint this help\n";

void setup_logger() {
  auto term = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(spdlog::color_mode::automatic);
  spdlog::default_logger()->sinks() = {term};
  spdlog::cfg::load_env_levels();
}

template <typename T>
T value_or_throw(std::expected<T, std::error_code> res, std::string_view what) {
  if (!res)
    throw std::system_error{res.error(), std::string{what}};
  return std::move(res).value();
}

void print_demo(std::optional<zorder::bmi2::support_token> token) {
  constexpr std::array<std::array<uint8_t, 3>, 5> points = {{
      {0, 0, 0},
      {1, 0, 1},
      {2, 2, 2},
      {3, 16, 128},
      {255, 255, 255},
  }};

  fmt::print("Software implementation:\n");
  for (const auto& pt : points) {
    const uint32_t idx = zorder::encode(pt);
    const auto back = zorder::decode<3>(idx);
    fmt::print("[{}] => {:032b} => [{}]\n", fmt::join(pt, ", "), idx, fmt::join(back, ", "));
  }

  if (!token)
    return;

  fmt::print("\nBMI2 implementation:\n");
  for (const auto& pt : points) {
    const uint32_t idx = zorder::bmi2::encode(pt, token.value());
    const auto back = zorder::bmi2::decode<3>(idx, token.value());
    fmt::print("[{}] => {:032b} => [{}]\n", fmt::join(pt, ", "), idx, fmt::join(back, ", "));
  }
}

int run(const opts& opt, std::optional<zorder::bmi2::support_token> token) {
  const auto width = value_or_throw(zorder::width_from_bits(opt.width), fmt::format("--width {}", opt.width));

  if (opt.coords.empty() && !opt.index) {
    spdlog::error("Nothing to convert, specify coordinates with -c or an index with -i");
    return EXIT_FAILURE;
  }

  if (!opt.coords.empty()) {
    std::vector<zorder::uint128_t> coords;
    coords.reserve(opt.coords.size());
    for (std::string_view text : opt.coords)
      coords.push_back(value_or_throw(zorder::parse_scalar(text), fmt::format("--coord {}", text)));

    const auto conv = value_or_throw(
        zorder::converter::create(width, opt.dims.value_or(coords.size()), token),
        fmt::format("{} dimensions of {} bits", opt.dims.value_or(coords.size()), opt.width)
    );
    const auto idx = value_or_throw(conv.encode(coords), "encode");
    fmt::print("[{}] => {:#0{}b} ({})\n", fmt::join(coords, ", "), idx, conv.index_bits() + 2, idx);
  }

  if (opt.index) {
    const std::string_view text = opt.index.value();
    const auto idx = value_or_throw(zorder::parse_scalar(text), fmt::format("--index {}", text));
    const auto conv = value_or_throw(
        zorder::converter::create(width, opt.dims.value_or(2), token),
        fmt::format("{} dimensions of {} bits", opt.dims.value_or(2), opt.width)
    );
    const auto coords = value_or_throw(conv.decode(idx), "decode");
    fmt::print("{:#0{}b} => [{}]\n", idx, conv.index_bits() + 2, fmt::join(coords, ", "));
  }
  return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
  setup_logger();

  std::span<char*> args{argv, static_cast<size_t>(argc)};
  if (get_flag(args, "-h")) {
    args::usage<opts>(args.front(), std::cout);
    std::cout << '\n';
    args::args_help<opts>(std::cout);
    std::cout << flags_help;
    return EXIT_SUCCESS;
  }
  const bool use_bmi2 = get_flag(args, "--bmi2");
  const bool probe = get_flag(args, "--probe");
  const bool demo = get_flag(args, "--demo");

  try {
    const auto opt = args::parse<opts>(args);

    if (probe) {
      fmt::print(
          "BMI2 bit deposit/extract instructions are {}\n",
          zorder::bmi2::has_hardware_support() ? "supported" : "not supported"
      );
      return EXIT_SUCCESS;
    }

    std::optional<zorder::bmi2::support_token> token;
    if (use_bmi2) {
      token = zorder::bmi2::support_token::acquire();
      if (!token)
        throw std::system_error{make_error_code(zorder::errc::no_hardware_support), "--bmi2"};
    }

    if (demo) {
      print_demo(use_bmi2 ? token : zorder::bmi2::support_token::acquire());
      return EXIT_SUCCESS;
    }

    return run(opt, token);
  } catch (const std::exception& err) {
    spdlog::error("{}", err.what());
    return EXIT_FAILURE;
  }
}
