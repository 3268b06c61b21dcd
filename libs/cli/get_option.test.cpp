#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <catch2/catch.hpp>

#include <libs/cli/get_option.hpp>

namespace test {

using namespace std::literals;

using arg_views = std::vector<std::string_view>;

TEST_CASE("get_option") {
  char arg0[] = "zconv";
  char arg1[] = "-c";
  char arg2[] = "3";
  char arg3[] = "-w";
  char arg4[] = "16";
  char arg5[] = "-c";
  char arg6[] = "7";
  char* args_arr[] = {arg0, arg1, arg2, arg3, arg4, arg5, arg6};
  std::span<char*> args = args_arr;

  SECTION("returns nullptr when there is no requested option") { REQUIRE(get_option(args, "-i") == nullptr); }
  SECTION("returns nullptr for empty option name") { REQUIRE(get_option(args, "") == nullptr); }
  SECTION("returns requested option value") { REQUIRE(get_option(args, "-w") == "16"sv); }
  SECTION("removes found option") {
    get_option(args, "-w");
    REQUIRE(arg_views{args.begin(), args.end()} == arg_views{"zconv", "-c", "3", "-c", "7"});
  }
  SECTION("returns repeating options preserving order") {
    arg_views coords;
    while (const char* coord = get_option(args, "-c"))
      coords.push_back(coord);
    REQUIRE(coords == arg_views{{"3"sv, "7"sv}});
    REQUIRE(arg_views{args.begin(), args.end()} == arg_views{"zconv", "-w", "16"});
  }
  SECTION("returns default value when there is no requested option") {
    REQUIRE(get_option(args, "-n", "2"sv) == "2"sv);
    REQUIRE(get_option(args, "-w", "32"sv) == "16"sv);
  }
}

TEST_CASE("get_either_option") {
  char arg0[] = "zconv";
  char arg1[] = "-c";
  char arg2[] = "1";
  char arg3[] = "--coord";
  char arg4[] = "0";
  char arg5[] = "-c";
  char arg6[] = "5";
  char* args_arr[] = {arg0, arg1, arg2, arg3, arg4, arg5, arg6};
  std::span<char*> args = args_arr;

  SECTION("returns values of both spellings in command line order") {
    arg_views coords;
    while (const char* coord = get_either_option(args, "--coord", "-c"))
      coords.push_back(coord);
    REQUIRE(coords == arg_views{"1", "0", "5"});
    REQUIRE(args.size() == 1);
  }
  SECTION("empty alias matches nothing") {
    REQUIRE(get_either_option(args, "--coord", "") == "0"sv);
    REQUIRE(get_either_option(args, "--coord", "") == nullptr);
  }
  SECTION("returns nullptr when both spellings are empty") {
    REQUIRE(get_either_option(args, "", "") == nullptr);
    REQUIRE(args.size() == 7);
  }
}

TEST_CASE("get_option skips values starting with dash") {
  char arg0[] = "zconv";
  char arg1[] = "-i";
  char arg2[] = "--bmi2";
  char* args_arr[] = {arg0, arg1, arg2};
  std::span<char*> args = args_arr;

  REQUIRE(get_option(args, "-i") == nullptr);
  REQUIRE(args.size() == 3);
}

TEST_CASE("get_flag") {
  char arg0[] = "zconv";
  char arg1[] = "--bmi2";
  char arg2[] = "-c";
  char arg3[] = "1";
  char arg4[] = "--bmi2";
  char* args_arr[] = {arg0, arg1, arg2, arg3, arg4};
  std::span<char*> args = args_arr;

  SECTION("reports absent flag") {
    REQUIRE_FALSE(get_flag(args, "--probe"));
    REQUIRE(args.size() == 5);
  }
  SECTION("removes every occurence of the flag") {
    REQUIRE(get_flag(args, "--bmi2"));
    REQUIRE(arg_views{args.begin(), args.end()} == arg_views{"zconv", "-c", "1"});
  }
  SECTION("program name is never treated as a flag") {
    REQUIRE_FALSE(get_flag(args, "zconv"));
    REQUIRE(args.size() == 5);
  }
}

} // namespace test
