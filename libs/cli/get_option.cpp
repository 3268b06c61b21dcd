#include <algorithm>
#include <cassert>
#include <iterator>

#include <libs/cli/get_option.hpp>

bool get_flag(std::span<char*>& args, std::string_view flag) noexcept {
  assert(!args.empty());
  auto first = std::next(args.begin());
  auto last = args.end();
  auto fres = std::remove(first, last, flag);
  args = args.subspan(0, args.size() - std::distance(fres, last));
  return fres != last;
}

const char* get_option(std::span<char*>& args, std::string_view option) noexcept {
  return get_either_option(args, option, {});
}

const char* get_either_option(
    std::span<char*>& args, std::string_view option, std::string_view alias
) noexcept {
  assert(!args.empty());
  if (option.empty() && alias.empty())
    return nullptr;
  const auto is_option = [&](std::string_view arg) {
    return (!option.empty() && arg == option) || (!alias.empty() && arg == alias);
  };
  auto first = std::next(args.begin());
  auto last = args.end();
  auto fres = std::adjacent_find(first, last, [&](const char* opt, const char* val) {
    return is_option(opt) && val[0] != '-';
  });
  if (fres == last)
    return nullptr;
  fres = std::rotate(fres, std::next(fres, 2), last);
  args = args.subspan(0, args.size() - 2);
  return *std::next(fres);
}
