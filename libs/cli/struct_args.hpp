#pragma once

#include <charconv>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

#include <libs/cli/get_option.hpp>

namespace args {

namespace detail {

struct option_info {
  std::string_view long_name;
  std::string_view short_name;
  std::string_view description;
};

struct parser_iface {
  virtual const char* get_option(const option_info& opt) = 0;
  virtual const char* get_required_option(const option_info& opt) = 0;
};

inline parser_iface* current_parser = nullptr;

// Makes `p` the parser of option fields for the lifetime of the scope.
class parser_scope {
public:
  explicit parser_scope(parser_iface& p) noexcept { current_parser = &p; }
  ~parser_scope() { current_parser = nullptr; }

  parser_scope(const parser_scope&) = delete;
  parser_scope& operator=(const parser_scope&) = delete;
};

class arguments_parser : public parser_iface {
public:
  arguments_parser(std::span<char*> args) : args_{args} {}

  const char* get_option(const option_info& opt) override {
    return ::get_either_option(args_, opt.long_name, opt.short_name);
  }

  const char* get_required_option(const option_info& opt) override {
    const char* val = get_option(opt);
    if (!val)
      missing_opts_.push_back(opt.long_name);
    return val;
  }

  void check_all_consumed() const {
    if (!missing_opts_.empty())
      throw std::invalid_argument{fmt::format("Missing required options: {}", fmt::join(missing_opts_, ", "))};
    if (args_.size() > 1)
      throw std::invalid_argument{fmt::format("Unexpected argument: {}", args_[1])};
  }

private:
  std::span<char*> args_;
  std::vector<std::string_view> missing_opts_;
};

class args_help_parser : public parser_iface {
public:
  args_help_parser(std::ostream& out) noexcept : out_{out} {}

  const char* get_option(const option_info& opt) override {
    out_ << '\t' << opt.long_name << (opt.short_name.empty() ? "" : ", ") << opt.short_name << " VAL\t"
         << opt.description << '\n';
    return nullptr;
  }

  const char* get_required_option(const option_info& opt) override { return get_option(opt); }

private:
  std::ostream& out_;
};

class usage_parser : public parser_iface {
public:
  usage_parser(std::ostream& out) noexcept : out_{out} {}

  const char* get_option(const option_info& opt) override {
    out_ << " [" << (opt.short_name.empty() ? opt.long_name : opt.short_name) << " VAL]";
    return nullptr;
  }
  const char* get_required_option(const option_info& opt) override {
    out_ << ' ' << (opt.short_name.empty() ? opt.long_name : opt.short_name) << " VAL";
    return nullptr;
  }

private:
  std::ostream& out_;
};

template <typename T>
T parse_value(const option_info& opt, const char* val) {
  if constexpr (std::is_arithmetic_v<T>) {
    const std::string_view str{val};
    T res{};
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{})
      throw std::system_error{std::make_error_code(ec), fmt::format("{} {}", opt.long_name, str)};
    if (ptr != str.data() + str.size())
      throw std::system_error{
          std::make_error_code(std::errc::invalid_argument), fmt::format("{} {}", opt.long_name, str)
      };
    return res;
  } else {
    return T{val};
  }
}

class named_option {
public:
  named_option(const char* long_name, const char* description)
      : info_{.long_name = long_name, .short_name = {}, .description = description} {}

  named_option(const char* short_name, const char* long_name, const char* description)
      : info_{.long_name = long_name, .short_name = short_name, .description = description} {}

protected:
  option_info info_;
};

} // namespace detail

template <typename T>
class option : private detail::named_option {
public:
  using detail::named_option::named_option;

  option& default_value(const T& val) {
    default_ = val;
    return *this;
  }

  operator T() const {
    const char* val = default_ ? detail::current_parser->get_option(info_)
                               : detail::current_parser->get_required_option(info_);
    return val ? detail::parse_value<T>(info_, val) : default_.value_or(T{});
  }

private:
  std::optional<T> default_;
};

template <typename T>
class option<std::optional<T>> : private detail::named_option {
public:
  using detail::named_option::named_option;

  operator std::optional<T>() const {
    const char* val = detail::current_parser->get_option(info_);
    if (!val)
      return std::nullopt;
    return detail::parse_value<T>(info_, val);
  }
};

// Option which may be repeated, every value is collected in the order of appearance.
template <typename T>
class option<std::vector<T>> : private detail::named_option {
public:
  using detail::named_option::named_option;

  operator std::vector<T>() const {
    std::vector<T> res;
    while (const char* val = detail::current_parser->get_option(info_))
      res.push_back(detail::parse_value<T>(info_, val));
    return res;
  }
};

/// Fills `T` from `args` throwing std::invalid_argument on missing or unknown options.
template <typename T>
T parse(std::span<char*> args) {
  detail::arguments_parser p{args};
  detail::parser_scope scope{p};
  T res{};
  p.check_all_consumed();
  return res;
}

template <typename T>
void args_help(std::ostream& out) {
  detail::args_help_parser p{out};
  detail::parser_scope scope{p};
  T{};
}

template <typename T>
void usage(std::string_view progname, std::ostream& out) {
  out << "Usage: " << progname;
  detail::usage_parser p{out};
  {
    detail::parser_scope scope{p};
    T{};
  }
  out << '\n';
}

} // namespace args
