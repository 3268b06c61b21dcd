#pragma once

#include <expected>
#include <string>
#include <system_error>
#include <type_traits>

#include <catch2/catch.hpp>

#include <testing/printers/expected.hpp>

template <typename T, typename E>
class expected_matcher : public Catch::MatcherBase<std::expected<T, E>> {
public:
  explicit expected_matcher(const T& val) : expectation_{val} {}

  bool match(const std::expected<T, E>& val) const override { return val && val.value() == expectation_; }

  std::string describe() const override {
    return "contains expected value equals: " + Catch::Detail::stringify(expectation_);
  }

private:
  T expectation_;
};

template <typename T, typename E>
class unexpected_matcher : public Catch::MatcherBase<std::expected<T, E>> {
public:
  explicit unexpected_matcher(const E& err) : error_{err} {}

  bool match(const std::expected<T, E>& val) const override { return !val && val.error() == error_; }

  std::string describe() const override { return "contains error: " + Catch::Detail::stringify(error_); }

private:
  E error_;
};

template <typename T, typename E = std::error_code>
auto is_expected(const T& val) {
  return expected_matcher<T, E>(val);
}

template <typename T, typename E = std::error_code>
auto is_unexpected(const std::type_identity_t<E>& err) {
  return unexpected_matcher<T, E>(err);
}
