#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: amount.
// Settlement workflow: signed fixed-point decimal with four fractional digits
// used for every balance and transaction amount.
namespace tally::schema {

class amount final {
 public:
  using units_t = boost::multiprecision::checked_int128_t;

  static constexpr uint32_t kScale = 4;
  static constexpr int64_t kUnitsPerWhole = 10'000;
  // Every transaction id carrying the largest amount still sums inside
  // units_t.
  static constexpr std::size_t kMaxIntegralDigits = 24;

  amount() = default;

  /// Build from a count of 1/10'000 units.
  static amount from_units(const units_t& units);

  /// Build from a whole number.
  static amount from_whole(int64_t whole);

  /// Parse `[+-]digits[.digits]`; at most `kScale` fractional digits and
  /// `kMaxIntegralDigits` integral digits. Input must already be trimmed.
  static std::optional<amount> try_parse(std::string_view text);

  const units_t& units() const { return units_; }
  bool is_negative() const { return units_ < 0; }
  bool is_zero() const { return units_ == 0; }

  /// Canonical form with exactly `kScale` fractional digits, e.g. `-1.5000`.
  std::string str() const;

  amount& operator+=(const amount& other);
  amount& operator-=(const amount& other);

  friend amount operator+(amount lhs, const amount& rhs) { return lhs += rhs; }
  friend amount operator-(amount lhs, const amount& rhs) { return lhs -= rhs; }

  friend bool operator==(const amount& lhs, const amount& rhs) {
    return lhs.units_ == rhs.units_;
  }
  friend bool operator!=(const amount& lhs, const amount& rhs) {
    return lhs.units_ != rhs.units_;
  }
  friend bool operator<(const amount& lhs, const amount& rhs) {
    return lhs.units_ < rhs.units_;
  }
  friend bool operator<=(const amount& lhs, const amount& rhs) {
    return lhs.units_ <= rhs.units_;
  }
  friend bool operator>(const amount& lhs, const amount& rhs) {
    return lhs.units_ > rhs.units_;
  }
  friend bool operator>=(const amount& lhs, const amount& rhs) {
    return lhs.units_ >= rhs.units_;
  }

 private:
  explicit amount(units_t units) : units_{std::move(units)} {}

  units_t units_{0};
};

using amount_t = amount;

}  // namespace tally::schema
