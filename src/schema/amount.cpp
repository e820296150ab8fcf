#include <tally/schema/amount.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace tally::schema {

namespace {

bool all_digits(const std::string_view text) {
  return std::all_of(std::begin(text), std::end(text), [](const char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  });
}

}  // namespace

amount amount::from_units(const units_t& units) {
  return amount{units};
}

amount amount::from_whole(const int64_t whole) {
  return amount{units_t{whole} * kUnitsPerWhole};
}

std::optional<amount> amount::try_parse(std::string_view text) {
  auto negative = false;
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  auto integral = text;
  auto fractional = std::string_view{};
  if (const auto dot = text.find('.'); dot != std::string_view::npos) {
    integral = text.substr(0, dot);
    fractional = text.substr(dot + 1);
  }

  if (integral.empty() && fractional.empty()) {
    return std::nullopt;
  }
  if (!all_digits(integral) || !all_digits(fractional)) {
    return std::nullopt;
  }
  if (integral.size() > kMaxIntegralDigits || fractional.size() > kScale) {
    return std::nullopt;
  }

  auto units = units_t{0};
  for (const auto c : integral) {
    units = units * 10 + (c - '0');
  }
  for (std::size_t i = 0; i < kScale; ++i) {
    units *= 10;
    if (i < fractional.size()) {
      units += fractional[i] - '0';
    }
  }
  if (negative) {
    units = -units;
  }
  return amount{units};
}

std::string amount::str() const {
  auto magnitude = units_ < 0 ? units_t{-units_} : units_;
  auto whole = units_t{magnitude / kUnitsPerWhole};
  auto fraction = units_t{magnitude % kUnitsPerWhole};

  auto fraction_digits = fraction.str();
  fraction_digits.insert(0, kScale - fraction_digits.size(), '0');

  auto out = std::string{};
  if (units_ < 0) {
    out.push_back('-');
  }
  out += whole.str();
  out.push_back('.');
  out += fraction_digits;
  return out;
}

amount& amount::operator+=(const amount& other) {
  units_ += other.units_;
  return *this;
}

amount& amount::operator-=(const amount& other) {
  units_ -= other.units_;
  return *this;
}

}  // namespace tally::schema
