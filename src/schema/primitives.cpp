#include <tally/schema/primitives.hpp>

#include <charconv>
#include <system_error>

namespace tally::schema {

namespace {

bool is_ascii_space(const char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' ||
         c == '\f';
}

}  // namespace

std::string_view trim(std::string_view value) {
  while (!value.empty() && is_ascii_space(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && is_ascii_space(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

std::optional<uint64_t> try_parse_unsigned(const std::string_view value) {
  if (value.empty()) {
    return std::nullopt;
  }
  auto out = uint64_t{};
  const auto* first = value.data();
  const auto* last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return out;
}

}  // namespace tally::schema
