#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace tally::schema {

using client_id_t = uint16_t;
using transaction_id_t = uint32_t;
using line_number_t = uint64_t;

/// Strip leading and trailing ASCII whitespace.
std::string_view trim(std::string_view value);

/// Parse a base-10 unsigned integer that must fit in `uint64_t`.
///
/// No sign, no whitespace, no empty input.
std::optional<uint64_t> try_parse_unsigned(std::string_view value);

}  // namespace tally::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
