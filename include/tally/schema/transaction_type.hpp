#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: transaction type.
// Settlement workflow: the five record kinds; deposit and withdrawal move
// funds, the other three act on an earlier deposit or withdrawal.
namespace tally::schema {

enum class transaction_type_t : uint8_t {
  deposit = 0,
  withdrawal = 1,
  dispute = 2,
  resolve = 3,
  chargeback = 4
};

inline constexpr auto kTransactionTypeMappings = std::array{
    enum_mapping_t<transaction_type_t>{"deposit", transaction_type_t::deposit},
    enum_mapping_t<transaction_type_t>{"withdrawal",
                                       transaction_type_t::withdrawal},
    enum_mapping_t<transaction_type_t>{"dispute", transaction_type_t::dispute},
    enum_mapping_t<transaction_type_t>{"resolve", transaction_type_t::resolve},
    enum_mapping_t<transaction_type_t>{"chargeback",
                                       transaction_type_t::chargeback}};

template <>
inline std::optional<transaction_type_t> try_from_string<transaction_type_t>(
    const std::string_view value) {
  return from_string(value, kTransactionTypeMappings);
}

inline constexpr std::string_view to_string(const transaction_type_t value) {
  return to_string(value, kTransactionTypeMappings).value_or("unknown");
}

/// Deposits and withdrawals carry an amount and may later be disputed.
inline constexpr bool carries_amount(const transaction_type_t value) {
  return value == transaction_type_t::deposit ||
         value == transaction_type_t::withdrawal;
}

}  // namespace tally::schema
