#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace tally::schema {

enum class transaction_error_code : uint32_t {
  ok = 0,
  duplicate_transaction = 1,
  insufficient_funds = 2,
  account_locked = 3,
  transaction_not_found = 4,
  already_disputed = 5,
  transaction_not_disputed = 6,
  client_mismatch = 7,
  already_charged_back = 8,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    enum_mapping_t<transaction_error_code>{"ok", transaction_error_code::ok},
    enum_mapping_t<transaction_error_code>{
        "duplicate_transaction", transaction_error_code::duplicate_transaction},
    enum_mapping_t<transaction_error_code>{
        "insufficient_funds", transaction_error_code::insufficient_funds},
    enum_mapping_t<transaction_error_code>{
        "account_locked", transaction_error_code::account_locked},
    enum_mapping_t<transaction_error_code>{
        "transaction_not_found", transaction_error_code::transaction_not_found},
    enum_mapping_t<transaction_error_code>{
        "already_disputed", transaction_error_code::already_disputed},
    enum_mapping_t<transaction_error_code>{
        "transaction_not_disputed",
        transaction_error_code::transaction_not_disputed},
    enum_mapping_t<transaction_error_code>{
        "client_mismatch", transaction_error_code::client_mismatch},
    enum_mapping_t<transaction_error_code>{
        "already_charged_back", transaction_error_code::already_charged_back}};

inline constexpr std::string_view to_string(
    const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings).value_or("unknown");
}

}  // namespace tally::schema
