#include <tally/schema/transaction.hpp>

namespace tally::schema {

transaction_type_t type_of(const transaction_t& tx) {
  return std::visit(
      overloaded{
          [](const deposit_t&) { return transaction_type_t::deposit; },
          [](const withdrawal_t&) { return transaction_type_t::withdrawal; },
          [](const dispute_t&) { return transaction_type_t::dispute; },
          [](const resolve_t&) { return transaction_type_t::resolve; },
          [](const chargeback_t&) { return transaction_type_t::chargeback; }},
      tx.payload);
}

client_id_t client_of(const transaction_t& tx) {
  return std::visit([](const auto& payload) { return payload.client; },
                    tx.payload);
}

transaction_id_t id_of(const transaction_t& tx) {
  return std::visit([](const auto& payload) { return payload.tx; },
                    tx.payload);
}

std::optional<amount_t> amount_of(const transaction_t& tx) {
  return std::visit(
      overloaded{[](const deposit_t& value) -> std::optional<amount_t> {
                   return value.amount;
                 },
                 [](const withdrawal_t& value) -> std::optional<amount_t> {
                   return value.amount;
                 },
                 [](const auto&) -> std::optional<amount_t> {
                   return std::nullopt;
                 }},
      tx.payload);
}

}  // namespace tally::schema
