#pragma once
#include <tally/schema/chargeback.hpp>
#include <tally/schema/deposit.hpp>
#include <tally/schema/dispute.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/resolve.hpp>
#include <tally/schema/transaction_type.hpp>
#include <tally/schema/withdrawal.hpp>
#include <optional>
#include <variant>

namespace tally::schema {

/// One alternative per record kind. Only deposit and withdrawal carry an
/// amount, so a payload can never hold an amount it should not have.
using transaction_payload_t = std::variant<deposit_t,
                                           withdrawal_t,
                                           dispute_t,
                                           resolve_t,
                                           chargeback_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

transaction_type_t type_of(const transaction_t& tx);
client_id_t client_of(const transaction_t& tx);
transaction_id_t id_of(const transaction_t& tx);

/// Amount of a deposit or withdrawal; std::nullopt for the other kinds.
std::optional<amount_t> amount_of(const transaction_t& tx);

}  // namespace tally::schema
