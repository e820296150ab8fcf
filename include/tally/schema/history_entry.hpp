#pragma once

#include <tally/schema/amount.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction_type.hpp>
#include <cstdint>

// Schema type: history entry.
// Settlement workflow: an applied deposit or withdrawal, kept for the whole
// replay so later disputes can find its owner and amount.
namespace tally::schema {

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  client_id_t client{};
  amount_t amount;
  transaction_type_t type{transaction_type_t::deposit};
};

using history_entry_t = history_entry<1>;

}  // namespace tally::schema
