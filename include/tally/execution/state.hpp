#pragma once

#include <tally/execution/ledger.hpp>
#include <tally/schema/history_entry.hpp>
#include <tally/schema/primitives.hpp>
#include <set>
#include <unordered_map>

namespace tally::execution {

using history_t = std::unordered_map<tally::schema::transaction_id_t,
                                     tally::schema::history_entry_t>;
using transaction_set_t = std::set<tally::schema::transaction_id_t>;

/// Everything a replay mutates. Owned by the caller and handed to
/// `engine::apply` by reference; lives until the stream is consumed.
struct state final {
  ledger accounts;
  /// Applied deposits and withdrawals. Entries are never removed.
  history_t history;
  /// Transactions currently under dispute.
  transaction_set_t disputes;
  /// Transactions that ended in a chargeback.
  transaction_set_t charged_back;
};

}  // namespace tally::execution
