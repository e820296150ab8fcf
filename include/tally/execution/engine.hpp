#pragma once

#include <tally/execution/engine_policy.hpp>
#include <tally/execution/state.hpp>
#include <tally/schema/transaction.hpp>
#include <tally/schema/transaction_result.hpp>

namespace tally::execution {

/// Deterministic settlement state machine.
///
/// Applies one record at a time against a caller-owned `state`. Every
/// business-rule failure is returned in the result and leaves `state`
/// untouched; nothing here performs I/O.
class engine final {
 public:
  explicit engine(engine_policy policy = {});

  /// Apply `tx` in input order.
  ///
  /// Returns `transaction_error_code::ok` on success. Deposit and withdrawal
  /// open the client's account even when they are rejected.
  tally::schema::transaction_result_t apply(
      state& state,
      const tally::schema::transaction_t& tx) const;

  const engine_policy& policy() const { return policy_; }

 private:
  tally::schema::transaction_result_t apply_deposit(
      state& state,
      const tally::schema::deposit_t& deposit) const;
  tally::schema::transaction_result_t apply_withdrawal(
      state& state,
      const tally::schema::withdrawal_t& withdrawal) const;
  tally::schema::transaction_result_t apply_dispute(
      state& state,
      const tally::schema::dispute_t& dispute) const;
  tally::schema::transaction_result_t apply_resolve(
      state& state,
      const tally::schema::resolve_t& resolve) const;
  tally::schema::transaction_result_t apply_chargeback(
      state& state,
      const tally::schema::chargeback_t& chargeback) const;

  /// Shared checks for resolve and chargeback. On success `entry` and
  /// `account` point at the disputed transaction and its owner.
  tally::schema::transaction_result_t check_disputed(
      state& state,
      tally::schema::client_id_t client,
      tally::schema::transaction_id_t tx,
      const tally::schema::history_entry_t*& entry,
      tally::schema::client_account_t*& account) const;

  engine_policy policy_;
};

}  // namespace tally::execution
