#include <tally/common/critical.hpp>
#include <tally/execution/engine.hpp>

#include <fmt/format.h>
#include <string>
#include <utility>

using namespace tally::schema;

namespace {

constexpr auto kCodespace = "tally.engine";

transaction_result_t make_result(const transaction_error_code code,
                                 std::string log) {
  auto result = transaction_result_t{};
  result.code = code;
  result.log = std::move(log);
  result.codespace = kCodespace;
  return result;
}

transaction_result_t accepted() {
  return transaction_result_t{.code = transaction_error_code::ok,
                              .codespace = kCodespace};
}

}  // namespace

namespace tally::execution {

engine::engine(engine_policy policy) : policy_{policy} {}

transaction_result_t engine::apply(state& state,
                                   const transaction_t& tx) const {
  return std::visit(
      overloaded{[&](const deposit_t& value) {
                   return apply_deposit(state, value);
                 },
                 [&](const withdrawal_t& value) {
                   return apply_withdrawal(state, value);
                 },
                 [&](const dispute_t& value) {
                   return apply_dispute(state, value);
                 },
                 [&](const resolve_t& value) {
                   return apply_resolve(state, value);
                 },
                 [&](const chargeback_t& value) {
                   return apply_chargeback(state, value);
                 }},
      tx.payload);
}

transaction_result_t engine::apply_deposit(state& state,
                                           const deposit_t& deposit) const {
  auto& account = state.accounts.get_or_create(deposit.client);
  if (state.history.contains(deposit.tx)) {
    return make_result(transaction_error_code::duplicate_transaction,
                       fmt::format("transaction {} already exists", deposit.tx));
  }
  if (account.locked) {
    return make_result(
        transaction_error_code::account_locked,
        fmt::format("client {} is locked", deposit.client));
  }

  account.available += deposit.amount;
  state.history.emplace(
      deposit.tx, history_entry_t{.client = deposit.client,
                                  .amount = deposit.amount,
                                  .type = transaction_type_t::deposit});
  return accepted();
}

transaction_result_t engine::apply_withdrawal(
    state& state,
    const withdrawal_t& withdrawal) const {
  auto& account = state.accounts.get_or_create(withdrawal.client);
  if (state.history.contains(withdrawal.tx)) {
    return make_result(
        transaction_error_code::duplicate_transaction,
        fmt::format("transaction {} already exists", withdrawal.tx));
  }
  if (account.locked) {
    return make_result(
        transaction_error_code::account_locked,
        fmt::format("client {} is locked", withdrawal.client));
  }
  if (account.available < withdrawal.amount) {
    return make_result(
        transaction_error_code::insufficient_funds,
        fmt::format("available {} is less than {}", account.available.str(),
                    withdrawal.amount.str()));
  }

  account.available -= withdrawal.amount;
  state.history.emplace(
      withdrawal.tx, history_entry_t{.client = withdrawal.client,
                                     .amount = withdrawal.amount,
                                     .type = transaction_type_t::withdrawal});
  return accepted();
}

transaction_result_t engine::apply_dispute(state& state,
                                           const dispute_t& dispute) const {
  auto entry = state.history.find(dispute.tx);
  if (entry == std::end(state.history)) {
    return make_result(
        transaction_error_code::transaction_not_found,
        fmt::format("transaction {} does not exist", dispute.tx));
  }
  if (entry->second.client != dispute.client) {
    return make_result(
        transaction_error_code::client_mismatch,
        fmt::format("transaction {} belongs to client {}", dispute.tx,
                    entry->second.client));
  }

  auto* account = state.accounts.find(dispute.client);
  if (account == nullptr) {
    tally::common::critical("history references a client without an account");
  }
  if (account->locked &&
      policy_.locked_account_disputes == policy_action_t::reject) {
    return make_result(
        transaction_error_code::account_locked,
        fmt::format("client {} is locked", dispute.client));
  }
  if (state.charged_back.contains(dispute.tx) &&
      policy_.redispute_after_chargeback == policy_action_t::reject) {
    return make_result(
        transaction_error_code::already_charged_back,
        fmt::format("transaction {} was charged back", dispute.tx));
  }
  if (state.disputes.contains(dispute.tx)) {
    return make_result(
        transaction_error_code::already_disputed,
        fmt::format("dispute for transaction {} already exists", dispute.tx));
  }

  account->available -= entry->second.amount;
  account->held += entry->second.amount;
  state.disputes.insert(dispute.tx);
  return accepted();
}

transaction_result_t engine::apply_resolve(state& state,
                                           const resolve_t& resolve) const {
  const history_entry_t* entry = nullptr;
  client_account_t* account = nullptr;
  auto checked =
      check_disputed(state, resolve.client, resolve.tx, entry, account);
  if (!checked.ok()) {
    return checked;
  }

  account->held -= entry->amount;
  account->available += entry->amount;
  state.disputes.erase(resolve.tx);
  return accepted();
}

transaction_result_t engine::apply_chargeback(
    state& state,
    const chargeback_t& chargeback) const {
  const history_entry_t* entry = nullptr;
  client_account_t* account = nullptr;
  auto checked =
      check_disputed(state, chargeback.client, chargeback.tx, entry, account);
  if (!checked.ok()) {
    return checked;
  }

  account->held -= entry->amount;
  account->locked = true;
  state.disputes.erase(chargeback.tx);
  state.charged_back.insert(chargeback.tx);
  return accepted();
}

transaction_result_t engine::check_disputed(
    state& state,
    const client_id_t client,
    const transaction_id_t tx,
    const history_entry_t*& entry,
    client_account_t*& account) const {
  if (!state.disputes.contains(tx)) {
    return make_result(
        transaction_error_code::transaction_not_disputed,
        fmt::format("dispute for transaction {} does not exist", tx));
  }

  auto found = state.history.find(tx);
  if (found == std::end(state.history)) {
    tally::common::critical("disputed transaction is missing from history");
  }
  if (found->second.client != client) {
    return make_result(transaction_error_code::client_mismatch,
                       fmt::format("transaction {} belongs to client {}", tx,
                                   found->second.client));
  }

  account = state.accounts.find(client);
  if (account == nullptr) {
    tally::common::critical("history references a client without an account");
  }
  if (account->locked &&
      policy_.locked_account_disputes == policy_action_t::reject) {
    return make_result(transaction_error_code::account_locked,
                       fmt::format("client {} is locked", client));
  }

  entry = &found->second;
  return accepted();
}

}  // namespace tally::execution
