#pragma once

#include <tally/schema/amount.hpp>
#include <tally/schema/primitives.hpp>
#include <cstdint>

// Schema type: client account.
// Settlement workflow: balances of one client. `held` is never negative;
// `available` may be, after a dispute on funds that were already withdrawn.
namespace tally::schema {

template <uint16_t Version>
struct client_account;

template <>
struct client_account<1> final {
  uint16_t version{1};
  client_id_t client{};
  amount_t available;
  amount_t held;
  bool locked{};

  amount_t total() const { return available + held; }
};

using client_account_t = client_account<1>;

}  // namespace tally::schema
