#pragma once

#include <tally/schema/client_account.hpp>
#include <tally/schema/primitives.hpp>
#include <cstddef>
#include <map>

namespace tally::execution {

/// One account per client id, iterated in ascending client order.
class ledger final {
 public:
  using accounts_t =
      std::map<tally::schema::client_id_t, tally::schema::client_account_t>;
  using const_iterator = accounts_t::const_iterator;

  /// Return the client's account, opening a zero-balance one on first use.
  tally::schema::client_account_t& get_or_create(
      tally::schema::client_id_t client);

  /// nullptr when the client has never been referenced.
  tally::schema::client_account_t* find(tally::schema::client_id_t client);
  const tally::schema::client_account_t* find(
      tally::schema::client_id_t client) const;

  std::size_t size() const { return accounts_.size(); }
  bool empty() const { return accounts_.empty(); }

  const_iterator begin() const { return accounts_.cbegin(); }
  const_iterator end() const { return accounts_.cend(); }

 private:
  accounts_t accounts_;
};

}  // namespace tally::execution
