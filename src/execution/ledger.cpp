#include <tally/execution/ledger.hpp>

namespace tally::execution {

tally::schema::client_account_t& ledger::get_or_create(
    const tally::schema::client_id_t client) {
  auto [it, inserted] = accounts_.try_emplace(
      client, tally::schema::client_account_t{.client = client});
  return it->second;
}

tally::schema::client_account_t* ledger::find(
    const tally::schema::client_id_t client) {
  auto it = accounts_.find(client);
  if (it == std::end(accounts_)) {
    return nullptr;
  }
  return &it->second;
}

const tally::schema::client_account_t* ledger::find(
    const tally::schema::client_id_t client) const {
  auto it = accounts_.find(client);
  if (it == std::end(accounts_)) {
    return nullptr;
  }
  return &it->second;
}

}  // namespace tally::execution
