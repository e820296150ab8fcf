#include <tally/io/account_writer.hpp>

#include <fmt/format.h>

namespace tally::io {

std::string format_account(const tally::schema::client_account_t& account) {
  return fmt::format("{},{},{},{},{}", account.client, account.available.str(),
                     account.held.str(), account.total().str(),
                     account.locked ? "true" : "false");
}

bool write_accounts(std::ostream& output,
                    const tally::execution::ledger& accounts) {
  output << kAccountHeader << '\n';
  for (const auto& [client, account] : accounts) {
    output << format_account(account) << '\n';
  }
  output.flush();
  return static_cast<bool>(output);
}

}  // namespace tally::io
