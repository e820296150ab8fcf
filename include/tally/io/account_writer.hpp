#pragma once

#include <tally/execution/ledger.hpp>
#include <tally/schema/client_account.hpp>
#include <ostream>
#include <string>

namespace tally::io {

inline constexpr auto kAccountHeader = "client,available,held,total,locked";

/// Render one account as `client,available,held,total,locked`.
std::string format_account(const tally::schema::client_account_t& account);

/// Write the header and one row per account in ascending client order.
///
/// Returns false when the stream reports a write failure.
bool write_accounts(std::ostream& output,
                    const tally::execution::ledger& accounts);

}  // namespace tally::io
