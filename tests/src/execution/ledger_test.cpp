#include <gtest/gtest.h>
#include <tally/execution/ledger.hpp>

#include <vector>

TEST(ledger, get_or_create_opens_zero_balance_account) {
  auto accounts = tally::execution::ledger{};
  EXPECT_TRUE(accounts.empty());
  EXPECT_EQ(accounts.find(7), nullptr);

  auto& account = accounts.get_or_create(7);
  EXPECT_EQ(account.client, 7);
  EXPECT_TRUE(account.available.is_zero());
  EXPECT_TRUE(account.held.is_zero());
  EXPECT_TRUE(account.total().is_zero());
  EXPECT_FALSE(account.locked);
  EXPECT_EQ(accounts.size(), 1u);
}

TEST(ledger, get_or_create_returns_existing_account) {
  auto accounts = tally::execution::ledger{};
  auto& first = accounts.get_or_create(2);
  first.available = tally::schema::amount_t::from_whole(5);

  auto& second = accounts.get_or_create(2);
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(second.available, tally::schema::amount_t::from_whole(5));
  EXPECT_EQ(accounts.size(), 1u);

  const auto& view = accounts;
  ASSERT_NE(view.find(2), nullptr);
  EXPECT_EQ(view.find(2)->available, tally::schema::amount_t::from_whole(5));
}

TEST(ledger, iterates_in_client_order) {
  auto accounts = tally::execution::ledger{};
  for (auto client : {9, 1, 65535, 4}) {
    accounts.get_or_create(static_cast<tally::schema::client_id_t>(client));
  }

  auto order = std::vector<tally::schema::client_id_t>{};
  for (const auto& [client, account] : accounts) {
    EXPECT_EQ(client, account.client);
    order.push_back(client);
  }
  EXPECT_EQ(order,
            (std::vector<tally::schema::client_id_t>{1, 4, 9, 65535}));
}
