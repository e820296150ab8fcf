#pragma once

#include <tally/schema/amount.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace tally::testing {

inline tally::schema::amount_t make_amount(const std::string_view text) {
  auto parsed = tally::schema::amount_t::try_parse(text);
  if (!parsed) {
    return tally::schema::amount_t{};
  }
  return *parsed;
}

inline tally::schema::transaction_t make_deposit(
    const tally::schema::client_id_t client,
    const tally::schema::transaction_id_t tx,
    const std::string_view amount) {
  return tally::schema::transaction_t{
      .payload = tally::schema::deposit_t{
          .client = client, .tx = tx, .amount = make_amount(amount)}};
}

inline tally::schema::transaction_t make_withdrawal(
    const tally::schema::client_id_t client,
    const tally::schema::transaction_id_t tx,
    const std::string_view amount) {
  return tally::schema::transaction_t{
      .payload = tally::schema::withdrawal_t{
          .client = client, .tx = tx, .amount = make_amount(amount)}};
}

inline tally::schema::transaction_t make_dispute(
    const tally::schema::client_id_t client,
    const tally::schema::transaction_id_t tx) {
  return tally::schema::transaction_t{
      .payload = tally::schema::dispute_t{.client = client, .tx = tx}};
}

inline tally::schema::transaction_t make_resolve(
    const tally::schema::client_id_t client,
    const tally::schema::transaction_id_t tx) {
  return tally::schema::transaction_t{
      .payload = tally::schema::resolve_t{.client = client, .tx = tx}};
}

inline tally::schema::transaction_t make_chargeback(
    const tally::schema::client_id_t client,
    const tally::schema::transaction_id_t tx) {
  return tally::schema::transaction_t{
      .payload = tally::schema::chargeback_t{.client = client, .tx = tx}};
}

inline std::string make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline std::string write_temp_file(const std::string_view prefix,
                                   const std::string_view contents) {
  auto path = make_temp_path(prefix);
  auto out = std::ofstream{path};
  out << contents;
  return path;
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace tally::testing
