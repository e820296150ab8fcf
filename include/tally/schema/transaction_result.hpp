#pragma once

#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction_error_code.hpp>
#include <cstdint>
#include <string>

namespace tally::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  transaction_error_code code{transaction_error_code::ok};
  std::string log;
  std::string codespace;

  bool ok() const { return code == transaction_error_code::ok; }
};

using transaction_result_t = transaction_result<1>;

}  // namespace tally::schema
