#pragma once
#include <tally/schema/primitives.hpp>

// Opens a dispute on the deposit or withdrawal `tx` owned by `client`.
namespace tally::schema {

template <uint16_t Version>
struct dispute;

template <>
struct dispute<1> final {
  uint16_t version{1};
  client_id_t client{};
  transaction_id_t tx{};
};

using dispute_t = dispute<1>;

}  // namespace tally::schema
