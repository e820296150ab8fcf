#pragma once

#include <tally/schema/record_error_code.hpp>
#include <tally/schema/transaction_error_code.hpp>
#include <cstdint>
#include <map>
#include <optional>

// Schema type: replay result.
// Settlement workflow: summary of one pass over an input stream.
namespace tally::schema {

template <uint16_t Version>
struct replay_result;

template <>
struct replay_result<1> final {
  uint16_t version{1};
  uint64_t row_count{};
  uint64_t applied_count{};
  uint64_t rejected_count{};
  uint64_t malformed_count{};
  std::map<transaction_error_code, uint64_t> rejections;
  std::map<record_error_code, uint64_t> malformed;
  /// Set when the header row made the stream unreadable.
  std::optional<record_error_t> error;
  /// Set when the stream reported a read failure part-way through.
  bool input_failed{};

  /// False when the stream could not be replayed to its end.
  bool ok() const { return !error.has_value() && !input_failed; }
};

using replay_result_t = replay_result<1>;

}  // namespace tally::schema
