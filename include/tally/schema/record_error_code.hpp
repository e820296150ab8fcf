#pragma once

#include <tally/schema/enum_string.hpp>
#include <tally/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

// Schema type: record error.
// Settlement workflow: reasons a CSV row is refused before it can become a
// transaction.
namespace tally::schema {

enum class record_error_code : uint32_t {
  none = 0,
  malformed_row = 1,
  unknown_type = 2,
  invalid_client = 3,
  invalid_transaction_id = 4,
  invalid_amount = 5,
  negative_amount = 6,
  missing_amount = 7,
  superfluous_amount = 8,
  invalid_header = 9,
};

inline constexpr auto kRecordErrorCodeMappings = std::array{
    enum_mapping_t<record_error_code>{"none", record_error_code::none},
    enum_mapping_t<record_error_code>{"malformed_row",
                                      record_error_code::malformed_row},
    enum_mapping_t<record_error_code>{"unknown_type",
                                      record_error_code::unknown_type},
    enum_mapping_t<record_error_code>{"invalid_client",
                                      record_error_code::invalid_client},
    enum_mapping_t<record_error_code>{
        "invalid_transaction_id", record_error_code::invalid_transaction_id},
    enum_mapping_t<record_error_code>{"invalid_amount",
                                      record_error_code::invalid_amount},
    enum_mapping_t<record_error_code>{"negative_amount",
                                      record_error_code::negative_amount},
    enum_mapping_t<record_error_code>{"missing_amount",
                                      record_error_code::missing_amount},
    enum_mapping_t<record_error_code>{"superfluous_amount",
                                      record_error_code::superfluous_amount},
    enum_mapping_t<record_error_code>{"invalid_header",
                                      record_error_code::invalid_header}};

inline constexpr std::string_view to_string(const record_error_code value) {
  return to_string(value, kRecordErrorCodeMappings).value_or("unknown");
}

template <uint16_t Version>
struct record_error;

template <>
struct record_error<1> final {
  uint16_t version{1};
  record_error_code code{record_error_code::none};
  line_number_t line{};
  std::string detail;
};

using record_error_t = record_error<1>;

}  // namespace tally::schema
