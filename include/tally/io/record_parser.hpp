#pragma once

#include <tally/schema/primitives.hpp>
#include <tally/schema/record_error_code.hpp>
#include <tally/schema/transaction.hpp>
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tally::io {

/// Column positions resolved from the header row.
struct csv_layout final {
  std::size_t type{0};
  std::size_t client{1};
  std::size_t tx{2};
  std::optional<std::size_t> amount{3};
  std::size_t columns{4};
};

/// Split a row on commas. Quoting is not supported.
std::vector<std::string_view> split_fields(std::string_view line);

/// Resolve column positions by name. The amount column is optional.
std::optional<csv_layout> parse_header(std::string_view line,
                                       tally::schema::record_error_t& error);

/// Decode one row into a transaction of a legal shape.
///
/// On rejection returns std::nullopt and fills `error`; `line_number` is only
/// used for that report.
std::optional<tally::schema::transaction_t> parse_record(
    std::string_view line,
    const csv_layout& layout,
    tally::schema::line_number_t line_number,
    tally::schema::record_error_t& error);

/// Pulls rows from a stream and turns them into transactions.
class record_reader final {
 public:
  explicit record_reader(std::istream& input, bool has_headers = true);

  /// Consume the header row when the input has one.
  ///
  /// Returns false with `error` set when the header is unusable. An empty
  /// stream is accepted.
  bool read_header(tally::schema::record_error_t& error);

  /// Read the next non-blank row; false at end of stream.
  ///
  /// A rejected row leaves `record` empty and describes itself in `error`.
  bool next(std::optional<tally::schema::transaction_t>& record,
            tally::schema::record_error_t& error);

  /// Number of the last line read, starting at 1.
  tally::schema::line_number_t line() const { return line_; }

  /// True when the stream failed for a reason other than reaching its end.
  bool failed() const { return input_.bad(); }

 private:
  bool read_line(std::string& out);

  std::istream& input_;
  bool has_headers_{true};
  csv_layout layout_{};
  tally::schema::line_number_t line_{};
};

}  // namespace tally::io
