#include <tally/io/record_parser.hpp>

#include <fmt/format.h>
#include <algorithm>
#include <iterator>
#include <limits>
#include <string>
#include <utility>

using namespace tally::schema;

namespace {

constexpr auto kTypeColumn = std::string_view{"type"};
constexpr auto kClientColumn = std::string_view{"client"};
constexpr auto kTxColumn = std::string_view{"tx"};
constexpr auto kAmountColumn = std::string_view{"amount"};

void reject(record_error_t& error,
            const record_error_code code,
            const line_number_t line,
            std::string detail) {
  error.code = code;
  error.line = line;
  error.detail = std::move(detail);
}

std::string_view field_at(const std::vector<std::string_view>& fields,
                          const std::size_t index) {
  if (index >= fields.size()) {
    return {};
  }
  return fields[index];
}

template <typename T>
std::optional<T> parse_id(const std::string_view text) {
  auto value = try_parse_unsigned(text);
  if (!value || *value > std::numeric_limits<T>::max()) {
    return std::nullopt;
  }
  return static_cast<T>(*value);
}

bool is_blank(const std::string_view line) {
  return trim(line).empty();
}

}  // namespace

namespace tally::io {

std::vector<std::string_view> split_fields(const std::string_view line) {
  auto fields = std::vector<std::string_view>{};
  auto start = std::size_t{0};
  while (true) {
    const auto comma = line.find(',', start);
    if (comma == std::string_view::npos) {
      fields.push_back(trim(line.substr(start)));
      break;
    }
    fields.push_back(trim(line.substr(start, comma - start)));
    start = comma + 1;
  }
  return fields;
}

std::optional<csv_layout> parse_header(const std::string_view line,
                                       record_error_t& error) {
  auto fields = split_fields(line);
  auto position = [&](const std::string_view name) -> std::optional<std::size_t> {
    auto it = std::find(std::begin(fields), std::end(fields), name);
    if (it == std::end(fields)) {
      return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(std::begin(fields), it));
  };

  auto type = position(kTypeColumn);
  auto client = position(kClientColumn);
  auto tx = position(kTxColumn);
  if (!type || !client || !tx) {
    reject(error, record_error_code::invalid_header, 1,
           fmt::format("header must name {}, {} and {} columns", kTypeColumn,
                       kClientColumn, kTxColumn));
    return std::nullopt;
  }

  return csv_layout{.type = *type,
                    .client = *client,
                    .tx = *tx,
                    .amount = position(kAmountColumn),
                    .columns = fields.size()};
}

std::optional<transaction_t> parse_record(const std::string_view line,
                                          const csv_layout& layout,
                                          const line_number_t line_number,
                                          record_error_t& error) {
  auto fields = split_fields(line);
  const auto required =
      std::max({layout.type, layout.client, layout.tx}) + 1;
  if (fields.size() > layout.columns || fields.size() < required) {
    reject(error, record_error_code::malformed_row, line_number,
           fmt::format("expected {} fields, found {}", layout.columns,
                       fields.size()));
    return std::nullopt;
  }

  const auto type_text = field_at(fields, layout.type);
  auto type = try_from_string<transaction_type_t>(type_text);
  if (!type) {
    reject(error, record_error_code::unknown_type, line_number,
           fmt::format("unknown transaction type '{}'", type_text));
    return std::nullopt;
  }

  const auto client_text = field_at(fields, layout.client);
  auto client = parse_id<client_id_t>(client_text);
  if (!client) {
    reject(error, record_error_code::invalid_client, line_number,
           fmt::format("invalid client id '{}'", client_text));
    return std::nullopt;
  }

  const auto tx_text = field_at(fields, layout.tx);
  auto tx = parse_id<transaction_id_t>(tx_text);
  if (!tx) {
    reject(error, record_error_code::invalid_transaction_id, line_number,
           fmt::format("invalid transaction id '{}'", tx_text));
    return std::nullopt;
  }

  const auto amount_text =
      layout.amount ? field_at(fields, *layout.amount) : std::string_view{};
  auto amount = std::optional<amount_t>{};
  if (!amount_text.empty()) {
    amount = amount_t::try_parse(amount_text);
    if (!amount) {
      reject(error, record_error_code::invalid_amount, line_number,
             fmt::format("invalid amount '{}' for transaction {}",
                         amount_text, *tx));
      return std::nullopt;
    }
  }

  if (carries_amount(*type)) {
    if (!amount) {
      reject(error, record_error_code::missing_amount, line_number,
             fmt::format("missing amount for transaction {}", *tx));
      return std::nullopt;
    }
    if (amount->is_negative()) {
      reject(error, record_error_code::negative_amount, line_number,
             fmt::format("negative amount {} for transaction {}",
                         amount->str(), *tx));
      return std::nullopt;
    }
  } else if (amount) {
    reject(error, record_error_code::superfluous_amount, line_number,
           fmt::format("superfluous amount for transaction {}", *tx));
    return std::nullopt;
  }

  switch (*type) {
    case transaction_type_t::deposit:
      return transaction_t{.payload = deposit_t{
                               .client = *client, .tx = *tx, .amount = *amount}};
    case transaction_type_t::withdrawal:
      return transaction_t{.payload = withdrawal_t{
                               .client = *client, .tx = *tx, .amount = *amount}};
    case transaction_type_t::dispute:
      return transaction_t{.payload = dispute_t{.client = *client, .tx = *tx}};
    case transaction_type_t::resolve:
      return transaction_t{.payload = resolve_t{.client = *client, .tx = *tx}};
    case transaction_type_t::chargeback:
      return transaction_t{
          .payload = chargeback_t{.client = *client, .tx = *tx}};
  }
  reject(error, record_error_code::unknown_type, line_number,
         fmt::format("unknown transaction type '{}'", type_text));
  return std::nullopt;
}

record_reader::record_reader(std::istream& input, const bool has_headers)
    : input_{input}, has_headers_{has_headers} {}

bool record_reader::read_header(record_error_t& error) {
  if (!has_headers_) {
    return true;
  }
  auto text = std::string{};
  while (read_line(text)) {
    if (is_blank(text)) {
      continue;
    }
    auto layout = parse_header(text, error);
    if (!layout) {
      error.line = line_;
      return false;
    }
    layout_ = *layout;
    return true;
  }
  // An empty stream has no rows to lay out.
  return true;
}

bool record_reader::next(std::optional<transaction_t>& record,
                         record_error_t& error) {
  auto text = std::string{};
  while (read_line(text)) {
    if (is_blank(text)) {
      continue;
    }
    record = parse_record(text, layout_, line_, error);
    return true;
  }
  record.reset();
  return false;
}

bool record_reader::read_line(std::string& out) {
  if (!std::getline(input_, out)) {
    return false;
  }
  ++line_;
  return true;
}

}  // namespace tally::io
