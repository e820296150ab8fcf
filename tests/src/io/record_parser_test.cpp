#include <gtest/gtest.h>
#include <tally/io/record_parser.hpp>

#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace tally::schema;

namespace {

std::optional<transaction_t> parse(const std::string& line,
                                   record_error_t& error) {
  return tally::io::parse_record(line, tally::io::csv_layout{}, 2, error);
}

record_error_code rejection_of(const std::string& line) {
  auto error = record_error_t{};
  auto parsed = parse(line, error);
  EXPECT_FALSE(parsed.has_value()) << line;
  return error.code;
}

}  // namespace

TEST(record_parser, split_fields_trims_each_field) {
  auto fields = tally::io::split_fields(" deposit ,  1,2 , 3.5 \r");
  ASSERT_EQ(fields.size(), 4u);
  EXPECT_EQ(fields[0], "deposit");
  EXPECT_EQ(fields[1], "1");
  EXPECT_EQ(fields[2], "2");
  EXPECT_EQ(fields[3], "3.5");

  auto trailing = tally::io::split_fields("dispute,1,2,");
  ASSERT_EQ(trailing.size(), 4u);
  EXPECT_TRUE(trailing[3].empty());
}

TEST(record_parser, header_columns_are_matched_by_name) {
  auto error = record_error_t{};
  auto layout = tally::io::parse_header("tx, amount, type, client", error);
  ASSERT_TRUE(layout.has_value());
  EXPECT_EQ(layout->tx, 0u);
  EXPECT_EQ(layout->amount, 1u);
  EXPECT_EQ(layout->type, 2u);
  EXPECT_EQ(layout->client, 3u);
  EXPECT_EQ(layout->columns, 4u);

  auto no_amount = tally::io::parse_header("type,client,tx", error);
  ASSERT_TRUE(no_amount.has_value());
  EXPECT_FALSE(no_amount->amount.has_value());

  EXPECT_FALSE(
      tally::io::parse_header("type,client,amount", error).has_value());
  EXPECT_EQ(error.code, record_error_code::invalid_header);
}

TEST(record_parser, parses_every_kind) {
  auto error = record_error_t{};

  auto deposit = parse("deposit, 1, 1, 1.0", error);
  ASSERT_TRUE(deposit.has_value());
  ASSERT_TRUE(std::holds_alternative<deposit_t>(deposit->payload));
  const auto& value = std::get<deposit_t>(deposit->payload);
  EXPECT_EQ(value.client, 1);
  EXPECT_EQ(value.tx, 1u);
  EXPECT_EQ(value.amount.str(), "1.0000");

  auto withdrawal = parse("withdrawal,2,5,0.5", error);
  ASSERT_TRUE(withdrawal.has_value());
  EXPECT_EQ(type_of(*withdrawal), transaction_type_t::withdrawal);

  auto dispute = parse("dispute,1,1,", error);
  ASSERT_TRUE(dispute.has_value());
  EXPECT_EQ(type_of(*dispute), transaction_type_t::dispute);

  auto resolve = parse("resolve,1,1", error);
  ASSERT_TRUE(resolve.has_value());
  EXPECT_EQ(type_of(*resolve), transaction_type_t::resolve);

  auto chargeback = parse("chargeback, 65535, 4294967295,", error);
  ASSERT_TRUE(chargeback.has_value());
  EXPECT_EQ(client_of(*chargeback), 65535);
  EXPECT_EQ(id_of(*chargeback), 4294967295u);
}

TEST(record_parser, zero_amount_is_a_legal_shape) {
  auto error = record_error_t{};
  auto deposit = parse("deposit,1,1,0", error);
  ASSERT_TRUE(deposit.has_value());
  EXPECT_TRUE(amount_of(*deposit)->is_zero());
}

TEST(record_parser, rejects_illegal_shapes) {
  EXPECT_EQ(rejection_of("deposit,1,1,1.0,extra"),
            record_error_code::malformed_row);
  EXPECT_EQ(rejection_of("deposit,1"), record_error_code::malformed_row);
  EXPECT_EQ(rejection_of("transfer,1,1,1.0"), record_error_code::unknown_type);
  EXPECT_EQ(rejection_of("Deposit,1,1,1.0"), record_error_code::unknown_type);
  EXPECT_EQ(rejection_of("deposit,-1,1,1.0"),
            record_error_code::invalid_client);
  EXPECT_EQ(rejection_of("deposit,65536,1,1.0"),
            record_error_code::invalid_client);
  EXPECT_EQ(rejection_of("deposit,1,4294967296,1.0"),
            record_error_code::invalid_transaction_id);
  EXPECT_EQ(rejection_of("deposit,1,x,1.0"),
            record_error_code::invalid_transaction_id);
  EXPECT_EQ(rejection_of("deposit,1,1,1.00001"),
            record_error_code::invalid_amount);
  EXPECT_EQ(rejection_of("deposit,1,1,ten"), record_error_code::invalid_amount);
  EXPECT_EQ(rejection_of("deposit,1,1,9999999999999999999999999999.9999"),
            record_error_code::invalid_amount);
  EXPECT_EQ(rejection_of("withdrawal,1,1,-2"),
            record_error_code::negative_amount);
  EXPECT_EQ(rejection_of("deposit,1,1,"), record_error_code::missing_amount);
  EXPECT_EQ(rejection_of("withdrawal,1,1"), record_error_code::missing_amount);
  EXPECT_EQ(rejection_of("dispute,1,1,3.0"),
            record_error_code::superfluous_amount);
  EXPECT_EQ(rejection_of("chargeback,1,1,0"),
            record_error_code::superfluous_amount);
}

TEST(record_parser, rejection_reports_line_and_detail) {
  auto error = record_error_t{};
  auto parsed = tally::io::parse_record("deposit,1,1,", tally::io::csv_layout{},
                                        17, error);
  EXPECT_FALSE(parsed.has_value());
  EXPECT_EQ(error.line, 17u);
  EXPECT_EQ(error.detail, "missing amount for transaction 1");
}

TEST(record_parser, reader_skips_blank_lines_and_counts_lines) {
  auto input = std::istringstream{
      "type,client,tx,amount\n"
      "\n"
      "deposit,1,1,1.0\n"
      "   \n"
      "bogus,1,2,1.0\n"
      "dispute,1,1,\n"};
  auto reader = tally::io::record_reader{input};
  auto error = record_error_t{};
  ASSERT_TRUE(reader.read_header(error));

  auto record = std::optional<transaction_t>{};
  auto lines = std::vector<line_number_t>{};
  auto kinds = std::vector<bool>{};
  while (reader.next(record, error)) {
    lines.push_back(reader.line());
    kinds.push_back(record.has_value());
  }
  EXPECT_EQ(lines, (std::vector<line_number_t>{3, 5, 6}));
  EXPECT_EQ(kinds, (std::vector<bool>{true, false, true}));
  EXPECT_FALSE(reader.failed());
}

TEST(record_parser, reader_without_headers_uses_default_layout) {
  auto input = std::istringstream{"deposit,3,9,2\n"};
  auto reader = tally::io::record_reader{input, false};
  auto error = record_error_t{};
  ASSERT_TRUE(reader.read_header(error));

  auto record = std::optional<transaction_t>{};
  ASSERT_TRUE(reader.next(record, error));
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(client_of(*record), 3);
  EXPECT_EQ(id_of(*record), 9u);
  EXPECT_FALSE(reader.next(record, error));
}

TEST(record_parser, reader_rejects_unusable_header) {
  auto input = std::istringstream{"deposit,1,1,1.0\n"};
  auto reader = tally::io::record_reader{input};
  auto error = record_error_t{};
  EXPECT_FALSE(reader.read_header(error));
  EXPECT_EQ(error.code, record_error_code::invalid_header);
  EXPECT_EQ(error.line, 1u);
}

TEST(record_parser, reader_accepts_empty_input) {
  auto input = std::istringstream{""};
  auto reader = tally::io::record_reader{input};
  auto error = record_error_t{};
  EXPECT_TRUE(reader.read_header(error));
  auto record = std::optional<transaction_t>{};
  EXPECT_FALSE(reader.next(record, error));
}
