#include <spdlog/spdlog.h>
#include <tally/io/record_parser.hpp>
#include <tally/replay/replay.hpp>

#include <optional>
#include <utility>

using namespace tally::schema;

namespace tally::replay {

replay_result_t run(std::istream& input,
                    const tally::execution::engine& engine,
                    tally::execution::state& state,
                    const replay_options& options) {
  auto result = replay_result_t{};
  auto reader = tally::io::record_reader{input, options.has_headers};

  auto header_error = record_error_t{};
  if (!reader.read_header(header_error)) {
    spdlog::error("Cannot read input header (line {}): {}", header_error.line,
                  header_error.detail);
    result.error = std::move(header_error);
    return result;
  }

  auto record = std::optional<transaction_t>{};
  auto error = record_error_t{};
  while (reader.next(record, error)) {
    ++result.row_count;
    if (!record) {
      ++result.malformed_count;
      ++result.malformed[error.code];
      spdlog::warn("Skipping line {} ({}): {}", error.line,
                   to_string(error.code), error.detail);
      continue;
    }

    auto applied = engine.apply(state, *record);
    if (!applied.ok()) {
      ++result.rejected_count;
      ++result.rejections[applied.code];
      spdlog::warn("Rejected tx {} ({}, client {}): {}", id_of(*record),
                   to_string(type_of(*record)), client_of(*record),
                   applied.log);
      continue;
    }
    ++result.applied_count;
    spdlog::debug("Applied tx {} ({}, client {})", id_of(*record),
                  to_string(type_of(*record)), client_of(*record));
  }

  if (reader.failed()) {
    spdlog::error("Input stream failed after line {}", reader.line());
    result.input_failed = true;
  }

  spdlog::info(
      "Replayed {} row(s): {} applied, {} rejected, {} malformed, {} "
      "account(s)",
      result.row_count, result.applied_count, result.rejected_count,
      result.malformed_count, state.accounts.size());
  return result;
}

}  // namespace tally::replay
