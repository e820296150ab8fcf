#pragma once

#include <tally/execution/engine.hpp>
#include <tally/execution/state.hpp>
#include <tally/schema/replay_result.hpp>
#include <istream>

namespace tally::replay {

struct replay_options final {
  /// The first non-blank line names the columns.
  bool has_headers{true};
};

/// Replay every row of `input` through `engine` into `state`, in order.
///
/// Malformed rows and rejected transactions are logged and skipped. Only an
/// unusable header or a failing stream stops the pass early; `state` then
/// holds whatever was applied before that point.
tally::schema::replay_result_t run(std::istream& input,
                                   const tally::execution::engine& engine,
                                   tally::execution::state& state,
                                   const replay_options& options = {});

}  // namespace tally::replay
