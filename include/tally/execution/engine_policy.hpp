#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tally::execution {

enum class policy_action_t : uint8_t { reject = 0, allow = 1 };

inline constexpr auto kPolicyActionMappings = std::array{
    tally::schema::enum_mapping_t<policy_action_t>{"reject",
                                                   policy_action_t::reject},
    tally::schema::enum_mapping_t<policy_action_t>{"allow",
                                                   policy_action_t::allow}};

inline std::optional<policy_action_t> try_policy_action_from_string(
    const std::string_view value) {
  return tally::schema::from_string(value, kPolicyActionMappings);
}

inline constexpr std::string_view to_string(const policy_action_t value) {
  return tally::schema::to_string(value, kPolicyActionMappings)
      .value_or("unknown");
}

/// Rules the input does not settle on its own.
struct engine_policy final {
  /// Whether dispute, resolve and chargeback still apply to an account that a
  /// previous chargeback locked.
  policy_action_t locked_account_disputes{policy_action_t::reject};
  /// Whether a charged-back deposit or withdrawal can be disputed again.
  policy_action_t redispute_after_chargeback{policy_action_t::reject};
};

}  // namespace tally::execution
