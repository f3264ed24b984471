#pragma once

#include <bastion/schema/primitives.hpp>

#include <algorithm>
#include <cstdint>
#include <utility>

// Schema type: delay.
// Access workflow: a duration whose pending change becomes effective at a
// known timepoint. A change waits for the decrease or the setback floor,
// whichever is longer.
namespace bastion::schema {

template <uint16_t Version>
struct delay;

template <>
struct delay<1> final {
  uint16_t version{1};
  duration_seconds_t value_before{};
  duration_seconds_t value_after{};
  timestamp_seconds_t effect{};
};

using delay_t = delay<1>;

inline delay_t make_delay(const duration_seconds_t value) {
  return delay_t{.value_before = 0, .value_after = value, .effect = 0};
}

/// Value in force at `now`.
inline duration_seconds_t current_delay(const delay_t& value,
                                        const timestamp_seconds_t now) {
  return value.effect <= now ? value.value_after : value.value_before;
}

/// Schedule `new_value`, effective after max(min_setback, current -
/// new_value). Returns the updated delay and its effect timepoint.
inline std::pair<delay_t, timestamp_seconds_t> with_update(
    const delay_t& value,
    const timestamp_seconds_t now,
    const duration_seconds_t new_value,
    const duration_seconds_t min_setback) {
  auto current = current_delay(value, now);
  auto setback =
      std::max(min_setback, current > new_value ? current - new_value : 0);
  auto effect = now + setback;
  return {delay_t{.value_before = current,
                  .value_after = new_value,
                  .effect = effect},
          effect};
}

}  // namespace bastion::schema
