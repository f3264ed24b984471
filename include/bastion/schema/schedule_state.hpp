#pragma once

#include <bastion/schema/primitives.hpp>

#include <cstdint>

// Schema type: schedule state.
// Access workflow: a scheduled operation. A zero timepoint means nothing is
// pending; the nonce survives consumption and cancellation.
namespace bastion::schema {

template <uint16_t Version>
struct schedule_state;

template <>
struct schedule_state<1> final {
  uint16_t version{1};
  timestamp_seconds_t timepoint{};
  uint32_t nonce{};
};

using schedule_state_t = schedule_state<1>;

}  // namespace bastion::schema
