#pragma once

#include <bastion/schema/primitives.hpp>

#include <chrono>
#include <functional>

namespace bastion::access {

/// Current time in seconds as sequenced by the host ledger.
using time_source_t = std::function<bastion::schema::timestamp_seconds_t()>;

inline time_source_t system_time_source() {
  return [] {
    return static_cast<bastion::schema::timestamp_seconds_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

}  // namespace bastion::access
