#pragma once

#include <bastion/access/state_store.hpp>
#include <bastion/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace bastion::access {

enum class initialization_state_t : uint8_t { uninitialized = 0, initialized = 1 };

inline constexpr auto kInitializationStateMappings = std::array{
    std::pair<std::string_view, initialization_state_t>{
        "uninitialized", initialization_state_t::uninitialized},
    std::pair<std::string_view, initialization_state_t>{
        "initialized", initialization_state_t::initialized},
};

inline constexpr std::string_view to_string(const initialization_state_t value) {
  return bastion::schema::to_string(value, kInitializationStateMappings)
      .value_or("unknown");
}

/// One-shot latch. There is no transition back to uninitialized.
class initialization_guard final {
 public:
  explicit initialization_guard(state_store& store);

  initialization_state_t state() const;
  bool is_initialized() const {
    return state() == initialization_state_t::initialized;
  }

  /// Throws already_initialized once latched.
  void require_uninitialized() const;

  /// Latch inside the caller's write scope.
  void latch();

 private:
  slot<uint8_t> flag_;
};

}  // namespace bastion::access
