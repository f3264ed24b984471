#include <bastion/access/access_error.hpp>
#include <bastion/access/initialization_guard.hpp>
#include <bastion/schema/key/access_keys.hpp>

namespace bastion::access {

initialization_guard::initialization_guard(state_store& store)
    : flag_{store, bastion::schema::key::make_initialization_key()} {}

initialization_state_t initialization_guard::state() const {
  return static_cast<initialization_state_t>(flag_.get_or(
      static_cast<uint8_t>(initialization_state_t::uninitialized)));
}

void initialization_guard::require_uninitialized() const {
  if (is_initialized()) {
    throw already_initialized();
  }
}

void initialization_guard::latch() {
  require_uninitialized();
  flag_.set(static_cast<uint8_t>(initialization_state_t::initialized));
}

}  // namespace bastion::access
