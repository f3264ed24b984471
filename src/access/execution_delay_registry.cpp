#include <bastion/access/access_error.hpp>
#include <bastion/access/events.hpp>
#include <bastion/access/execution_delay_registry.hpp>
#include <bastion/schema/key/access_keys.hpp>

#include <spdlog/spdlog.h>

using namespace bastion::schema;

namespace bastion::access {

execution_delay_registry::execution_delay_registry(state_store& store)
    : store_{store},
      delays_{store, [](const role_id_t& role) {
                return key::make_minimal_execution_delay_key(role);
              }} {}

duration_seconds_t execution_delay_registry::minimal_delay(
    const role_id_t role) const {
  return delays_.get_or(role, 0);
}

void execution_delay_registry::set_minimal_delay(
    const role_id_t role,
    const duration_seconds_t delay) {
  delays_.set(role, delay);
  store_.emit(make_event(kMinimalExecutionDelayUpdatedEvent,
                         {{"role", std::to_string(role)},
                          {"delay", std::to_string(delay)}}));
  spdlog::info("Minimal execution delay of role {} ({}) set to {}s", role,
               role_name(role), delay);
}

void execution_delay_registry::set_minimal_delays(
    const std::vector<role_id_t>& roles,
    const std::vector<duration_seconds_t>& delays) {
  if (roles.size() != delays.size()) {
    throw invalid_argument_length(roles.size(), delays.size());
  }
  for (auto i = std::size_t{0}; i < roles.size(); ++i) {
    set_minimal_delay(roles[i], delays[i]);
  }
}

void execution_delay_registry::require_at_least(
    const role_id_t role,
    const duration_seconds_t delay) const {
  if (delay < minimal_delay(role)) {
    throw too_short_execution_delay_for_role(role, delay);
  }
}

}  // namespace bastion::access
