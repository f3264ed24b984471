#include <bastion/access/access_error.hpp>
#include <bastion/access/consuming_scope.hpp>
#include <bastion/access/managed_target.hpp>

#include <spdlog/spdlog.h>

using namespace bastion::schema;

namespace bastion::access {

managed_target::managed_target(authorization_core& authority, target_id_t id)
    : authority_{authority}, id_{id} {}

operation_id_t managed_target::is_consuming_scheduled_op() const {
  return consuming_ ? consuming_scheduled_op_marker() : operation_id_t{};
}

void managed_target::check_can_call(const account_id_t& caller,
                                    const bytes_t& data) {
  auto operation = try_operation_id(make_bytes_view(data));
  if (!operation) {
    throw invalid_call_data();
  }
  auto scope = state_store::write_scope{authority_.store()};
  auto decision = authority_.can_call_and_update(caller, id_, *operation);
  if (!decision.immediate) {
    if (decision.delay == 0) {
      spdlog::debug("Denied {} on {} for {}", to_hex(*operation), to_hex(id_),
                    to_hex(caller));
      throw access_managed_unauthorized(caller);
    }
    auto consuming = consuming_scope{consuming_};
    authority_.consume_scheduled_op(*this, caller, data);
  }
  scope.commit();
}

}  // namespace bastion::access
