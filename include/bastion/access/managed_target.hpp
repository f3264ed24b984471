#pragma once

#include <bastion/access/authorization_core.hpp>
#include <bastion/access/permission_oracle.hpp>
#include <bastion/access/state_store.hpp>
#include <bastion/schema/primitives.hpp>

#include <type_traits>
#include <utility>

namespace bastion::access {

/// Entry guard of a target protected by an authorization core, such as a
/// vault. Every guarded call goes through check_can_call exactly once.
class managed_target final : public consumption_context {
 public:
  managed_target(authorization_core& authority,
                 bastion::schema::target_id_t id);

  managed_target(const managed_target&) = delete;
  managed_target& operator=(const managed_target&) = delete;

  const bastion::schema::target_id_t& target_id() const override {
    return id_;
  }
  bastion::schema::operation_id_t is_consuming_scheduled_op() const override;

  /// Two-phase check, atomic with the redemption-lock update: proceed on an
  /// immediate grant, consume the caller's schedule of `data` on a delayed
  /// grant, fail with access_managed_unauthorized otherwise.
  void check_can_call(const bastion::schema::account_id_t& caller,
                      const bastion::schema::bytes_t& data);

  /// Run `body` after check_can_call inside one write scope. A failure in
  /// either discards the redemption-lock update and the consumption.
  template <typename Body>
  auto guarded_call(const bastion::schema::account_id_t& caller,
                    const bastion::schema::bytes_t& data,
                    Body&& body) -> decltype(body());

  authorization_core& authority() { return authority_; }

 private:
  authorization_core& authority_;
  bastion::schema::target_id_t id_;
  bool consuming_{false};
};

template <typename Body>
auto managed_target::guarded_call(const bastion::schema::account_id_t& caller,
                                  const bastion::schema::bytes_t& data,
                                  Body&& body) -> decltype(body()) {
  auto scope = state_store::write_scope{authority_.store()};
  check_can_call(caller, data);
  if constexpr (std::is_void_v<decltype(body())>) {
    std::forward<Body>(body)();
    scope.commit();
  } else {
    auto result = std::forward<Body>(body)();
    scope.commit();
    return result;
  }
}

}  // namespace bastion::access
