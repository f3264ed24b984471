#include <bastion/access/access_error.hpp>
#include <bastion/access/events.hpp>
#include <bastion/access/redemption_lock_ledger.hpp>
#include <bastion/schema/key/access_keys.hpp>

#include <spdlog/spdlog.h>

#include <utility>

using namespace bastion::schema;

namespace bastion::access {

redemption_lock_ledger::redemption_lock_ledger(
    state_store& store,
    operation_classifier classifier,
    const duration_seconds_t redemption_delay,
    time_source_t now)
    : store_{store},
      classifier_{std::move(classifier)},
      redemption_delay_{redemption_delay},
      now_{std::move(now)},
      locks_{store, [](const account_id_t& account) {
               return key::make_redemption_lock_key(account);
             }} {
  if (redemption_delay_ > kMaxRedemptionDelay) {
    throw too_long_redemption_delay(redemption_delay_, kMaxRedemptionDelay);
  }

  auto stored = slot<duration_seconds_t>{store_, key::make_redemption_delay_key()};
  if (stored.find() != redemption_delay_) {
    auto scope = state_store::write_scope{store_};
    stored.set(redemption_delay_);
    scope.commit();
  }
}

void redemption_lock_ledger::lock_checks(const account_id_t& account,
                                         const operation_id_t& operation) {
  require_unlocked(account, operation);
  record_lock(account, operation);
}

void redemption_lock_ledger::require_unlocked(
    const account_id_t& account,
    const operation_id_t& operation) const {
  if (classifier_.classify(operation) != operation_kind_t::withdraw) {
    return;
  }
  auto unlock = lock_time(account);
  if (unlock > now_()) {
    spdlog::debug("Account {} is locked until {}", to_hex(account), unlock);
    throw account_is_locked(unlock);
  }
}

void redemption_lock_ledger::record_lock(const account_id_t& account,
                                         const operation_id_t& operation) {
  if (classifier_.classify(operation) != operation_kind_t::deposit ||
      redemption_delay_ == 0) {
    return;
  }
  auto unlock = now_() + redemption_delay_;
  locks_.set(account, unlock);
  store_.emit(make_event(kRedemptionDelayForAccountUpdatedEvent,
                         {{"account", hex_value(account)},
                          {"redemption_delay",
                           std::to_string(redemption_delay_)},
                          {"unlock_time", std::to_string(unlock)}}));
}

timestamp_seconds_t redemption_lock_ledger::lock_time(
    const account_id_t& account) const {
  return locks_.get_or(account, 0);
}

}  // namespace bastion::access
