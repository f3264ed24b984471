#pragma once

#include <bastion/access/operation_classifier.hpp>
#include <bastion/access/state_store.hpp>
#include <bastion/access/time_source.hpp>
#include <bastion/schema/primitives.hpp>

namespace bastion::access {

/// Per-account redemption lock. A deposit-like operation locks the caller
/// out of withdraw-like operations until `now + redemption_delay`.
class redemption_lock_ledger final {
 public:
  static constexpr bastion::schema::duration_seconds_t kMaxRedemptionDelay{
      7 * 24 * 60 * 60};

  /// Persists `redemption_delay`; throws too_long_redemption_delay above
  /// kMaxRedemptionDelay.
  redemption_lock_ledger(state_store& store,
                         operation_classifier classifier,
                         bastion::schema::duration_seconds_t redemption_delay,
                         time_source_t now);

  /// Enforce and update the caller's lock for `operation`. Must run inside a
  /// write scope.
  void lock_checks(const bastion::schema::account_id_t& account,
                   const bastion::schema::operation_id_t& operation);

  /// The enforcing half of lock_checks: throws account_is_locked for a
  /// withdraw-like operation before the unlock time.
  void require_unlocked(const bastion::schema::account_id_t& account,
                        const bastion::schema::operation_id_t& operation) const;

  /// The updating half of lock_checks: locks the account after a
  /// deposit-like operation when the redemption delay is non-zero.
  void record_lock(const bastion::schema::account_id_t& account,
                   const bastion::schema::operation_id_t& operation);

  /// Zero when the account was never locked.
  bastion::schema::timestamp_seconds_t lock_time(
      const bastion::schema::account_id_t& account) const;

  bastion::schema::duration_seconds_t redemption_delay() const {
    return redemption_delay_;
  }

  const operation_classifier& classifier() const { return classifier_; }

 private:
  state_store& store_;
  operation_classifier classifier_;
  bastion::schema::duration_seconds_t redemption_delay_;
  time_source_t now_;
  table<bastion::schema::account_id_t, bastion::schema::timestamp_seconds_t>
      locks_;
};

}  // namespace bastion::access
