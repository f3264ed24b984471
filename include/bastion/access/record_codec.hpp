#pragma once

#include <bastion/schema/delay.hpp>
#include <bastion/schema/role_state.hpp>
#include <bastion/schema/schedule_state.hpp>
#include <bastion/schema/vault_latches.hpp>

#include <cstdint>
#include <tuple>

namespace bastion::access {

/// Maps a stored value type to the SCALE product type persisted for it.
/// Scalars are stored as themselves.
template <typename T>
struct record_codec {
  using stored_t = T;
  static stored_t to_stored(const T& value) { return value; }
  static T from_stored(const stored_t& value) { return value; }
};

template <>
struct record_codec<bastion::schema::role_state_t> {
  using stored_t = std::tuple<uint16_t, uint64_t, uint64_t, uint32_t,
                              uint32_t, uint64_t>;

  static stored_t to_stored(const bastion::schema::role_state_t& value) {
    return {value.version,
            value.admin,
            value.guardian,
            value.grant_delay.value_before,
            value.grant_delay.value_after,
            value.grant_delay.effect};
  }

  static bastion::schema::role_state_t from_stored(const stored_t& value) {
    return bastion::schema::role_state_t{
        .version = std::get<0>(value),
        .admin = std::get<1>(value),
        .guardian = std::get<2>(value),
        .grant_delay = bastion::schema::delay_t{
            .value_before = std::get<3>(value),
            .value_after = std::get<4>(value),
            .effect = std::get<5>(value)}};
  }
};

template <>
struct record_codec<bastion::schema::member_state_t> {
  using stored_t = std::tuple<uint16_t, uint64_t, uint32_t, uint32_t, uint64_t>;

  static stored_t to_stored(const bastion::schema::member_state_t& value) {
    return {value.version, value.since, value.execution_delay.value_before,
            value.execution_delay.value_after, value.execution_delay.effect};
  }

  static bastion::schema::member_state_t from_stored(const stored_t& value) {
    return bastion::schema::member_state_t{
        .version = std::get<0>(value),
        .since = std::get<1>(value),
        .execution_delay = bastion::schema::delay_t{
            .value_before = std::get<2>(value),
            .value_after = std::get<3>(value),
            .effect = std::get<4>(value)}};
  }
};

template <>
struct record_codec<bastion::schema::schedule_state_t> {
  using stored_t = std::tuple<uint16_t, uint64_t, uint32_t>;

  static stored_t to_stored(const bastion::schema::schedule_state_t& value) {
    return {value.version, value.timepoint, value.nonce};
  }

  static bastion::schema::schedule_state_t from_stored(const stored_t& value) {
    return bastion::schema::schedule_state_t{.version = std::get<0>(value),
                                             .timepoint = std::get<1>(value),
                                             .nonce = std::get<2>(value)};
  }
};

template <>
struct record_codec<bastion::schema::vault_latches_t> {
  using stored_t = std::tuple<uint16_t, uint8_t, uint8_t>;

  static stored_t to_stored(const bastion::schema::vault_latches_t& value) {
    return {value.version, static_cast<uint8_t>(value.deposit_access),
            static_cast<uint8_t>(value.share_transfer)};
  }

  static bastion::schema::vault_latches_t from_stored(const stored_t& value) {
    return bastion::schema::vault_latches_t{
        .version = std::get<0>(value),
        .deposit_access =
            static_cast<bastion::schema::deposit_access_t>(std::get<1>(value)),
        .share_transfer = static_cast<bastion::schema::share_transfer_t>(
            std::get<2>(value))};
  }
};

}  // namespace bastion::access
