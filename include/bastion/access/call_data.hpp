#pragma once

#include <bastion/schema/encoding/scale/encoder.hpp>
#include <bastion/schema/primitives.hpp>

#include <iterator>
#include <tuple>

namespace bastion::access {

/// Call payload: the operation id followed by the SCALE tuple of arguments.
/// Scheduling hashes this payload, so a consumer must rebuild it byte for
/// byte.
template <typename... Args>
bastion::schema::bytes_t make_call_data(
    const bastion::schema::operation_id_t& operation,
    const Args&... args) {
  auto data =
      bastion::schema::bytes_t{std::begin(operation), std::end(operation)};
  if constexpr (sizeof...(Args) > 0) {
    auto encoder = bastion::schema::encoding::scale_encoder_t{};
    encoder.encode(std::tuple<Args...>{args...}, data);
  }
  return data;
}

}  // namespace bastion::access
