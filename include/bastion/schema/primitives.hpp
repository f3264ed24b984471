#pragma once
#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bastion::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using target_id_t = hash32_t;
using operation_hash_t = hash32_t;
using role_id_t = uint64_t;
using operation_id_t = std::array<uint8_t, 4>;
using timestamp_seconds_t = uint64_t;
// Delays are 32-bit so that timestamp + delay never wraps.
using duration_seconds_t = uint32_t;

bytes_view_t make_bytes_view(const bytes_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Lower-case hex rendering without prefix, used for logs and event values.
std::string to_hex(const bytes_view_t& bytes);

}  // namespace bastion::schema
