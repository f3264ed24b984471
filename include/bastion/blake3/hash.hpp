#pragma once
#include <bastion/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace bastion::blake3 {

bastion::schema::hash32_t hash(const std::string_view& str);
bastion::schema::hash32_t hash(const bastion::schema::bytes_view_t& bytes);

}  // namespace bastion::blake3
