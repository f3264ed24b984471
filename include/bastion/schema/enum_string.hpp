#pragma once

#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>

namespace bastion::schema {

/// Name table of an enum (or of named well-known ids).
template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto it = std::find_if(std::begin(mappings), std::end(mappings),
                         [&](const auto& entry) { return entry.first == value; });
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->second;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto it = std::find_if(std::begin(mappings), std::end(mappings),
                         [&](const auto& entry) { return entry.second == value; });
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->first;
}

}  // namespace bastion::schema
