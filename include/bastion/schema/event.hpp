#pragma once

#include <bastion/schema/event_attribute.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Schema type: event.
// Access workflow: change notification emitted by the registry and the
// authorization core once the enclosing call has committed.
namespace bastion::schema {

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<event_attribute_t> attributes;
};

using event_t = event<1>;

/// Receives committed events in emission order.
using event_sink_t = std::function<void(const event_t&)>;

}  // namespace bastion::schema
