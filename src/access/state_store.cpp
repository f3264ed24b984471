#include <bastion/access/state_store.hpp>
#include <bastion/schema/key/access_keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace bastion::access {

state_store::state_store(storage_t& storage) : storage_{storage} {
  if (!bastion::schema::key::namespace_slots_are_distinct()) {
    bastion::common::critical("storage namespaces hash to the same slot");
  }
}

state_store::write_scope::write_scope(state_store& store) : store_{store} {
  store_.enter();
}

state_store::write_scope::~write_scope() {
  if (!committed_) {
    store_.leave(false);
  }
}

void state_store::write_scope::commit() {
  if (committed_) {
    return;
  }
  committed_ = true;
  store_.leave(true);
}

void state_store::enter() {
  if (depth_ == 0) {
    pending_.clear();
    pending_events_.clear();
    aborted_ = false;
  }
  ++depth_;
}

void state_store::leave(const bool committed) {
  if (depth_ == 0) {
    bastion::common::critical("write scope released twice");
  }
  --depth_;
  if (!committed) {
    aborted_ = true;
  }
  if (depth_ > 0) {
    return;
  }

  if (aborted_) {
    if (committed) {
      // A nested scope failed and someone swallowed the failure.
      bastion::common::critical("commit after a nested write scope aborted");
    }
    spdlog::debug("Discarding {} buffered write(s) and {} event(s)",
                  pending_.size(), pending_events_.size());
    pending_.clear();
    pending_events_.clear();
    aborted_ = false;
    return;
  }

  auto entries = std::vector<bastion::storage::write_entry_t>{};
  entries.reserve(pending_.size());
  for (auto& [key, value] : pending_) {
    entries.emplace_back(key, std::move(value));
  }
  pending_.clear();
  storage_.write(entries);

  auto events = std::move(pending_events_);
  pending_events_.clear();
  if (event_sink_) {
    for (const auto& event : events) {
      event_sink_(event);
    }
  }
}

std::optional<bastion::schema::bytes_t> state_store::read(
    const bastion::schema::bytes_t& key) const {
  if (auto it = pending_.find(key); it != std::end(pending_)) {
    return it->second;
  }
  return storage_.read(bastion::schema::bytes_view_t{key.data(), key.size()});
}

void state_store::require_scope() const {
  if (depth_ == 0) {
    bastion::common::critical("state write outside of a write scope");
  }
}

void state_store::erase(const bastion::schema::bytes_t& key) {
  require_scope();
  pending_.insert_or_assign(key, std::nullopt);
}

void state_store::emit(bastion::schema::event_t event) {
  require_scope();
  pending_events_.push_back(std::move(event));
}

void state_store::set_event_sink(bastion::schema::event_sink_t sink) {
  event_sink_ = std::move(sink);
}

std::vector<bastion::storage::key_value_entry_t> state_store::list_committed(
    std::string_view name) const {
  auto prefix = bastion::schema::key::make_table_prefix(name);
  auto rows = storage_.list_by_prefix(
      bastion::schema::bytes_view_t{prefix.data(), prefix.size()});
  for (auto& [key, value] : rows) {
    key.erase(std::begin(key),
              std::begin(key) + static_cast<std::ptrdiff_t>(prefix.size()));
  }
  return rows;
}

}  // namespace bastion::access
