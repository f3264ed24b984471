#pragma once

namespace bastion::access {

/// Raises a target's consuming flag for the lifetime of the scope and
/// restores the previous value on every exit path.
class consuming_scope final {
 public:
  explicit consuming_scope(bool& consuming)
      : consuming_{consuming}, previous_{consuming} {
    consuming_ = true;
  }

  ~consuming_scope() { consuming_ = previous_; }

  consuming_scope(const consuming_scope&) = delete;
  consuming_scope& operator=(const consuming_scope&) = delete;

 private:
  bool& consuming_;
  bool previous_;
};

}  // namespace bastion::access
