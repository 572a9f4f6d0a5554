#pragma once

namespace notary::execution {

/// Scoped engine-wide lock flag for operations that call out to the value
/// rail. The flag is raised for the lifetime of the guard.
class reentrancy_guard final {
 public:
  explicit reentrancy_guard(bool& entered) : entered_{entered} {
    entered_ = true;
  }
  ~reentrancy_guard() { entered_ = false; }

  reentrancy_guard(const reentrancy_guard&) = delete;
  reentrancy_guard& operator=(const reentrancy_guard&) = delete;

 private:
  bool& entered_;
};

}  // namespace notary::execution
