#include "SessionLocks.hpp"

namespace recstore {

SessionLocks::Guard SessionLocks::acquire(const std::string& session_id) {
  std::shared_ptr<std::mutex> m;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto& slot = locks_[session_id];
    m = slot.lock();
    if (!m) {
      m = std::make_shared<std::mutex>();
      slot = m;
    }
    if (locks_.size() > 1024) sweep_();
  }
  // block outside mu_ so other sessions are unaffected
  return Guard(std::move(m));
}

size_t SessionLocks::size() {
  std::lock_guard<std::mutex> lk(mu_);
  sweep_();
  return locks_.size();
}

void SessionLocks::sweep_() {
  for (auto it = locks_.begin(); it != locks_.end();) {
    if (it->second.expired()) it = locks_.erase(it);
    else ++it;
  }
}

} // namespace recstore
