#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace recstore {

// One mutex per session id in use. Entries are dropped once no Guard
// references them, so the table only holds sessions with requests in flight.
class SessionLocks {
public:
  class Guard {
  public:
    explicit Guard(std::shared_ptr<std::mutex> m) : m_(std::move(m)), lk_(*m_) {}
  private:
    std::shared_ptr<std::mutex> m_;   // declared first: outlives lk_
    std::unique_lock<std::mutex> lk_;
  };

  Guard acquire(const std::string& session_id);

  // Number of tracked sessions (for tests and diagnostics).
  size_t size();

private:
  void sweep_();

  std::mutex mu_;
  std::unordered_map<std::string, std::weak_ptr<std::mutex>> locks_;
};

} // namespace recstore
