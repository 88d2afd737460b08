#include "Time.hpp"

namespace recstore {

std::string iso_utc(std::time_t t) {
  std::tm tm{};
  gmtime_r(&t, &tm); // thread-safe
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0)
    return std::string();
  return std::string(buf);
}

std::string now_iso() {
  return iso_utc(std::time(nullptr));
}

int64_t now_epoch() {
  return static_cast<int64_t>(std::time(nullptr));
}

} // namespace recstore
