#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "core/storage/SessionLocks.hpp"

using namespace recstore;

TEST(SessionLocks, EntriesAreReclaimedAfterRelease) {
  SessionLocks locks;
  {
    auto a = locks.acquire("a");
    auto b = locks.acquire("b");
    EXPECT_EQ(locks.size(), 2u);
  }
  EXPECT_EQ(locks.size(), 0u);
}

TEST(SessionLocks, SerializesSameSession) {
  SessionLocks locks;
  std::atomic<int> inside{0};
  std::atomic<int> maxInside{0};

  std::vector<std::thread> ts;
  for (int i = 0; i < 8; ++i) {
    ts.emplace_back([&] {
      for (int k = 0; k < 200; ++k) {
        auto g = locks.acquire("same");
        int now = ++inside;
        int prev = maxInside.load();
        while (now > prev && !maxInside.compare_exchange_weak(prev, now)) {}
        --inside;
      }
    });
  }
  for (auto& t : ts) t.join();
  EXPECT_EQ(maxInside.load(), 1);
}

TEST(SessionLocks, DifferentSessionsDoNotBlock) {
  SessionLocks locks;
  auto held = locks.acquire("one");
  std::atomic<bool> done{false};
  std::thread t([&] {
    auto g = locks.acquire("two");
    done = true;
  });
  t.join();
  EXPECT_TRUE(done.load());
}
