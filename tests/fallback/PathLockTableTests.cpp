// Repository: LogVault
// Component: Path Lock Table unit tests
// Copyright (c) 2026 LogVault

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "logvault/fallback/PathLockTable.hpp"
#include "../support/ScratchDir.hpp"

namespace logvault::fallback {
namespace {

using test_support::ScratchDir;

TEST(PathLockTableTest, AcquireAndReleaseShrinksTable) {
  ScratchDir dir("locks_basic");
  PathLockTable table;
  {
    PathLockTable::Guard guard = table.Acquire(dir.File("a.json"));
    EXPECT_TRUE(guard.owns_lock());
    EXPECT_EQ(guard.status(), LockStatus::kAcquired);
    EXPECT_EQ(table.ActivePaths(), 1u);
  }
  EXPECT_EQ(table.ActivePaths(), 0u);
  EXPECT_EQ(table.TotalAcquisitions(), 1u);
}

TEST(PathLockTableTest, EquivalentSpellingsShareOneLock) {
  ScratchDir dir("locks_normalize");
  PathLockTable table;
  PathLockTable::Guard held = table.Acquire(dir.File("a.json"));
  LockOptions options;
  options.timeout_ms = 20;
  PathLockTable::Guard second = table.Acquire(dir.path() + "/sub/../a.json", options);
  EXPECT_FALSE(second.owns_lock());
  EXPECT_EQ(second.status(), LockStatus::kTimedOut);
  EXPECT_EQ(table.ContendedAcquisitions(), 1u);
}

TEST(PathLockTableTest, DistinctPathsDoNotContend) {
  ScratchDir dir("locks_distinct");
  PathLockTable table;
  PathLockTable::Guard a = table.Acquire(dir.File("a.json"));
  LockOptions options;
  options.timeout_ms = 20;
  PathLockTable::Guard b = table.Acquire(dir.File("b.json"), options);
  EXPECT_TRUE(b.owns_lock());
  EXPECT_EQ(table.ActivePaths(), 2u);
  EXPECT_EQ(table.ContendedAcquisitions(), 0u);
}

TEST(PathLockTableTest, TimeoutLeavesNoEntryBehind) {
  ScratchDir dir("locks_timeout");
  PathLockTable table;
  {
    PathLockTable::Guard held = table.Acquire(dir.File("a.json"));
    LockOptions options;
    options.timeout_ms = 10;
    PathLockTable::Guard waiter = table.Acquire(dir.File("a.json"), options);
    EXPECT_FALSE(waiter.owns_lock());
    EXPECT_EQ(table.ActivePaths(), 1u);
  }
  EXPECT_EQ(table.ActivePaths(), 0u);
}

TEST(PathLockTableTest, CancelWhileWaiting) {
  ScratchDir dir("locks_cancel");
  PathLockTable table;
  PathLockTable::Guard held = table.Acquire(dir.File("a.json"));

  std::atomic<bool> cancel{false};
  LockStatus observed = LockStatus::kAcquired;
  std::thread waiter([&] {
    LockOptions options;
    options.cancel = &cancel;
    PathLockTable::Guard g = table.Acquire(dir.File("a.json"), options);
    observed = g.status();
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  cancel.store(true);
  waiter.join();
  EXPECT_EQ(observed, LockStatus::kCancelled);
}

TEST(PathLockTableTest, AlreadyCancelledNeverWaits) {
  ScratchDir dir("locks_precancel");
  PathLockTable table;
  std::atomic<bool> cancel{true};
  LockOptions options;
  options.cancel = &cancel;
  PathLockTable::Guard g = table.Acquire(dir.File("a.json"), options);
  EXPECT_FALSE(g.owns_lock());
  EXPECT_EQ(g.status(), LockStatus::kCancelled);
  EXPECT_EQ(table.ActivePaths(), 0u);
}

TEST(PathLockTableTest, WaiterProceedsAfterRelease) {
  ScratchDir dir("locks_handoff");
  PathLockTable table;
  PathLockTable::Guard held = table.Acquire(dir.File("a.json"));

  std::atomic<bool> acquired{false};
  std::thread waiter([&] {
    PathLockTable::Guard g = table.Acquire(dir.File("a.json"));
    acquired.store(g.owns_lock());
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(acquired.load());
  held.Release();
  waiter.join();
  EXPECT_TRUE(acquired.load());
  EXPECT_EQ(table.ActivePaths(), 0u);
}

TEST(PathLockTableTest, MutualExclusionUnderContention) {
  ScratchDir dir("locks_exclusion");
  PathLockTable table;
  const std::string path = dir.File("shared.json");
  std::atomic<int> inside{0};
  std::atomic<int> max_inside{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) {
        PathLockTable::Guard g = table.Acquire(path);
        const int now = ++inside;
        int prev = max_inside.load();
        while (now > prev && !max_inside.compare_exchange_weak(prev, now)) {
        }
        --inside;
      }
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(max_inside.load(), 1);
  EXPECT_EQ(table.TotalAcquisitions(), 400u);
  EXPECT_EQ(table.ActivePaths(), 0u);
}

TEST(PathLockTableTest, GuardMoveTransfersOwnership) {
  ScratchDir dir("locks_move");
  PathLockTable table;
  PathLockTable::Guard a = table.Acquire(dir.File("a.json"));
  PathLockTable::Guard b = std::move(a);
  EXPECT_FALSE(a.owns_lock());
  EXPECT_TRUE(b.owns_lock());
  b.Release();
  EXPECT_EQ(table.ActivePaths(), 0u);
}

TEST(PathLockTableTest, InterprocessLockCreatesLockFile) {
  ScratchDir dir("locks_flock");
  PathLockTable table;
  LockOptions options;
  options.interprocess = true;
  PathLockTable::Guard g = table.Acquire(dir.File("a.json"), options);
  EXPECT_TRUE(g.owns_lock());
  EXPECT_TRUE(test_support::Exists(dir.File("a.json.lock")));
}

}  // namespace
}  // namespace logvault::fallback
