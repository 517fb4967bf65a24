/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */

#include "fleet/error.hpp"
#include "fleet/liveness_tracker.hpp"
#include "fleet/worker_registry.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <thread>

using namespace tfleet;
using namespace std::chrono_literals;

class LivenessTrackerTest : public ::testing::Test {
protected:
  void register_worker(const std::string &id) {
    WorkerInfo info;
    info.worker_id = id;
    registry_.register_worker(info);
    tracker_.track(id);
  }

  WorkerRegistry registry_{100, 0ms};
  LivenessTracker tracker_{registry_, 30000ms};
};

TEST_F(LivenessTrackerTest, HeartbeatOverwritesStatusAndResources) {
  register_worker("w0");

  ResourceSnapshot resources;
  resources.cpu_percent = 42.5f;
  resources.memory_used_bytes = 1 << 20;
  AcceleratorUsage gpu;
  gpu.accelerator_id = 0;
  gpu.utilization_percent = 90.0f;
  resources.accelerators.push_back(gpu);

  tracker_.heartbeat("w0", status::Training{120, 3, "forward"}, resources, 1700000000000);
  tracker_.heartbeat("w0", status::Checkpointing{125, 3}, resources, 1700000001000);

  auto health = tracker_.get("w0");
  ASSERT_TRUE(health.has_value());
  EXPECT_EQ(state_of(health->status), WorkerState::CHECKPOINTING);
  EXPECT_EQ(step_of(health->status), 125u);
  EXPECT_EQ(epoch_of(health->status), 3u);
  EXPECT_EQ(health->heartbeat_count, 2u);
  EXPECT_EQ(health->reported_timestamp_ms, 1700000001000);
  EXPECT_FLOAT_EQ(health->resources.cpu_percent, 42.5f);
  ASSERT_EQ(health->resources.accelerators.size(), 1u);
  EXPECT_FALSE(health->dead);
}

TEST_F(LivenessTrackerTest, HeartbeatFromUnknownWorkerIsRejected) {
  try {
    tracker_.heartbeat("ghost", status::Idle{}, ResourceSnapshot{});
    FAIL() << "Expected UNKNOWN_WORKER";
  } catch (const FleetError &e) {
    EXPECT_EQ(e.code(), ErrorCode::UNKNOWN_WORKER);
    EXPECT_FALSE(e.is_fatal_for_worker());
  }
}

TEST_F(LivenessTrackerTest, RegisteredButUntrackedWorkerIsTrackedLazily) {
  WorkerInfo info;
  info.worker_id = "late";
  registry_.register_worker(info);

  EXPECT_NO_THROW(tracker_.heartbeat("late", status::Idle{}, ResourceSnapshot{}));
  EXPECT_TRUE(tracker_.get("late").has_value());
}

TEST_F(LivenessTrackerTest, SilentWorkersAreDeclaredDeadAndEvicted) {
  register_worker("first");
  register_worker("silent");

  const auto later = Clock::now() + 31s;
  auto died = tracker_.sweep(later);
  // both were last seen at registration
  EXPECT_THAT(died, ::testing::UnorderedElementsAre("first", "silent"));
  EXPECT_TRUE(tracker_.is_dead("silent"));
  EXPECT_FALSE(registry_.contains("silent"));
  EXPECT_EQ(tracker_.dead_count(), 2u);

  // a second sweep does not report the same deaths again
  EXPECT_TRUE(tracker_.sweep(later + 1s).empty());
}

TEST_F(LivenessTrackerTest, FreshHeartbeatKeepsWorkerAlive) {
  register_worker("w0");
  const auto now = Clock::now();
  EXPECT_TRUE(tracker_.sweep(now + 29s).empty());
  EXPECT_FALSE(tracker_.is_dead("w0"));
  EXPECT_TRUE(registry_.contains("w0"));
}

TEST_F(LivenessTrackerTest, DeadWorkerMustReRegister) {
  register_worker("w0");
  tracker_.sweep(Clock::now() + 60s);

  try {
    tracker_.heartbeat("w0", status::Idle{}, ResourceSnapshot{});
    FAIL() << "Expected UNKNOWN_WORKER";
  } catch (const FleetError &e) {
    EXPECT_EQ(e.code(), ErrorCode::UNKNOWN_WORKER);
  }

  register_worker("w0");
  EXPECT_FALSE(tracker_.is_dead("w0"));
  EXPECT_NO_THROW(tracker_.heartbeat("w0", status::Idle{}, ResourceSnapshot{}));
}

TEST_F(LivenessTrackerTest, SweepSparesWorkerReRegisteredUnderSameId) {
  register_worker("w0");

  // re-registration lands after the entry was last tracked, as when it races a sweep
  ASSERT_TRUE(registry_.deregister_worker("w0"));
  WorkerInfo info;
  info.worker_id = "w0";
  registry_.register_worker(info);

  EXPECT_THAT(tracker_.sweep(Clock::now() + 31s), ::testing::ElementsAre("w0"));
  EXPECT_TRUE(registry_.contains("w0"));
  EXPECT_EQ(registry_.world_size(), 1u);
}

TEST_F(LivenessTrackerTest, DeadEntriesAreDroppedAfterRetention) {
  LivenessTracker tracker(registry_, 30000ms, 60000ms);
  WorkerInfo info;
  info.worker_id = "w0";
  registry_.register_worker(info);
  tracker.track("w0");

  const auto died_at = Clock::now() + 31s;
  ASSERT_EQ(tracker.sweep(died_at).size(), 1u);
  EXPECT_TRUE(tracker.sweep(died_at + 60s).empty());
  EXPECT_TRUE(tracker.is_dead("w0"));

  tracker.sweep(died_at + 61s);
  EXPECT_FALSE(tracker.get("w0").has_value());
  EXPECT_EQ(tracker.dead_count(), 0u);
  EXPECT_TRUE(tracker.all().empty());
}

TEST_F(LivenessTrackerTest, ForgetDropsEntry) {
  register_worker("w0");
  tracker_.forget("w0");
  EXPECT_FALSE(tracker_.get("w0").has_value());
  EXPECT_TRUE(tracker_.all().empty());
}

TEST_F(LivenessTrackerTest, AllIsSortedById) {
  register_worker("c");
  register_worker("a");
  register_worker("b");
  auto all = tracker_.all();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].worker_id, "a");
  EXPECT_EQ(all[2].worker_id, "c");
}

TEST_F(LivenessTrackerTest, BackgroundSweepDetectsDeath) {
  WorkerRegistry registry(10, 0ms);
  LivenessTracker tracker(registry, 50ms);
  WorkerInfo info;
  info.worker_id = "w0";
  registry.register_worker(info);
  tracker.track("w0");

  tracker.start(10ms);
  EXPECT_TRUE(tracker.is_running());
  for (int i = 0; i < 100 && !tracker.is_dead("w0"); ++i) {
    std::this_thread::sleep_for(10ms);
  }
  tracker.stop();

  EXPECT_FALSE(tracker.is_running());
  EXPECT_TRUE(tracker.is_dead("w0"));
  EXPECT_EQ(registry.world_size(), 0u);
}

TEST_F(LivenessTrackerTest, NonPositiveTimeoutIsRejected) {
  EXPECT_THROW(LivenessTracker(registry_, 0ms), std::invalid_argument);
  EXPECT_THROW(LivenessTracker(registry_, 1000ms, -1ms), std::invalid_argument);
}
