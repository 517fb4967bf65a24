/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */

#include "fleet/coordinator_service.hpp"
#include "fleet/error.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace tfleet;
using namespace std::chrono_literals;

class CoordinatorServiceTest : public ::testing::Test {
protected:
  static CoordinatorConfig make_config() {
    CoordinatorConfig config;
    config.rank_grace_ms = 0;
    config.barrier_timeout_ms = 5000;
    return config;
  }

  Registration register_worker(const std::string &id) {
    WorkerInfo info;
    info.worker_id = id;
    info.hostname = "10.0.0." + std::to_string(++host_counter_);
    info.port = 29500;
    info.gpu_count = 8;
    return service_.register_worker(info);
  }

  static DatasetSpec make_dataset() {
    DatasetSpec spec;
    spec.dataset_id = "imagenet";
    spec.path = "/data/imagenet";
    spec.format = "webdataset";
    spec.total_samples = 10000;
    spec.shard_size = 1000;
    spec.shuffle = false;
    return spec;
  }

  static CheckpointRecord make_checkpoint(const std::string &worker, uint64_t step,
                                          uint64_t epoch) {
    CheckpointRecord record;
    record.checkpoint_id = worker + "-step-" + std::to_string(step);
    record.worker_id = worker;
    record.step = step;
    record.epoch = epoch;
    record.storage_path = "/ckpt/" + record.checkpoint_id;
    record.size_bytes = 1000;
    record.timestamp_ms = wall_clock_ms();
    return record;
  }

  int host_counter_ = 0;
  CoordinatorService service_{make_config()};
};

// ==================== Scenario Tests ====================

TEST_F(CoordinatorServiceTest, FourWorkerTrainingScenario) {
  for (uint32_t i = 0; i < 4; ++i) {
    auto reg = register_worker("w" + std::to_string(i));
    EXPECT_EQ(reg.rank, i);
    EXPECT_EQ(reg.world_size, i + 1);
  }
  EXPECT_EQ(service_.registry().world_size(), 4u);

  auto ack = service_.register_dataset(make_dataset());
  EXPECT_TRUE(ack.created);
  EXPECT_EQ(ack.total_shards, 10u);
  EXPECT_FALSE(service_.register_dataset(make_dataset()).created);

  auto rank0 = service_.get_data_shard("w0", "imagenet", 0);
  ASSERT_EQ(rank0.sample_ranges.size(), 1u);
  EXPECT_EQ(rank0.sample_ranges[0], (SampleRange{0, 2500}));
  auto rank3 = service_.get_data_shard("w3", "imagenet", 0);
  ASSERT_EQ(rank3.sample_ranges.size(), 1u);
  EXPECT_EQ(rank3.sample_ranges[0], (SampleRange{7500, 10000}));

  for (int i = 0; i < 4; ++i) {
    const std::string id = "w" + std::to_string(i);
    EXPECT_GT(service_.heartbeat(id, status::Training{10, 0, "forward"}, ResourceSnapshot{}, 0),
              0);
  }

  std::vector<std::future<BarrierResult>> arrivals;
  for (int i = 0; i < 4; ++i) {
    arrivals.push_back(std::async(std::launch::async, [this, i]() {
      return service_.wait_barrier("w" + std::to_string(i), "epoch-0", 0);
    }));
  }
  uint32_t order_sum = 0;
  for (auto &arrival : arrivals) {
    auto result = arrival.get();
    EXPECT_EQ(result.participants, 4u);
    order_sum += result.arrival_order;
  }
  EXPECT_EQ(order_sum, 1u + 2u + 3u + 4u);

  service_.notify_checkpoint(make_checkpoint("w0", 100, 0));
  auto recovery = service_.get_latest_checkpoint("w0");
  ASSERT_TRUE(recovery.has_checkpoint);
  EXPECT_EQ(recovery.resume_step, 100u);
  ASSERT_EQ(recovery.shard_assignments.size(), 1u);
  EXPECT_EQ(recovery.shard_assignments[0].sample_ranges[0], (SampleRange{0, 2500}));
}

// ==================== Recovery Tests ====================

TEST_F(CoordinatorServiceTest, RecoveryFallsBackToFleetLatest) {
  register_worker("w0");
  register_worker("w1");
  service_.notify_checkpoint(make_checkpoint("w0", 100, 1));
  service_.notify_checkpoint(make_checkpoint("w0", 200, 2));

  auto recovery = service_.get_latest_checkpoint("w1");
  ASSERT_TRUE(recovery.has_checkpoint);
  EXPECT_EQ(recovery.checkpoint.worker_id, "w0");
  EXPECT_EQ(recovery.resume_step, 200u);
  EXPECT_EQ(recovery.resume_epoch, 2u);
}

TEST_F(CoordinatorServiceTest, RecoveryWithoutCheckpoints) {
  register_worker("w0");
  auto recovery = service_.get_latest_checkpoint("w0");
  EXPECT_FALSE(recovery.has_checkpoint);
  EXPECT_TRUE(recovery.shard_assignments.empty());
}

// ==================== Lifecycle Tests ====================

TEST_F(CoordinatorServiceTest, DeregisterStopsTracking) {
  register_worker("w0");
  EXPECT_TRUE(service_.deregister_worker("w0"));
  EXPECT_FALSE(service_.deregister_worker("w0"));
  EXPECT_FALSE(service_.liveness().get("w0").has_value());
  EXPECT_THROW(service_.heartbeat("w0", status::Idle{}, ResourceSnapshot{}, 0), FleetError);
}

TEST_F(CoordinatorServiceTest, DeadWorkerShowsInSnapshotAndLeavesWorld) {
  register_worker("w0");
  register_worker("w1");
  service_.liveness().sweep(Clock::now() + 31s);

  EXPECT_EQ(service_.registry().world_size(), 0u);
  auto snap = service_.snapshot();
  EXPECT_EQ(snap["metrics"]["dead_workers"], 2);
  EXPECT_EQ(snap["metrics"]["active_workers"], 0);
  EXPECT_EQ(snap["workers"][0]["status"], "dead");
}

TEST_F(CoordinatorServiceTest, ClosedConnectionTokenLeavesNoArrival) {
  register_worker("w0");
  register_worker("w1");
  auto closed = std::make_shared<std::atomic<bool>>(true);

  try {
    service_.wait_barrier("w0", "sync", 1, 5000ms, closed);
    FAIL() << "Expected CANCELLED";
  } catch (const FleetError &e) {
    EXPECT_EQ(e.code(), ErrorCode::CANCELLED);
  }
  EXPECT_FALSE(service_.cancel_barrier("w0", "sync"));
  EXPECT_EQ(service_.snapshot()["metrics"]["barriers_active"], 0);
}

TEST_F(CoordinatorServiceTest, ShuffledDatasetAboveConfiguredCapIsRejected) {
  auto config = make_config();
  config.max_shuffle_samples = 5000;
  CoordinatorService service(config);

  auto spec = make_dataset();
  spec.shuffle = true;
  try {
    service.register_dataset(spec);
    FAIL() << "Expected INVALID_ARGUMENT";
  } catch (const FleetError &e) {
    EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
  }
  spec.total_samples = 5000;
  EXPECT_TRUE(service.register_dataset(spec).created);
}

// ==================== Snapshot Tests ====================

TEST_F(CoordinatorServiceTest, SnapshotHasDashboardShape) {
  register_worker("w0");
  register_worker("w1");
  service_.register_dataset(make_dataset());
  service_.heartbeat("w0", status::Training{42, 1, "backward"}, ResourceSnapshot{}, 0);
  service_.notify_checkpoint(make_checkpoint("w0", 40, 1));

  auto snap = service_.snapshot();
  for (const char *key : {"coordinator", "workers", "datasets", "checkpoints", "barriers",
                          "metrics"}) {
    EXPECT_TRUE(snap.contains(key)) << "missing " << key;
  }
  EXPECT_EQ(snap["coordinator"]["version"], kFleetVersion);
  EXPECT_FALSE(snap["coordinator"]["connected"].get<bool>());

  ASSERT_EQ(snap["workers"].size(), 2u);
  const auto &w0 = snap["workers"][0];
  EXPECT_EQ(w0["id"], "w0");
  EXPECT_EQ(w0["status"], "training");
  EXPECT_EQ(w0["current_step"], 42);
  EXPECT_EQ(w0["current_task"], "backward");
  EXPECT_EQ(w0["rank"], 0);
  EXPECT_EQ(w0["gpu_count"], 8);

  ASSERT_EQ(snap["datasets"].size(), 1u);
  EXPECT_EQ(snap["datasets"][0]["id"], "imagenet");
  EXPECT_EQ(snap["datasets"][0]["shard_count"], 10);
  EXPECT_EQ(DatasetSpec::from_json(snap["datasets"][0]), make_dataset());
  ASSERT_EQ(snap["checkpoints"].size(), 1u);
  EXPECT_EQ(snap["checkpoints"][0]["step"], 40);

  const auto &metrics = snap["metrics"];
  EXPECT_EQ(metrics["active_workers"], 2);
  EXPECT_EQ(metrics["workers_by_state"]["training"], 1);
  EXPECT_EQ(metrics["workers_by_state"]["idle"], 1);
  EXPECT_EQ(metrics["heartbeats"], 1);
  EXPECT_EQ(metrics["checkpoint_bytes"], 1000);
  EXPECT_GE(metrics["total_requests"].get<uint64_t>(), 5u);
}

TEST_F(CoordinatorServiceTest, MaintenanceTickWritesSnapshotFile) {
  const auto path = std::filesystem::temp_directory_path() /
                    ("tfleet-snapshot-" + std::to_string(::getpid()) + ".json");
  auto config = make_config();
  config.snapshot_path = path.string();
  CoordinatorService service(config);

  WorkerInfo info;
  info.worker_id = "w0";
  service.register_worker(info);
  service.maintenance_tick();

  std::ifstream in(path);
  ASSERT_TRUE(in.good());
  auto written = nlohmann::json::parse(in);
  EXPECT_EQ(written["metrics"]["active_workers"], 1);
  std::filesystem::remove(path);
}

TEST_F(CoordinatorServiceTest, StartStopRunsBackgroundLoops) {
  auto config = make_config();
  config.sweep_interval_ms = 10;
  CoordinatorService service(config);

  service.start();
  EXPECT_TRUE(service.is_running());
  EXPECT_TRUE(service.liveness().is_running());
  std::this_thread::sleep_for(30ms);
  service.stop();
  EXPECT_FALSE(service.is_running());
  EXPECT_FALSE(service.liveness().is_running());
}
