/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "barrier_coordinator.hpp"
#include "checkpoint_registry.hpp"
#include "config.hpp"
#include "liveness_tracker.hpp"
#include "shard_planner.hpp"
#include "types.hpp"
#include "worker_registry.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tfleet {

struct DatasetAck {
  std::string dataset_id;
  uint64_t total_shards = 0;
  // false when an identical spec was already registered
  bool created = false;
};

struct RecoveryInfo {
  bool has_checkpoint = false;
  CheckpointRecord checkpoint;
  uint64_t resume_step = 0;
  uint64_t resume_epoch = 0;
  // the caller's shard of every registered dataset at the checkpoint's epoch
  std::vector<ShardAssignment> shard_assignments;
};

/**
 * @brief The coordinator: owns one instance of each component, counts requests and runs the
 * maintenance loop (liveness sweep, barrier reaping, snapshot publication).
 *
 * Every public call is safe to invoke concurrently. Only wait_barrier blocks.
 */
class CoordinatorService {
public:
  explicit CoordinatorService(const CoordinatorConfig &config);
  ~CoordinatorService();

  CoordinatorService(const CoordinatorService &) = delete;
  CoordinatorService &operator=(const CoordinatorService &) = delete;

  Registration register_worker(const WorkerInfo &info);
  bool deregister_worker(const std::string &worker_id);

  DatasetAck register_dataset(const DatasetSpec &spec);
  ShardAssignment get_data_shard(const std::string &worker_id, const std::string &dataset_id,
                                 uint64_t epoch);

  /**
   * @return the coordinator's wall clock in milliseconds
   */
  int64_t heartbeat(const std::string &worker_id, const WorkerStatus &status,
                    const ResourceSnapshot &resources, int64_t timestamp_ms);

  void notify_checkpoint(const CheckpointRecord &record);

  /**
   * @brief Newest checkpoint of this worker, or of the whole fleet if it has none.
   */
  RecoveryInfo get_latest_checkpoint(const std::string &worker_id);

  BarrierResult wait_barrier(const std::string &worker_id, const std::string &barrier_id,
                             uint64_t step,
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                             CancelToken cancel_token = nullptr);
  bool cancel_barrier(const std::string &worker_id, const std::string &barrier_id);

  /**
   * @brief Read-only view for the dashboard:
   * {coordinator, workers, datasets, checkpoints, barriers, metrics}.
   */
  nlohmann::json snapshot() const;

  // Liveness sweep, barrier reaping and snapshot publication, run once.
  void maintenance_tick();

  void start();
  void stop();
  bool is_running() const { return running_.load(std::memory_order_acquire); }

  // Address reported in the snapshot, set by the server once it is bound.
  void set_address(const std::string &address);

  uint64_t uptime_seconds() const;
  uint64_t total_requests() const { return total_requests_.load(std::memory_order_relaxed); }

  const CoordinatorConfig &config() const { return config_; }
  const WorkerRegistry &registry() const { return registry_; }
  const DatasetShardPlanner &planner() const { return planner_; }
  const LivenessTracker &liveness() const { return liveness_; }
  LivenessTracker &liveness() { return liveness_; }
  BarrierCoordinator &barriers() { return barriers_; }
  const CheckpointRegistry &checkpoints() const { return checkpoints_; }

private:
  void count_request() { total_requests_.fetch_add(1, std::memory_order_relaxed); }
  nlohmann::json worker_json(const WorkerHealth &health) const;
  void write_snapshot_file() const;
  // the background part of a tick; the liveness sweep has its own thread
  void publish_tick();
  void maintenance_loop();

  CoordinatorConfig config_;

  WorkerRegistry registry_;
  DatasetShardPlanner planner_;
  LivenessTracker liveness_;
  BarrierCoordinator barriers_;
  CheckpointRegistry checkpoints_;

  Clock::time_point started_at_;
  mutable std::mutex address_mutex_;
  std::string address_;

  std::atomic<uint64_t> total_requests_{0};
  std::atomic<uint64_t> shard_requests_{0};
  std::atomic<uint64_t> heartbeats_{0};
  std::atomic<uint64_t> checkpoint_bytes_{0};

  std::atomic<bool> running_{false};
  std::thread maintenance_thread_;
  std::mutex maintenance_mutex_;
  std::condition_variable maintenance_cv_;
};

} // namespace tfleet
