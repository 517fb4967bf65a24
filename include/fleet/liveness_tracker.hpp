/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "types.hpp"
#include "worker_registry.hpp"

#include <tbb/concurrent_hash_map.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tfleet {

struct WorkerHealth {
  std::string worker_id;
  WorkerStatus status = status::Idle{};
  ResourceSnapshot resources;
  Clock::time_point last_seen;
  int64_t last_seen_ms = 0;
  // timestamp carried by the heartbeat itself, as reported by the worker's clock
  int64_t reported_timestamp_ms = 0;
  uint64_t heartbeat_count = 0;
  // registry generation this entry was tracked for, 0 if it was already gone
  uint64_t generation = 0;
  bool dead = false;
  Clock::time_point died_at;
};

/**
 * @brief Heartbeat ingestion and dead-worker detection. Workers whose last heartbeat is older
 * than the timeout are marked dead and evicted from the registry. Dead entries are dropped once
 * they have been dead for the retention period.
 */
class LivenessTracker {
public:
  LivenessTracker(WorkerRegistry &registry, std::chrono::milliseconds timeout,
                  std::chrono::milliseconds dead_retention = std::chrono::minutes(10));
  ~LivenessTracker();

  LivenessTracker(const LivenessTracker &) = delete;
  LivenessTracker &operator=(const LivenessTracker &) = delete;

  // Starts tracking a freshly registered worker; it counts as seen now.
  void track(const std::string &worker_id);

  // Drops the entry entirely (explicit deregistration).
  void forget(const std::string &worker_id);

  /**
   * @brief Overwrites the worker's status and resource snapshot and refreshes last_seen.
   * @throws FleetError UNKNOWN_WORKER if the worker is not registered or was declared dead.
   */
  void heartbeat(const std::string &worker_id, const WorkerStatus &status,
                 const ResourceSnapshot &resources, int64_t reported_timestamp_ms = 0);

  /**
   * @brief Marks every worker silent for longer than the timeout as dead and evicts the
   * registration it was tracked for, then forgets entries dead for longer than the retention.
   * @return ids that died in this sweep.
   */
  std::vector<std::string> sweep();
  std::vector<std::string> sweep(Clock::time_point now);

  std::optional<WorkerHealth> get(const std::string &worker_id) const;
  std::vector<WorkerHealth> all() const;
  bool is_dead(const std::string &worker_id) const;
  size_t dead_count() const;

  void start(std::chrono::milliseconds interval);
  void stop();
  bool is_running() const { return running_.load(std::memory_order_acquire); }

  std::chrono::milliseconds timeout() const { return timeout_; }
  std::chrono::milliseconds dead_retention() const { return dead_retention_; }

private:
  using HealthMap = tbb::concurrent_hash_map<std::string, WorkerHealth>;

  void sweep_loop(std::chrono::milliseconds interval);
  // keys only; values are read through accessors
  std::vector<std::string> tracked_ids() const;
  void prune_dead(const std::vector<std::string> &expired, Clock::time_point now);

  WorkerRegistry &registry_;
  std::chrono::milliseconds timeout_;
  std::chrono::milliseconds dead_retention_;

  HealthMap entries_;
  // held for inserts, erases and key scans
  mutable std::mutex structure_mutex_;

  std::atomic<bool> running_{false};
  std::thread sweep_thread_;
  std::mutex sweep_mutex_;
  std::condition_variable sweep_cv_;
};

} // namespace tfleet
