/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "types.hpp"

#include <tbb/concurrent_hash_map.h>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tfleet {

/**
 * @brief Admission control for the worker fleet. Hands out the smallest rank that is neither
 * held by a live worker nor still quarantined after a departure.
 */
class WorkerRegistry {
public:
  WorkerRegistry(uint32_t max_workers = 10000,
                 std::chrono::milliseconds rank_grace = std::chrono::milliseconds(5000),
                 int64_t heartbeat_interval_ms = 5000);

  WorkerRegistry(const WorkerRegistry &) = delete;
  WorkerRegistry &operator=(const WorkerRegistry &) = delete;

  /**
   * @brief Admits a worker and assigns its rank.
   * @return rank, world size at this instant (including the caller) and expected heartbeat interval
   * @throws FleetError DUPLICATE_WORKER if the id is live, INVALID_ARGUMENT for an empty id,
   *         RESOURCE_EXHAUSTED once max_workers are registered.
   */
  Registration register_worker(const WorkerInfo &info);

  /**
   * @brief Removes a worker. Idempotent; the freed rank stays quarantined for the grace period.
   * @return true if the worker was registered.
   */
  bool deregister_worker(const std::string &worker_id);

  // Same path as deregistration, used by the liveness sweep.
  bool evict(const std::string &worker_id);

  /**
   * @brief Evicts the worker only while it is still the registration with this generation.
   * @return false if the id is gone or was registered again since.
   */
  bool evict(const std::string &worker_id, uint64_t generation);

  std::optional<WorkerRecord> get(const std::string &worker_id) const;
  bool contains(const std::string &worker_id) const;
  uint32_t world_size() const { return world_size_.load(std::memory_order_acquire); }

  // Ordered by rank.
  std::vector<WorkerRecord> all_workers() const;

  size_t quarantined_rank_count() const;
  std::chrono::milliseconds rank_grace() const { return rank_grace_; }
  uint32_t max_workers() const { return max_workers_; }

private:
  using WorkerMap = tbb::concurrent_hash_map<std::string, WorkerRecord>;

  bool remove(const std::string &worker_id, const char *reason,
              std::optional<uint64_t> generation = std::nullopt);
  uint32_t next_free_rank(Clock::time_point now);
  void release_expired_ranks(Clock::time_point now);

  WorkerMap workers_;
  std::atomic<uint32_t> world_size_{0};

  // admission_mutex_ serializes rank bookkeeping; lookups go through map accessors only
  mutable std::mutex admission_mutex_;
  std::set<uint32_t> held_ranks_;
  std::map<uint32_t, Clock::time_point> quarantined_ranks_;
  uint64_t next_generation_ = 0;

  uint32_t max_workers_;
  std::chrono::milliseconds rank_grace_;
  int64_t heartbeat_interval_ms_;
};

} // namespace tfleet
