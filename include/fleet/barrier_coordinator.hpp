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
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tfleet {

// Set by the owner of a wait (e.g. its connection) once nobody will read the result.
using CancelToken = std::shared_ptr<const std::atomic<bool>>;

struct BarrierSnapshot {
  std::string barrier_id;
  uint64_t step = 0;
  uint32_t participants = 0;
  uint32_t arrived = 0;
  bool complete = false;
  int64_t created_at_ms = 0;

  nlohmann::json to_json() const;
};

/**
 * @brief Named rendezvous points across the live worker set. Each barrier snapshots the world size
 * at its first arrival and releases every caller once that many distinct workers have arrived.
 * Barriers with different ids never share a lock.
 */
class BarrierCoordinator {
public:
  BarrierCoordinator(const WorkerRegistry &registry, std::chrono::milliseconds default_timeout,
                     std::chrono::milliseconds completion_grace);
  ~BarrierCoordinator();

  BarrierCoordinator(const BarrierCoordinator &) = delete;
  BarrierCoordinator &operator=(const BarrierCoordinator &) = delete;

  /**
   * @brief Blocks until every participant has arrived, the timeout elapses or the call is
   * cancelled. Repeated calls from the same worker share its original arrival order.
   * @param timeout per-call bound in (0, kMaxBarrierTimeout], the coordinator default when absent
   * @param cancel_token checked before the arrival is recorded and whenever the wait wakes; a set
   *        token never leaves an arrival behind
   * @throws FleetError BARRIER_TIMEOUT, CANCELLED, ALREADY_COMPLETE (non-member after release),
   *         UNKNOWN_WORKER, INVALID_ARGUMENT (empty id, timeout out of range or step differing
   *         from the open round).
   */
  BarrierResult wait_barrier(const std::string &worker_id, const std::string &barrier_id,
                             uint64_t step,
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                             CancelToken cancel_token = nullptr);

  /**
   * @brief Withdraws a worker's in-flight calls from an open barrier; they fail with CANCELLED.
   * @return true if the worker had arrived at the barrier.
   */
  bool cancel(const std::string &worker_id, const std::string &barrier_id);

  // Fails every parked caller with CANCELLED; used on shutdown.
  void cancel_all();

  /**
   * @brief Drops completed barriers past their grace period and open barriers nobody waits on.
   * @return number of barriers removed.
   */
  size_t reap();
  size_t reap(Clock::time_point now);

  std::vector<BarrierSnapshot> snapshot() const;
  size_t active_count() const;

  uint64_t completed_count() const { return completed_.load(std::memory_order_relaxed); }
  uint64_t timeout_count() const { return timeouts_.load(std::memory_order_relaxed); }

  std::chrono::milliseconds default_timeout() const { return default_timeout_; }

private:
  struct Barrier {
    std::string barrier_id;
    uint64_t step = 0;
    uint32_t participants = 0;
    int64_t created_at_ms = 0;

    std::mutex mutex;
    std::condition_variable cv;

    // arrival order, index + 1 is the order reported on release
    std::vector<std::string> arrived;
    // in-flight calls per worker
    std::unordered_map<std::string, uint32_t> waiting;
    std::unordered_map<std::string, uint64_t> cancel_generation;
    std::unordered_map<std::string, uint32_t> final_order;

    bool complete = false;
    bool shutdown = false;
    // set by reap before the entry is erased; an arrival that sees it starts a new round
    bool retired = false;
    Clock::time_point completed_at;
  };

  using BarrierMap = tbb::concurrent_hash_map<std::string, std::shared_ptr<Barrier>>;

  std::shared_ptr<Barrier> make_barrier(const std::string &barrier_id, uint64_t step) const;
  std::vector<std::string> barrier_ids() const;

  static bool has_waiters(const Barrier &barrier);
  static void leave(Barrier &barrier, const std::string &worker_id, bool drop_arrival);

  const WorkerRegistry &registry_;
  std::chrono::milliseconds default_timeout_;
  std::chrono::milliseconds completion_grace_;

  BarrierMap barriers_;
  // lock order: structure_mutex_, then a map accessor, then Barrier::mutex
  mutable std::mutex structure_mutex_;

  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> timeouts_{0};
};

} // namespace tfleet
