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
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tfleet {

/**
 * @brief Coordinator-side record of checkpoints announced by workers. Advisory only: the bytes
 * never pass through here.
 */
class CheckpointRegistry {
public:
  explicit CheckpointRegistry(size_t max_records = 1000);

  CheckpointRegistry(const CheckpointRegistry &) = delete;
  CheckpointRegistry &operator=(const CheckpointRegistry &) = delete;

  /**
   * @brief Inserts or overwrites the record keyed by checkpoint_id.
   * @throws FleetError INVALID_ARGUMENT for an empty checkpoint or worker id.
   */
  void notify_checkpoint(const CheckpointRecord &record);

  std::optional<CheckpointRecord> get(const std::string &checkpoint_id) const;

  // Highest step overall, ties broken by the later timestamp.
  std::optional<CheckpointRecord> latest() const;
  std::optional<CheckpointRecord> latest_for_worker(const std::string &worker_id) const;

  // Newest step first; limit 0 returns everything.
  std::vector<CheckpointRecord> all(size_t limit = 0) const;

  size_t size() const { return records_.size(); }
  uint64_t notification_count() const { return notifications_.load(std::memory_order_relaxed); }

private:
  using RecordMap = tbb::concurrent_hash_map<std::string, CheckpointRecord>;

  void prune_locked();

  RecordMap records_;
  // inserts, pruning and scans
  mutable std::mutex structure_mutex_;
  size_t max_records_;
  std::atomic<uint64_t> notifications_{0};
};

} // namespace tfleet
