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
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tfleet {

struct DatasetEntry {
  DatasetSpec spec;
  int64_t registered_at_ms = 0;
};

/**
 * @brief Deterministic per-epoch partitioning of registered datasets across the live ranks.
 * Assignments are recomputed on every request and never stored. Shuffled orders are kept for the
 * few most recently requested (dataset, epoch) pairs.
 */
class DatasetShardPlanner {
public:
  explicit DatasetShardPlanner(const WorkerRegistry &registry,
                               uint64_t max_shuffle_samples = 1ull << 24,
                               size_t permutation_cache_size = 4);

  /**
   * @brief Registers a dataset. Re-registering an identical spec is a no-op.
   * @return true if the dataset is new, false if an identical spec was already present.
   * @throws FleetError SPEC_MISMATCH if the id exists with a different spec,
   *         INVALID_ARGUMENT for an empty id, a zero shard size or a shuffled dataset larger
   *         than max_shuffle_samples.
   */
  bool register_dataset(const DatasetSpec &spec);

  std::optional<DatasetEntry> get_dataset(const std::string &dataset_id) const;

  // Ordered by dataset id.
  std::vector<DatasetEntry> all_datasets() const;
  size_t dataset_count() const { return datasets_.size(); }

  /**
   * @throws FleetError NOT_FOUND for an unknown dataset, UNKNOWN_WORKER for an unregistered worker.
   */
  ShardAssignment get_shard(const std::string &worker_id, const std::string &dataset_id,
                            uint64_t epoch) const;

  /**
   * @brief Pure partition function: the shard of partition index `rank` out of `world_size`.
   */
  static ShardAssignment compute_shard(const DatasetSpec &spec, uint64_t epoch, uint32_t rank,
                                       uint32_t world_size);

  size_t cached_permutations() const { return permutations_.size(); }
  uint64_t max_shuffle_samples() const { return max_shuffle_samples_; }

  // [start, end) of the contiguous block for `rank`; the remainder goes to the final ranks.
  static std::pair<uint64_t, uint64_t> partition_bounds(uint64_t total, uint32_t rank,
                                                        uint32_t world_size);

  static uint64_t epoch_seed(uint64_t seed, uint64_t epoch);

  // Fisher-Yates permutation of [0, total), identical across standard library implementations.
  static std::vector<uint64_t> permutation(uint64_t total, uint64_t seed, uint64_t epoch);

  // Sorted, coalesced half-open ranges covering the given indices.
  static std::vector<SampleRange> coalesce(std::vector<uint64_t> indices);

private:
  using DatasetMap = tbb::concurrent_hash_map<std::string, DatasetEntry>;
  using Permutation = std::shared_ptr<const std::vector<uint64_t>>;

  struct CachedPermutation {
    Permutation order;
    mutable std::atomic<uint64_t> last_used{0};
  };
  // keyed by "<dataset_id>#<epoch>"
  using PermutationCache = tbb::concurrent_hash_map<std::string, CachedPermutation>;

  // position of the worker among live ranks, plus the live count
  std::pair<uint32_t, uint32_t> partition_slot(const std::string &worker_id) const;

  // `order` is empty unless the dataset is shuffled
  static ShardAssignment slice_shard(const DatasetSpec &spec, uint64_t epoch, uint32_t rank,
                                     uint32_t world_size, const std::vector<uint64_t> &order);

  Permutation cached_permutation(const DatasetSpec &spec, uint64_t epoch) const;
  void evict_permutations_locked() const;

  const WorkerRegistry &registry_;
  uint64_t max_shuffle_samples_;
  size_t permutation_cache_size_;

  DatasetMap datasets_;
  // serializes inserts against iteration
  mutable std::mutex catalog_mutex_;

  mutable PermutationCache permutations_;
  // serializes cache inserts against the eviction scan
  mutable std::mutex cache_mutex_;
  mutable std::atomic<uint64_t> cache_clock_{0};
};

} // namespace tfleet
