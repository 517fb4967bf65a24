/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/shard_planner.hpp"
#include "fleet/error.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <random>

namespace tfleet {

namespace {

uint64_t splitmix64(uint64_t x) {
  x += 0x9E3779B97F4A7C15ULL;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
  return x ^ (x >> 31);
}

// Uniform draw in [0, bound). std::uniform_int_distribution is implementation-defined.
uint64_t bounded_draw(std::mt19937_64 &gen, uint64_t bound) {
  const uint64_t threshold = (0 - bound) % bound;
  for (;;) {
    const uint64_t r = gen();
    if (r >= threshold) {
      return r % bound;
    }
  }
}

} // namespace

DatasetShardPlanner::DatasetShardPlanner(const WorkerRegistry &registry,
                                         uint64_t max_shuffle_samples,
                                         size_t permutation_cache_size)
    : registry_(registry), max_shuffle_samples_(max_shuffle_samples),
      permutation_cache_size_(permutation_cache_size) {
  if (max_shuffle_samples_ == 0 || permutation_cache_size_ == 0) {
    throw std::invalid_argument("Shuffle sample cap and permutation cache size must be positive");
  }
}

bool DatasetShardPlanner::register_dataset(const DatasetSpec &spec) {
  if (spec.dataset_id.empty()) {
    throw errors::invalid_argument("dataset_id must not be empty");
  }
  if (spec.shard_size == 0) {
    throw errors::invalid_argument("shard_size must be greater than 0 for dataset " +
                                   spec.dataset_id);
  }
  if (spec.shuffle && spec.total_samples > max_shuffle_samples_) {
    throw errors::invalid_argument("Dataset " + spec.dataset_id + " has " +
                                   std::to_string(spec.total_samples) +
                                   " samples, shuffling is limited to " +
                                   std::to_string(max_shuffle_samples_));
  }

  std::lock_guard<std::mutex> lock(catalog_mutex_);
  DatasetMap::accessor acc;
  if (datasets_.insert(acc, spec.dataset_id)) {
    acc->second.spec = spec;
    acc->second.registered_at_ms = wall_clock_ms();
    std::cout << "[ShardPlanner] Registered dataset " << spec.dataset_id << " ("
              << spec.total_samples << " samples, " << spec.total_shards() << " shards, shuffle="
              << (spec.shuffle ? "on" : "off") << ")" << std::endl;
    return true;
  }

  if (acc->second.spec != spec) {
    throw FleetError(ErrorCode::SPEC_MISMATCH,
                     "Dataset " + spec.dataset_id + " already registered with a different spec");
  }
  return false;
}

std::optional<DatasetEntry> DatasetShardPlanner::get_dataset(const std::string &dataset_id) const {
  DatasetMap::const_accessor acc;
  if (!datasets_.find(acc, dataset_id)) {
    return std::nullopt;
  }
  return acc->second;
}

std::vector<DatasetEntry> DatasetShardPlanner::all_datasets() const {
  std::vector<DatasetEntry> entries;
  {
    std::lock_guard<std::mutex> lock(catalog_mutex_);
    for (const auto &entry : datasets_) {
      entries.push_back(entry.second);
    }
  }
  std::sort(entries.begin(), entries.end(), [](const DatasetEntry &a, const DatasetEntry &b) {
    return a.spec.dataset_id < b.spec.dataset_id;
  });
  return entries;
}

ShardAssignment DatasetShardPlanner::get_shard(const std::string &worker_id,
                                               const std::string &dataset_id,
                                               uint64_t epoch) const {
  auto dataset = get_dataset(dataset_id);
  if (!dataset) {
    throw errors::not_found("Dataset " + dataset_id);
  }

  auto [slot, world_size] = partition_slot(worker_id);
  if (!dataset->spec.shuffle) {
    return slice_shard(dataset->spec, epoch, slot, world_size, {});
  }
  auto order = cached_permutation(dataset->spec, epoch);
  return slice_shard(dataset->spec, epoch, slot, world_size, *order);
}

DatasetShardPlanner::Permutation
DatasetShardPlanner::cached_permutation(const DatasetSpec &spec, uint64_t epoch) const {
  const std::string key = spec.dataset_id + "#" + std::to_string(epoch);
  {
    PermutationCache::const_accessor acc;
    if (permutations_.find(acc, key)) {
      acc->second.last_used.store(++cache_clock_, std::memory_order_relaxed);
      return acc->second.order;
    }
  }

  // built outside the locks; a concurrent miss on the same key may build it twice
  auto order = std::make_shared<const std::vector<uint64_t>>(
      permutation(spec.total_samples, spec.seed, epoch));

  std::lock_guard<std::mutex> lock(cache_mutex_);
  Permutation result;
  {
    PermutationCache::accessor acc;
    if (permutations_.insert(acc, key)) {
      acc->second.order = std::move(order);
    }
    acc->second.last_used.store(++cache_clock_, std::memory_order_relaxed);
    result = acc->second.order;
  }
  evict_permutations_locked();
  return result;
}

void DatasetShardPlanner::evict_permutations_locked() const {
  while (permutations_.size() > permutation_cache_size_) {
    std::string oldest;
    uint64_t oldest_use = UINT64_MAX;
    for (const auto &entry : permutations_) {
      const uint64_t used = entry.second.last_used.load(std::memory_order_relaxed);
      if (used < oldest_use) {
        oldest_use = used;
        oldest = entry.first;
      }
    }
    permutations_.erase(oldest);
  }
}

std::pair<uint32_t, uint32_t>
DatasetShardPlanner::partition_slot(const std::string &worker_id) const {
  auto record = registry_.get(worker_id);
  if (!record) {
    throw errors::unknown_worker(worker_id);
  }

  // Ranks stay dense unless a departed rank is still quarantined; partition over live workers
  // in rank order so coverage holds either way.
  const auto workers = registry_.all_workers();
  for (size_t i = 0; i < workers.size(); ++i) {
    if (workers[i].info.worker_id == worker_id) {
      return {static_cast<uint32_t>(i), static_cast<uint32_t>(workers.size())};
    }
  }
  // deregistered between the two reads
  throw errors::unknown_worker(worker_id);
}

std::pair<uint64_t, uint64_t> DatasetShardPlanner::partition_bounds(uint64_t total, uint32_t rank,
                                                                    uint32_t world_size) {
  if (world_size == 0 || rank >= world_size) {
    throw errors::invalid_argument("Partition index " + std::to_string(rank) +
                                   " out of range for world size " + std::to_string(world_size));
  }
  const uint64_t base = total / world_size;
  const uint64_t remainder = total % world_size;
  const uint64_t first_long = world_size - remainder;

  const uint64_t start = rank * base + (rank > first_long ? rank - first_long : 0);
  const uint64_t length = base + (rank >= first_long ? 1 : 0);
  return {start, start + length};
}

uint64_t DatasetShardPlanner::epoch_seed(uint64_t seed, uint64_t epoch) {
  return splitmix64(seed ^ splitmix64(epoch));
}

std::vector<uint64_t> DatasetShardPlanner::permutation(uint64_t total, uint64_t seed,
                                                       uint64_t epoch) {
  std::vector<uint64_t> indices(total);
  for (uint64_t i = 0; i < total; ++i) {
    indices[i] = i;
  }

  std::mt19937_64 gen(epoch_seed(seed, epoch));
  for (uint64_t i = total; i > 1; --i) {
    const uint64_t j = bounded_draw(gen, i);
    std::swap(indices[i - 1], indices[j]);
  }
  return indices;
}

std::vector<SampleRange> DatasetShardPlanner::coalesce(std::vector<uint64_t> indices) {
  std::vector<SampleRange> ranges;
  if (indices.empty()) {
    return ranges;
  }
  std::sort(indices.begin(), indices.end());

  SampleRange current{indices[0], indices[0] + 1};
  for (size_t i = 1; i < indices.size(); ++i) {
    if (indices[i] == current.end) {
      ++current.end;
    } else {
      ranges.push_back(current);
      current = SampleRange{indices[i], indices[i] + 1};
    }
  }
  ranges.push_back(current);
  return ranges;
}

ShardAssignment DatasetShardPlanner::compute_shard(const DatasetSpec &spec, uint64_t epoch,
                                                   uint32_t rank, uint32_t world_size) {
  std::vector<uint64_t> order;
  if (spec.shuffle) {
    order = permutation(spec.total_samples, spec.seed, epoch);
  }
  return slice_shard(spec, epoch, rank, world_size, order);
}

ShardAssignment DatasetShardPlanner::slice_shard(const DatasetSpec &spec, uint64_t epoch,
                                                 uint32_t rank, uint32_t world_size,
                                                 const std::vector<uint64_t> &order) {
  auto [start, end] = partition_bounds(spec.total_samples, rank, world_size);

  ShardAssignment assignment;
  assignment.dataset_id = spec.dataset_id;
  assignment.epoch = epoch;
  assignment.shard_id = rank;
  assignment.total_shards = world_size;
  assignment.num_samples = end - start;
  if (!spec.path.empty()) {
    assignment.file_paths.push_back(spec.path);
  }

  if (start == end) {
    return assignment;
  }

  if (!spec.shuffle) {
    assignment.sample_ranges.push_back(SampleRange{start, end});
    return assignment;
  }

  std::vector<uint64_t> slice(order.begin() + static_cast<std::ptrdiff_t>(start),
                              order.begin() + static_cast<std::ptrdiff_t>(end));
  assignment.sample_ranges = coalesce(std::move(slice));
  return assignment;
}

} // namespace tfleet
