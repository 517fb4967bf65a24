/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/worker_registry.hpp"
#include "fleet/error.hpp"

#include <algorithm>
#include <iostream>

namespace tfleet {

WorkerRegistry::WorkerRegistry(uint32_t max_workers, std::chrono::milliseconds rank_grace,
                               int64_t heartbeat_interval_ms)
    : max_workers_(max_workers), rank_grace_(rank_grace),
      heartbeat_interval_ms_(heartbeat_interval_ms) {
  if (max_workers_ == 0) {
    throw std::invalid_argument("WorkerRegistry requires max_workers > 0");
  }
  if (rank_grace_.count() < 0) {
    throw std::invalid_argument("Rank grace period cannot be negative");
  }
}

Registration WorkerRegistry::register_worker(const WorkerInfo &info) {
  if (info.worker_id.empty()) {
    throw errors::invalid_argument("worker_id must not be empty");
  }

  std::lock_guard<std::mutex> lock(admission_mutex_);

  if (held_ranks_.size() >= max_workers_) {
    throw FleetError(ErrorCode::RESOURCE_EXHAUSTED,
                     "Worker limit reached (" + std::to_string(max_workers_) + ")");
  }

  const auto now = Clock::now();
  WorkerRecord record;
  record.info = info;
  record.registered_at = now;
  record.registered_at_ms = wall_clock_ms();

  WorkerMap::accessor acc;
  if (!workers_.insert(acc, info.worker_id)) {
    throw FleetError(ErrorCode::DUPLICATE_WORKER, "Worker already registered: " + info.worker_id);
  }

  record.rank = next_free_rank(now);
  record.generation = ++next_generation_;
  acc->second = record;
  held_ranks_.insert(record.rank);
  acc.release();

  const uint32_t world = world_size_.fetch_add(1, std::memory_order_acq_rel) + 1;

  std::cout << "[WorkerRegistry] Registered " << info.worker_id << " (" << info.hostname << ":"
            << info.port << ", gpus=" << info.gpu_count << ") rank=" << record.rank
            << " world_size=" << world << std::endl;

  Registration result;
  result.rank = record.rank;
  result.world_size = world;
  result.heartbeat_interval_ms = heartbeat_interval_ms_;
  return result;
}

bool WorkerRegistry::deregister_worker(const std::string &worker_id) {
  return remove(worker_id, "deregistered");
}

bool WorkerRegistry::evict(const std::string &worker_id) { return remove(worker_id, "evicted"); }

bool WorkerRegistry::evict(const std::string &worker_id, uint64_t generation) {
  return remove(worker_id, "evicted", generation);
}

bool WorkerRegistry::remove(const std::string &worker_id, const char *reason,
                            std::optional<uint64_t> generation) {
  std::lock_guard<std::mutex> lock(admission_mutex_);

  WorkerMap::accessor acc;
  if (!workers_.find(acc, worker_id)) {
    return false;
  }
  if (generation && acc->second.generation != *generation) {
    return false;
  }

  const uint32_t rank = acc->second.rank;
  workers_.erase(acc);

  held_ranks_.erase(rank);
  if (rank_grace_.count() > 0) {
    quarantined_ranks_[rank] = Clock::now() + rank_grace_;
  }
  world_size_.fetch_sub(1, std::memory_order_acq_rel);

  std::cout << "[WorkerRegistry] Worker " << worker_id << " " << reason << ", rank " << rank
            << " released" << std::endl;
  return true;
}

uint32_t WorkerRegistry::next_free_rank(Clock::time_point now) {
  release_expired_ranks(now);

  uint32_t candidate = 0;
  while (held_ranks_.count(candidate) > 0 || quarantined_ranks_.count(candidate) > 0) {
    ++candidate;
  }
  return candidate;
}

void WorkerRegistry::release_expired_ranks(Clock::time_point now) {
  for (auto it = quarantined_ranks_.begin(); it != quarantined_ranks_.end();) {
    if (it->second <= now) {
      it = quarantined_ranks_.erase(it);
    } else {
      ++it;
    }
  }
}

std::optional<WorkerRecord> WorkerRegistry::get(const std::string &worker_id) const {
  WorkerMap::const_accessor acc;
  if (!workers_.find(acc, worker_id)) {
    return std::nullopt;
  }
  return acc->second;
}

bool WorkerRegistry::contains(const std::string &worker_id) const {
  WorkerMap::const_accessor acc;
  return workers_.find(acc, worker_id);
}

std::vector<WorkerRecord> WorkerRegistry::all_workers() const {
  std::vector<WorkerRecord> records;
  {
    // iteration is not safe against concurrent erase
    std::lock_guard<std::mutex> lock(admission_mutex_);
    records.reserve(workers_.size());
    for (const auto &entry : workers_) {
      records.push_back(entry.second);
    }
  }
  std::sort(records.begin(), records.end(),
            [](const WorkerRecord &a, const WorkerRecord &b) { return a.rank < b.rank; });
  return records;
}

size_t WorkerRegistry::quarantined_rank_count() const {
  std::lock_guard<std::mutex> lock(admission_mutex_);
  const auto now = Clock::now();
  return static_cast<size_t>(std::count_if(
      quarantined_ranks_.begin(), quarantined_ranks_.end(),
      [now](const std::pair<const uint32_t, Clock::time_point> &q) { return q.second > now; }));
}

} // namespace tfleet
