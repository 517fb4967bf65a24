/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/liveness_tracker.hpp"
#include "fleet/error.hpp"

#include <algorithm>
#include <iostream>

namespace tfleet {

LivenessTracker::LivenessTracker(WorkerRegistry &registry, std::chrono::milliseconds timeout,
                                 std::chrono::milliseconds dead_retention)
    : registry_(registry), timeout_(timeout), dead_retention_(dead_retention) {
  if (timeout_.count() <= 0) {
    throw std::invalid_argument("Heartbeat timeout must be positive");
  }
  if (dead_retention_.count() < 0) {
    throw std::invalid_argument("Dead worker retention cannot be negative");
  }
}

LivenessTracker::~LivenessTracker() { stop(); }

void LivenessTracker::track(const std::string &worker_id) {
  WorkerHealth health;
  health.worker_id = worker_id;
  health.last_seen = Clock::now();
  health.last_seen_ms = wall_clock_ms();
  if (auto record = registry_.get(worker_id)) {
    health.generation = record->generation;
  }

  std::lock_guard<std::mutex> lock(structure_mutex_);
  HealthMap::accessor acc;
  entries_.insert(acc, worker_id);
  acc->second = std::move(health);
}

void LivenessTracker::forget(const std::string &worker_id) {
  std::lock_guard<std::mutex> lock(structure_mutex_);
  entries_.erase(worker_id);
}

void LivenessTracker::heartbeat(const std::string &worker_id, const WorkerStatus &status,
                                const ResourceSnapshot &resources, int64_t reported_timestamp_ms) {
  HealthMap::accessor acc;
  if (!entries_.find(acc, worker_id)) {
    // registered without going through track()
    if (!registry_.contains(worker_id)) {
      throw errors::unknown_worker(worker_id);
    }
    acc.release();
    track(worker_id);
    if (!entries_.find(acc, worker_id)) {
      throw errors::unknown_worker(worker_id);
    }
  }

  if (acc->second.dead) {
    throw FleetError(ErrorCode::UNKNOWN_WORKER,
                     "Worker " + worker_id + " was declared dead and must re-register");
  }

  WorkerHealth &health = acc->second;
  health.status = status;
  health.resources = resources;
  health.last_seen = Clock::now();
  health.last_seen_ms = wall_clock_ms();
  health.reported_timestamp_ms = reported_timestamp_ms;
  ++health.heartbeat_count;
}

std::vector<std::string> LivenessTracker::sweep() { return sweep(Clock::now()); }

std::vector<std::string> LivenessTracker::sweep(Clock::time_point now) {
  std::vector<std::string> died;
  std::vector<std::string> expired;
  for (const auto &worker_id : tracked_ids()) {
    uint64_t generation = 0;
    {
      HealthMap::accessor acc;
      if (!entries_.find(acc, worker_id)) {
        continue;
      }
      if (acc->second.dead) {
        if (now - acc->second.died_at > dead_retention_) {
          expired.push_back(worker_id);
        }
        continue;
      }
      if (now - acc->second.last_seen <= timeout_) {
        continue;
      }
      acc->second.dead = true;
      acc->second.died_at = now;
      generation = acc->second.generation;
    }

    // the id may have been re-registered since the entry was marked; leave that one alone
    registry_.evict(worker_id, generation);
    died.push_back(worker_id);
    std::cerr << "[LivenessTracker] Worker " << worker_id << " missed heartbeats for more than "
              << timeout_.count() << "ms, marked dead" << std::endl;
  }

  if (!expired.empty()) {
    prune_dead(expired, now);
  }
  return died;
}

void LivenessTracker::prune_dead(const std::vector<std::string> &expired, Clock::time_point now) {
  std::lock_guard<std::mutex> lock(structure_mutex_);
  for (const auto &worker_id : expired) {
    HealthMap::accessor acc;
    // re-tracked since the scan
    if (!entries_.find(acc, worker_id) || !acc->second.dead ||
        now - acc->second.died_at <= dead_retention_) {
      continue;
    }
    entries_.erase(acc);
  }
}

std::optional<WorkerHealth> LivenessTracker::get(const std::string &worker_id) const {
  HealthMap::const_accessor acc;
  if (!entries_.find(acc, worker_id)) {
    return std::nullopt;
  }
  return acc->second;
}

std::vector<WorkerHealth> LivenessTracker::all() const {
  std::vector<WorkerHealth> result;
  for (const auto &worker_id : tracked_ids()) {
    HealthMap::const_accessor acc;
    if (entries_.find(acc, worker_id)) {
      result.push_back(acc->second);
    }
  }
  std::sort(result.begin(), result.end(), [](const WorkerHealth &a, const WorkerHealth &b) {
    return a.worker_id < b.worker_id;
  });
  return result;
}

bool LivenessTracker::is_dead(const std::string &worker_id) const {
  HealthMap::const_accessor acc;
  return entries_.find(acc, worker_id) && acc->second.dead;
}

size_t LivenessTracker::dead_count() const {
  size_t count = 0;
  for (const auto &worker_id : tracked_ids()) {
    if (is_dead(worker_id)) {
      ++count;
    }
  }
  return count;
}

std::vector<std::string> LivenessTracker::tracked_ids() const {
  std::lock_guard<std::mutex> lock(structure_mutex_);
  std::vector<std::string> ids;
  ids.reserve(entries_.size());
  for (const auto &entry : entries_) {
    ids.push_back(entry.first);
  }
  return ids;
}

void LivenessTracker::start(std::chrono::milliseconds interval) {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    std::cerr << "[LivenessTracker] Sweep already running" << std::endl;
    return;
  }
  sweep_thread_ = std::thread(&LivenessTracker::sweep_loop, this, interval);
}

void LivenessTracker::stop() {
  {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    running_.store(false, std::memory_order_release);
  }
  sweep_cv_.notify_all();
  if (sweep_thread_.joinable()) {
    sweep_thread_.join();
  }
}

void LivenessTracker::sweep_loop(std::chrono::milliseconds interval) {
  while (running_.load(std::memory_order_acquire)) {
    {
      std::unique_lock<std::mutex> lock(sweep_mutex_);
      sweep_cv_.wait_for(lock, interval,
                         [this]() { return !running_.load(std::memory_order_acquire); });
    }
    if (!running_.load(std::memory_order_acquire)) {
      break;
    }
    try {
      sweep();
    } catch (const std::exception &e) {
      std::cerr << "[LivenessTracker] Sweep failed: " << e.what() << std::endl;
    }
  }
}

} // namespace tfleet
