/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/barrier_coordinator.hpp"
#include "fleet/error.hpp"

#include <algorithm>
#include <iostream>

namespace tfleet {

nlohmann::json BarrierSnapshot::to_json() const {
  return nlohmann::json{{"id", barrier_id},
                        {"name", barrier_id},
                        {"step", step},
                        {"arrived", arrived},
                        {"total", participants},
                        {"status", complete ? "complete" : "waiting"},
                        {"created_at", created_at_ms}};
}

BarrierCoordinator::BarrierCoordinator(const WorkerRegistry &registry,
                                       std::chrono::milliseconds default_timeout,
                                       std::chrono::milliseconds completion_grace)
    : registry_(registry), default_timeout_(default_timeout), completion_grace_(completion_grace) {
  if (default_timeout_.count() <= 0) {
    throw std::invalid_argument("Barrier timeout must be positive");
  }
  if (default_timeout_ > kMaxBarrierTimeout) {
    throw std::invalid_argument("Barrier timeout exceeds " +
                                std::to_string(kMaxBarrierTimeout.count()) + "ms");
  }
}

BarrierCoordinator::~BarrierCoordinator() { cancel_all(); }

std::shared_ptr<BarrierCoordinator::Barrier>
BarrierCoordinator::make_barrier(const std::string &barrier_id, uint64_t step) const {
  auto barrier = std::make_shared<Barrier>();
  barrier->barrier_id = barrier_id;
  barrier->step = step;
  barrier->participants = std::max<uint32_t>(1, registry_.world_size());
  barrier->created_at_ms = wall_clock_ms();
  return barrier;
}

bool BarrierCoordinator::has_waiters(const Barrier &barrier) {
  for (const auto &entry : barrier.waiting) {
    if (entry.second > 0) {
      return true;
    }
  }
  return false;
}

void BarrierCoordinator::leave(Barrier &barrier, const std::string &worker_id,
                               bool drop_arrival) {
  auto it = barrier.waiting.find(worker_id);
  if (it == barrier.waiting.end()) {
    return;
  }
  if (--it->second > 0) {
    return;
  }
  barrier.waiting.erase(it);
  if (drop_arrival) {
    auto pos = std::find(barrier.arrived.begin(), barrier.arrived.end(), worker_id);
    if (pos != barrier.arrived.end()) {
      barrier.arrived.erase(pos);
    }
  }
}

BarrierResult BarrierCoordinator::wait_barrier(const std::string &worker_id,
                                               const std::string &barrier_id, uint64_t step,
                                               std::optional<std::chrono::milliseconds> timeout,
                                               CancelToken cancel_token) {
  if (barrier_id.empty()) {
    throw errors::invalid_argument("barrier_id must not be empty");
  }
  if (timeout && (timeout->count() <= 0 || *timeout > kMaxBarrierTimeout)) {
    throw errors::invalid_argument("Barrier timeout must be in (0, " +
                                   std::to_string(kMaxBarrierTimeout.count()) + "] ms, got " +
                                   std::to_string(timeout->count()));
  }
  if (!registry_.contains(worker_id)) {
    throw errors::unknown_worker(worker_id);
  }

  auto token_set = [&cancel_token]() {
    return cancel_token && cancel_token->load(std::memory_order_acquire);
  };
  auto cancelled_error = [&]() {
    return FleetError(ErrorCode::CANCELLED,
                      "Wait on barrier " + barrier_id + " by " + worker_id + " was cancelled");
  };
  if (token_set()) {
    throw cancelled_error();
  }

  const auto wait_for = timeout.value_or(default_timeout_);
  const auto deadline = Clock::now() + wait_for;

  std::shared_ptr<Barrier> barrier;
  std::unique_lock<std::mutex> lock;
  uint64_t generation = 0;

  {
    BarrierMap::accessor acc;
    if (!barriers_.find(acc, barrier_id)) {
      std::lock_guard<std::mutex> structure_lock(structure_mutex_);
      barriers_.insert(acc, barrier_id);
    }

    bool fresh_round = !acc->second;
    if (!fresh_round) {
      std::lock_guard<std::mutex> current_lock(acc->second->mutex);
      const Barrier &current = *acc->second;
      // nobody waiting on an open barrier means every earlier caller left; resnapshot the world
      const bool abandoned = !current.complete && !has_waiters(current);
      fresh_round = current.retired || abandoned || (current.complete && current.step != step);
    }
    if (fresh_round) {
      acc->second = make_barrier(barrier_id, step);
    }

    barrier = acc->second;
    lock = std::unique_lock<std::mutex>(barrier->mutex);

    if (barrier->complete) {
      auto it = barrier->final_order.find(worker_id);
      if (it != barrier->final_order.end()) {
        return BarrierResult{it->second, barrier->participants};
      }
      throw FleetError(ErrorCode::ALREADY_COMPLETE,
                       "Barrier " + barrier_id + " at step " + std::to_string(step) +
                           " already released without worker " + worker_id);
    }

    if (barrier->step != step) {
      throw errors::invalid_argument("Barrier " + barrier_id + " is open at step " +
                                     std::to_string(barrier->step) + ", worker " + worker_id +
                                     " arrived with step " + std::to_string(step));
    }

    // cancel() takes this mutex, so a token set before it ran is visible here
    if (token_set()) {
      throw cancelled_error();
    }

    if (std::find(barrier->arrived.begin(), barrier->arrived.end(), worker_id) ==
        barrier->arrived.end()) {
      barrier->arrived.push_back(worker_id);
    }
    ++barrier->waiting[worker_id];
    generation = barrier->cancel_generation[worker_id];

    if (barrier->arrived.size() >= barrier->participants) {
      for (size_t i = 0; i < barrier->arrived.size(); ++i) {
        barrier->final_order[barrier->arrived[i]] = static_cast<uint32_t>(i + 1);
      }
      barrier->complete = true;
      barrier->completed_at = Clock::now();
      completed_.fetch_add(1, std::memory_order_relaxed);

      std::cout << "[BarrierCoordinator] Barrier " << barrier_id << " (step " << step
                << ") released " << barrier->participants << " participants" << std::endl;

      leave(*barrier, worker_id, false);
      barrier->cv.notify_all();
      return BarrierResult{barrier->final_order[worker_id], barrier->participants};
    }
  }

  auto cancelled = [&]() { return barrier->cancel_generation[worker_id] != generation; };
  barrier->cv.wait_until(lock, deadline, [&]() {
    return barrier->complete || barrier->shutdown || cancelled() || token_set();
  });

  if (barrier->complete) {
    auto it = barrier->final_order.find(worker_id);
    if (it != barrier->final_order.end()) {
      leave(*barrier, worker_id, false);
      return BarrierResult{it->second, barrier->participants};
    }
  }

  if (token_set()) {
    leave(*barrier, worker_id, true);
    throw cancelled_error();
  }
  if (barrier->shutdown || cancelled()) {
    leave(*barrier, worker_id, false);
    throw cancelled_error();
  }

  leave(*barrier, worker_id, true);
  timeouts_.fetch_add(1, std::memory_order_relaxed);
  std::cerr << "[BarrierCoordinator] Worker " << worker_id << " timed out on barrier "
            << barrier_id << " after " << wait_for.count() << "ms (" << barrier->arrived.size()
            << "/" << barrier->participants << " arrived)" << std::endl;
  throw FleetError(ErrorCode::BARRIER_TIMEOUT, "Barrier " + barrier_id + " timed out after " +
                                                   std::to_string(wait_for.count()) + "ms");
}

bool BarrierCoordinator::cancel(const std::string &worker_id, const std::string &barrier_id) {
  BarrierMap::const_accessor acc;
  if (!barriers_.find(acc, barrier_id) || !acc->second) {
    return false;
  }

  Barrier &barrier = *acc->second;
  std::lock_guard<std::mutex> lock(barrier.mutex);
  if (barrier.complete) {
    return false;
  }

  auto pos = std::find(barrier.arrived.begin(), barrier.arrived.end(), worker_id);
  if (pos == barrier.arrived.end()) {
    return false;
  }
  barrier.arrived.erase(pos);
  ++barrier.cancel_generation[worker_id];
  barrier.cv.notify_all();

  std::cout << "[BarrierCoordinator] Cancelled wait of " << worker_id << " on barrier "
            << barrier_id << std::endl;
  return true;
}

void BarrierCoordinator::cancel_all() {
  for (const auto &barrier_id : barrier_ids()) {
    BarrierMap::const_accessor acc;
    if (!barriers_.find(acc, barrier_id) || !acc->second) {
      continue;
    }
    std::lock_guard<std::mutex> lock(acc->second->mutex);
    acc->second->shutdown = true;
    acc->second->cv.notify_all();
  }
}

size_t BarrierCoordinator::reap() { return reap(Clock::now()); }

size_t BarrierCoordinator::reap(Clock::time_point now) {
  std::vector<std::pair<std::string, std::shared_ptr<Barrier>>> retired;

  for (const auto &barrier_id : barrier_ids()) {
    BarrierMap::accessor acc;
    if (!barriers_.find(acc, barrier_id) || !acc->second) {
      continue;
    }
    Barrier &barrier = *acc->second;
    std::lock_guard<std::mutex> lock(barrier.mutex);
    const bool expired = barrier.complete && now - barrier.completed_at >= completion_grace_;
    const bool abandoned = !barrier.complete && !has_waiters(barrier);
    if (expired || abandoned) {
      barrier.retired = true;
      retired.emplace_back(barrier_id, acc->second);
    }
  }

  size_t removed = 0;
  std::lock_guard<std::mutex> structure_lock(structure_mutex_);
  for (const auto &entry : retired) {
    BarrierMap::accessor acc;
    // a new round may have replaced the retired barrier in the meantime
    if (barriers_.find(acc, entry.first) && acc->second == entry.second) {
      barriers_.erase(acc);
      ++removed;
    }
  }
  return removed;
}

std::vector<std::string> BarrierCoordinator::barrier_ids() const {
  std::lock_guard<std::mutex> lock(structure_mutex_);
  std::vector<std::string> ids;
  ids.reserve(barriers_.size());
  for (const auto &entry : barriers_) {
    ids.push_back(entry.first);
  }
  return ids;
}

std::vector<BarrierSnapshot> BarrierCoordinator::snapshot() const {
  std::vector<BarrierSnapshot> result;
  for (const auto &barrier_id : barrier_ids()) {
    BarrierMap::const_accessor acc;
    if (!barriers_.find(acc, barrier_id) || !acc->second) {
      continue;
    }
    const Barrier &barrier = *acc->second;
    std::lock_guard<std::mutex> lock(acc->second->mutex);

    BarrierSnapshot snap;
    snap.barrier_id = barrier.barrier_id;
    snap.step = barrier.step;
    snap.participants = barrier.participants;
    snap.arrived = static_cast<uint32_t>(barrier.complete ? barrier.final_order.size()
                                                          : barrier.arrived.size());
    snap.complete = barrier.complete;
    snap.created_at_ms = barrier.created_at_ms;
    result.push_back(std::move(snap));
  }
  std::sort(result.begin(), result.end(), [](const BarrierSnapshot &a, const BarrierSnapshot &b) {
    return a.barrier_id < b.barrier_id;
  });
  return result;
}

size_t BarrierCoordinator::active_count() const {
  size_t count = 0;
  for (const auto &snap : snapshot()) {
    if (!snap.complete) {
      ++count;
    }
  }
  return count;
}

} // namespace tfleet
