/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/coordinator_service.hpp"
#include "fleet/error.hpp"
#include "utils/misc.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unordered_map>

namespace tfleet {

namespace {

constexpr size_t kSnapshotCheckpointLimit = 20;

} // namespace

CoordinatorService::CoordinatorService(const CoordinatorConfig &config)
    : config_(config), registry_(config.max_workers, config.rank_grace(),
                                 config.heartbeat_interval_ms),
      planner_(registry_, config.max_shuffle_samples, config.permutation_cache_size),
      liveness_(registry_, config.heartbeat_timeout(), config.dead_worker_retention()),
      barriers_(registry_, config.barrier_timeout(), config.barrier_grace()),
      checkpoints_(config.max_checkpoint_records), started_at_(Clock::now()),
      address_(config.bind_address + ":" + std::to_string(config.port)) {}

CoordinatorService::~CoordinatorService() { stop(); }

Registration CoordinatorService::register_worker(const WorkerInfo &info) {
  count_request();
  Registration registration = registry_.register_worker(info);
  liveness_.track(info.worker_id);
  return registration;
}

bool CoordinatorService::deregister_worker(const std::string &worker_id) {
  count_request();
  const bool removed = registry_.deregister_worker(worker_id);
  liveness_.forget(worker_id);
  return removed;
}

DatasetAck CoordinatorService::register_dataset(const DatasetSpec &spec) {
  count_request();
  DatasetAck ack;
  ack.created = planner_.register_dataset(spec);
  ack.dataset_id = spec.dataset_id;
  ack.total_shards = spec.total_shards();
  return ack;
}

ShardAssignment CoordinatorService::get_data_shard(const std::string &worker_id,
                                                   const std::string &dataset_id, uint64_t epoch) {
  count_request();
  shard_requests_.fetch_add(1, std::memory_order_relaxed);
  return planner_.get_shard(worker_id, dataset_id, epoch);
}

int64_t CoordinatorService::heartbeat(const std::string &worker_id, const WorkerStatus &status,
                                      const ResourceSnapshot &resources, int64_t timestamp_ms) {
  count_request();
  liveness_.heartbeat(worker_id, status, resources, timestamp_ms);
  heartbeats_.fetch_add(1, std::memory_order_relaxed);
  return wall_clock_ms();
}

void CoordinatorService::notify_checkpoint(const CheckpointRecord &record) {
  count_request();
  checkpoints_.notify_checkpoint(record);
  checkpoint_bytes_.fetch_add(record.size_bytes, std::memory_order_relaxed);
}

RecoveryInfo CoordinatorService::get_latest_checkpoint(const std::string &worker_id) {
  count_request();

  RecoveryInfo info;
  std::optional<CheckpointRecord> record;
  if (!worker_id.empty()) {
    record = checkpoints_.latest_for_worker(worker_id);
  }
  if (!record) {
    record = checkpoints_.latest();
  }
  if (!record) {
    return info;
  }

  info.has_checkpoint = true;
  info.checkpoint = *record;
  info.resume_step = record->step;
  info.resume_epoch = record->epoch;

  if (!worker_id.empty() && registry_.contains(worker_id)) {
    for (const auto &dataset : planner_.all_datasets()) {
      try {
        info.shard_assignments.push_back(
            planner_.get_shard(worker_id, dataset.spec.dataset_id, record->epoch));
      } catch (const FleetError &e) {
        // worker left while the recovery plan was being built
        std::cerr << "[Coordinator] Skipping shard of " << dataset.spec.dataset_id
                  << " for recovery of " << worker_id << ": " << e.what() << std::endl;
        break;
      }
    }
  }
  return info;
}

BarrierResult CoordinatorService::wait_barrier(const std::string &worker_id,
                                               const std::string &barrier_id, uint64_t step,
                                               std::optional<std::chrono::milliseconds> timeout,
                                               CancelToken cancel_token) {
  count_request();
  return barriers_.wait_barrier(worker_id, barrier_id, step, timeout, std::move(cancel_token));
}

bool CoordinatorService::cancel_barrier(const std::string &worker_id,
                                        const std::string &barrier_id) {
  return barriers_.cancel(worker_id, barrier_id);
}

void CoordinatorService::set_address(const std::string &address) {
  std::lock_guard<std::mutex> lock(address_mutex_);
  address_ = address;
}

uint64_t CoordinatorService::uptime_seconds() const {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - started_at_).count());
}

nlohmann::json CoordinatorService::worker_json(const WorkerHealth &health) const {
  const char *status = health.dead ? "dead" : worker_state_name(state_of(health.status));
  nlohmann::json worker{{"id", health.worker_id},
                        {"status", status},
                        {"last_heartbeat", health.last_seen_ms},
                        {"heartbeat_count", health.heartbeat_count},
                        {"current_epoch", epoch_of(health.status)},
                        {"current_step", step_of(health.status)},
                        {"current_task", task_of(health.status)},
                        {"resources", health.resources.to_json()}};

  if (auto record = registry_.get(health.worker_id)) {
    worker["ip"] = record->info.hostname;
    worker["port"] = record->info.port;
    worker["gpu_count"] = record->info.gpu_count;
    worker["memory_bytes"] = record->info.memory_bytes;
    worker["rank"] = record->rank;
    worker["registered_at"] = record->registered_at_ms;
  }
  return worker;
}

nlohmann::json CoordinatorService::snapshot() const {
  const uint64_t uptime = uptime_seconds();

  nlohmann::json coordinator;
  {
    std::lock_guard<std::mutex> lock(address_mutex_);
    coordinator = {{"connected", is_running()},
                   {"address", address_},
                   {"uptime", uptime},
                   {"version", kFleetVersion}};
  }

  nlohmann::json workers = nlohmann::json::array();
  std::unordered_map<WorkerState, uint32_t> by_state;
  uint32_t dead = 0;
  for (const auto &health : liveness_.all()) {
    workers.push_back(worker_json(health));
    if (health.dead) {
      ++dead;
    } else {
      ++by_state[state_of(health.status)];
    }
  }

  nlohmann::json datasets = nlohmann::json::array();
  for (const auto &entry : planner_.all_datasets()) {
    nlohmann::json dataset = entry.spec.to_json();
    dataset["id"] = entry.spec.dataset_id;
    dataset["name"] = entry.spec.dataset_id;
    dataset["shard_count"] = entry.spec.total_shards();
    dataset["registered_at"] = entry.registered_at_ms;
    datasets.push_back(std::move(dataset));
  }

  nlohmann::json checkpoints = nlohmann::json::array();
  for (const auto &record : checkpoints_.all(kSnapshotCheckpointLimit)) {
    checkpoints.push_back(record.to_json());
  }

  nlohmann::json barriers = nlohmann::json::array();
  for (const auto &barrier : barriers_.snapshot()) {
    barriers.push_back(barrier.to_json());
  }

  nlohmann::json states = nlohmann::json::object();
  for (WorkerState state : utils::get_enum_vector<WorkerState>()) {
    states[worker_state_name(state)] = by_state[state];
  }

  const uint64_t requests = total_requests();
  nlohmann::json metrics{{"active_workers", registry_.world_size()},
                         {"dead_workers", dead},
                         {"total_workers", registry_.world_size() + dead},
                         {"workers_by_state", states},
                         {"total_requests", requests},
                         {"coordinator_rps", requests / std::max<uint64_t>(1, uptime)},
                         {"shard_requests", shard_requests_.load(std::memory_order_relaxed)},
                         {"heartbeats", heartbeats_.load(std::memory_order_relaxed)},
                         {"checkpoint_count", checkpoints_.size()},
                         {"checkpoint_notifications", checkpoints_.notification_count()},
                         {"checkpoint_bytes", checkpoint_bytes_.load(std::memory_order_relaxed)},
                         {"barriers_active", barriers_.active_count()},
                         {"barriers_completed", barriers_.completed_count()},
                         {"barrier_timeouts", barriers_.timeout_count()}};

  return nlohmann::json{{"coordinator", coordinator}, {"workers", workers},
                        {"datasets", datasets},       {"checkpoints", checkpoints},
                        {"barriers", barriers},       {"metrics", metrics}};
}

void CoordinatorService::write_snapshot_file() const {
  namespace fs = std::filesystem;

  const fs::path target(config_.snapshot_path);
  fs::path tmp = target;
  tmp += ".tmp";

  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw errors::io_failure("Cannot write snapshot to " + tmp.string());
    }
    out << snapshot().dump(2);
    if (!out) {
      throw errors::io_failure("Short write of snapshot " + tmp.string());
    }
  }

  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    throw errors::io_failure("Cannot publish snapshot " + target.string() + ": " + ec.message());
  }
}

void CoordinatorService::maintenance_tick() {
  liveness_.sweep();
  publish_tick();
}

void CoordinatorService::publish_tick() {
  barriers_.reap();
  if (!config_.snapshot_path.empty()) {
    write_snapshot_file();
  }
}

void CoordinatorService::start() {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    std::cerr << "[Coordinator] Already running" << std::endl;
    return;
  }
  liveness_.start(config_.sweep_interval());
  maintenance_thread_ = std::thread(&CoordinatorService::maintenance_loop, this);
  std::cout << "[Coordinator] Maintenance loop started (sweep every " << config_.sweep_interval_ms
            << "ms, heartbeat timeout " << config_.heartbeat_timeout_ms << "ms)" << std::endl;
}

void CoordinatorService::stop() {
  {
    std::lock_guard<std::mutex> lock(maintenance_mutex_);
    if (!running_.exchange(false, std::memory_order_acq_rel) && !maintenance_thread_.joinable()) {
      return;
    }
  }
  maintenance_cv_.notify_all();
  if (maintenance_thread_.joinable()) {
    maintenance_thread_.join();
  }
  liveness_.stop();
  barriers_.cancel_all();
  std::cout << "[Coordinator] Stopped after " << uptime_seconds() << "s, " << total_requests()
            << " requests" << std::endl;
}

void CoordinatorService::maintenance_loop() {
  while (running_.load(std::memory_order_acquire)) {
    {
      std::unique_lock<std::mutex> lock(maintenance_mutex_);
      maintenance_cv_.wait_for(lock, config_.sweep_interval(),
                               [this]() { return !running_.load(std::memory_order_acquire); });
    }
    if (!running_.load(std::memory_order_acquire)) {
      break;
    }
    try {
      publish_tick();
    } catch (const std::exception &e) {
      std::cerr << "[Coordinator] Maintenance tick failed: " << e.what() << std::endl;
    }
  }
}

} // namespace tfleet
