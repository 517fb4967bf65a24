/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/config.hpp"
#include "fleet/error.hpp"
#include "fleet/types.hpp"
#include "utils/env.hpp"
#include "utils/misc.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

namespace tfleet {

namespace {

// Unset or non-numeric variables keep the current value.
template <typename T> T env_override(const char *env_var, T current, uint64_t max_value) {
  const uint64_t fallback = static_cast<uint64_t>(current);
  const uint64_t value = utils::get_env_u64(env_var, fallback);
  if (value == fallback) {
    return current;
  }
  if (value > max_value) {
    throw errors::invalid_argument(std::string(env_var) + " out of range: " +
                                   std::to_string(value) + " (max " + std::to_string(max_value) +
                                   ")");
  }
  return static_cast<T>(value);
}

constexpr uint64_t kMaxPort = 65535;

} // namespace

nlohmann::json CoordinatorConfig::to_json() const {
  return nlohmann::json{{"bind_address", bind_address},
                        {"port", port},
                        {"io_threads", io_threads},
                        {"max_workers", max_workers},
                        {"heartbeat_interval_ms", heartbeat_interval_ms},
                        {"heartbeat_timeout_ms", heartbeat_timeout_ms},
                        {"sweep_interval_ms", sweep_interval_ms},
                        {"rank_grace_ms", rank_grace_ms},
                        {"dead_worker_retention_ms", dead_worker_retention_ms},
                        {"barrier_timeout_ms", barrier_timeout_ms},
                        {"barrier_grace_ms", barrier_grace_ms},
                        {"max_shuffle_samples", max_shuffle_samples},
                        {"permutation_cache_size", permutation_cache_size},
                        {"max_checkpoint_records", max_checkpoint_records},
                        {"max_message_bytes", max_message_bytes},
                        {"snapshot_path", snapshot_path}};
}

CoordinatorConfig CoordinatorConfig::from_json(const nlohmann::json &j) {
  CoordinatorConfig config;
  config.bind_address = j.value("bind_address", config.bind_address);
  config.port = j.value("port", config.port);
  config.io_threads = j.value("io_threads", config.io_threads);
  config.max_workers = j.value("max_workers", config.max_workers);
  config.heartbeat_interval_ms = j.value("heartbeat_interval_ms", config.heartbeat_interval_ms);
  config.heartbeat_timeout_ms = j.value("heartbeat_timeout_ms", config.heartbeat_timeout_ms);
  config.sweep_interval_ms = j.value("sweep_interval_ms", config.sweep_interval_ms);
  config.rank_grace_ms = j.value("rank_grace_ms", config.rank_grace_ms);
  config.dead_worker_retention_ms =
      j.value("dead_worker_retention_ms", config.dead_worker_retention_ms);
  config.barrier_timeout_ms = j.value("barrier_timeout_ms", config.barrier_timeout_ms);
  config.barrier_grace_ms = j.value("barrier_grace_ms", config.barrier_grace_ms);
  config.max_shuffle_samples = j.value("max_shuffle_samples", config.max_shuffle_samples);
  config.permutation_cache_size =
      j.value("permutation_cache_size", config.permutation_cache_size);
  config.max_checkpoint_records =
      j.value("max_checkpoint_records", config.max_checkpoint_records);
  config.max_message_bytes = j.value("max_message_bytes", config.max_message_bytes);
  config.snapshot_path = j.value("snapshot_path", config.snapshot_path);
  return config;
}

nlohmann::json CheckpointManagerConfig::to_json() const {
  return nlohmann::json{{"base_path", base_path},
                        {"keep_count", keep_count},
                        {"writer_threads", writer_threads},
                        {"max_pending_writes", max_pending_writes},
                        {"sync_writes", sync_writes}};
}

CheckpointManagerConfig CheckpointManagerConfig::from_json(const nlohmann::json &j) {
  CheckpointManagerConfig config;
  config.base_path = j.value("base_path", config.base_path);
  config.keep_count = j.value("keep_count", config.keep_count);
  config.writer_threads = j.value("writer_threads", config.writer_threads);
  config.max_pending_writes = j.value("max_pending_writes", config.max_pending_writes);
  config.sync_writes = j.value("sync_writes", config.sync_writes);
  return config;
}

nlohmann::json ClientConfig::to_json() const {
  return nlohmann::json{{"coordinator_host", coordinator_host},
                        {"coordinator_port", coordinator_port},
                        {"worker_id", worker_id},
                        {"heartbeat_interval_ms", heartbeat_interval_ms},
                        {"max_message_bytes", max_message_bytes}};
}

ClientConfig ClientConfig::from_json(const nlohmann::json &j) {
  ClientConfig config;
  config.coordinator_host = j.value("coordinator_host", config.coordinator_host);
  config.coordinator_port = j.value("coordinator_port", config.coordinator_port);
  config.worker_id = j.value("worker_id", config.worker_id);
  config.heartbeat_interval_ms = j.value("heartbeat_interval_ms", config.heartbeat_interval_ms);
  config.max_message_bytes = j.value("max_message_bytes", config.max_message_bytes);
  return config;
}

nlohmann::json FleetConfig::to_json() const {
  return nlohmann::json{{"coordinator", coordinator.to_json()},
                        {"checkpoint", checkpoint.to_json()},
                        {"client", client.to_json()}};
}

FleetConfig FleetConfig::from_json(const nlohmann::json &j) {
  FleetConfig config;
  if (j.contains("coordinator")) {
    config.coordinator = CoordinatorConfig::from_json(j["coordinator"]);
  }
  if (j.contains("checkpoint")) {
    config.checkpoint = CheckpointManagerConfig::from_json(j["checkpoint"]);
  }
  if (j.contains("client")) {
    config.client = ClientConfig::from_json(j["client"]);
  }
  return config;
}

FleetConfig load_config(const std::string &path) {
  std::ifstream file(path);
  if (!file) {
    throw errors::io_failure("Cannot open config file " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  try {
    FleetConfig config = FleetConfig::from_json(nlohmann::json::parse(buffer.str()));
    std::cout << "[Config] Loaded configuration from " << path << std::endl;
    return config;
  } catch (const nlohmann::json::exception &e) {
    throw errors::invalid_argument("Invalid config file " + path + ": " + e.what());
  }
}

void apply_env_overrides(FleetConfig &config) {
  config.coordinator.bind_address =
      utils::get_env("FLEET_BIND_ADDRESS", config.coordinator.bind_address);
  config.coordinator.port = env_override("FLEET_PORT", config.coordinator.port, kMaxPort);
  config.coordinator.heartbeat_timeout_ms =
      env_override("FLEET_HEARTBEAT_TIMEOUT_MS", config.coordinator.heartbeat_timeout_ms,
                   static_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
  config.coordinator.snapshot_path =
      utils::get_env("FLEET_SNAPSHOT_PATH", config.coordinator.snapshot_path);

  config.checkpoint.base_path = utils::get_env("FLEET_CHECKPOINT_DIR", config.checkpoint.base_path);
  config.checkpoint.keep_count = env_override("FLEET_KEEP_COUNT", config.checkpoint.keep_count,
                                              std::numeric_limits<size_t>::max());

  const std::string endpoint = utils::get_env("FLEET_COORDINATOR", "");
  if (!endpoint.empty()) {
    try {
      auto [host, port] = utils::parse_endpoint(endpoint);
      config.client.coordinator_host = host;
      config.client.coordinator_port = port;
    } catch (const std::exception &e) {
      throw errors::invalid_argument(std::string("FLEET_COORDINATOR: ") + e.what());
    }
  }
  // explicit host/port variables win over FLEET_COORDINATOR
  config.client.coordinator_host =
      utils::get_env("FLEET_COORDINATOR_HOST", config.client.coordinator_host);
  config.client.coordinator_port =
      env_override("FLEET_COORDINATOR_PORT", config.client.coordinator_port, kMaxPort);
  config.client.worker_id = utils::get_env("FLEET_WORKER_ID", config.client.worker_id);
}

void validate_config(const FleetConfig &config) {
  const auto &coord = config.coordinator;
  if (coord.port < 0 || coord.port > 65535) {
    throw errors::invalid_argument("coordinator.port out of range: " + std::to_string(coord.port));
  }
  if (coord.io_threads < 1) {
    throw errors::invalid_argument("coordinator.io_threads must be at least 1");
  }
  if (coord.heartbeat_timeout_ms <= 0 || coord.sweep_interval_ms <= 0) {
    throw errors::invalid_argument("heartbeat timeout and sweep interval must be positive");
  }
  if (coord.barrier_timeout_ms <= 0 || coord.barrier_timeout_ms > kMaxBarrierTimeout.count()) {
    throw errors::invalid_argument("coordinator.barrier_timeout_ms must be in (0, " +
                                   std::to_string(kMaxBarrierTimeout.count()) + "]");
  }
  if (coord.max_shuffle_samples == 0 || coord.permutation_cache_size == 0) {
    throw errors::invalid_argument("shuffle sample cap and permutation cache must be positive");
  }
  if (coord.rank_grace_ms < 0 || coord.barrier_grace_ms < 0 ||
      coord.dead_worker_retention_ms < 0) {
    throw errors::invalid_argument("grace periods cannot be negative");
  }
  if (config.checkpoint.keep_count == 0) {
    throw errors::invalid_argument("checkpoint.keep_count must be at least 1");
  }
  if (config.checkpoint.writer_threads == 0 || config.checkpoint.max_pending_writes == 0) {
    throw errors::invalid_argument("checkpoint writer pool needs threads and queue capacity");
  }
  if (config.client.coordinator_port <= 0 || config.client.coordinator_port > 65535) {
    throw errors::invalid_argument("client.coordinator_port out of range");
  }
}

} // namespace tfleet
