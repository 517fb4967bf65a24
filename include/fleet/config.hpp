/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace tfleet {

constexpr const char *kFleetVersion = "0.3.0";

struct CoordinatorConfig {
  std::string bind_address = "0.0.0.0";
  int port = 50051;
  int io_threads = 2;
  uint32_t max_workers = 10000;

  int64_t heartbeat_interval_ms = 5000;
  int64_t heartbeat_timeout_ms = 30000;
  int64_t sweep_interval_ms = 1000;
  int64_t rank_grace_ms = 5000;
  // dead workers stay visible in snapshots this long before they are forgotten
  int64_t dead_worker_retention_ms = 600000;

  int64_t barrier_timeout_ms = 300000;
  int64_t barrier_grace_ms = 10000;

  // shuffled datasets hold one 8-byte index per sample for each cached epoch
  uint64_t max_shuffle_samples = 1ull << 24;
  size_t permutation_cache_size = 4;

  size_t max_checkpoint_records = 1000;
  uint32_t max_message_bytes = 256u * 1024u * 1024u;

  // empty disables snapshot publication
  std::string snapshot_path;

  std::chrono::milliseconds heartbeat_timeout() const {
    return std::chrono::milliseconds(heartbeat_timeout_ms);
  }
  std::chrono::milliseconds sweep_interval() const {
    return std::chrono::milliseconds(sweep_interval_ms);
  }
  std::chrono::milliseconds rank_grace() const { return std::chrono::milliseconds(rank_grace_ms); }
  std::chrono::milliseconds dead_worker_retention() const {
    return std::chrono::milliseconds(dead_worker_retention_ms);
  }
  std::chrono::milliseconds barrier_timeout() const {
    return std::chrono::milliseconds(barrier_timeout_ms);
  }
  std::chrono::milliseconds barrier_grace() const {
    return std::chrono::milliseconds(barrier_grace_ms);
  }

  nlohmann::json to_json() const;
  static CoordinatorConfig from_json(const nlohmann::json &j);
};

struct CheckpointManagerConfig {
  std::string base_path = "./checkpoints";
  size_t keep_count = 5;
  size_t writer_threads = 2;
  // save_async blocks once this many writes are queued or running
  size_t max_pending_writes = 16;
  bool sync_writes = true;

  nlohmann::json to_json() const;
  static CheckpointManagerConfig from_json(const nlohmann::json &j);
};

struct ClientConfig {
  std::string coordinator_host = "localhost";
  int coordinator_port = 50051;
  std::string worker_id;
  int64_t heartbeat_interval_ms = 5000;
  uint32_t max_message_bytes = 256u * 1024u * 1024u;

  nlohmann::json to_json() const;
  static ClientConfig from_json(const nlohmann::json &j);
};

struct FleetConfig {
  CoordinatorConfig coordinator;
  CheckpointManagerConfig checkpoint;
  ClientConfig client;

  nlohmann::json to_json() const;
  static FleetConfig from_json(const nlohmann::json &j);
};

/**
 * @brief Reads a JSON configuration file. Sections and keys that are absent keep their defaults.
 * @throws FleetError(IO_FAILURE) if the file cannot be read,
 *         FleetError(INVALID_ARGUMENT) if it is not valid JSON or a value has the wrong type.
 */
FleetConfig load_config(const std::string &path);

/**
 * @brief Applies FLEET_* environment variables on top of an existing configuration.
 * @throws FleetError(INVALID_ARGUMENT) if a numeric variable does not fit its field.
 */
void apply_env_overrides(FleetConfig &config);

/**
 * @brief Rejects values the components cannot run with (zero keep_count, port out of range...).
 */
void validate_config(const FleetConfig &config);

} // namespace tfleet
