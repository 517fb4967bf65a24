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
#include <variant>
#include <vector>

namespace tfleet {

using Clock = std::chrono::steady_clock;

// upper bound for any single barrier wait
constexpr std::chrono::milliseconds kMaxBarrierTimeout = std::chrono::hours(24);

inline int64_t wall_clock_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

struct WorkerInfo {
  std::string worker_id;
  std::string hostname;
  uint32_t port = 0;
  uint32_t gpu_count = 0;
  uint64_t memory_bytes = 0;
};

struct WorkerRecord {
  WorkerInfo info;
  uint32_t rank = 0;
  int64_t registered_at_ms = 0;
  Clock::time_point registered_at;
  // distinguishes successive registrations under the same id
  uint64_t generation = 0;
};

struct Registration {
  uint32_t rank = 0;
  uint32_t world_size = 0;
  int64_t heartbeat_interval_ms = 0;
};

struct DatasetSpec {
  std::string dataset_id;
  std::string path;
  std::string format;
  uint64_t total_samples = 0;
  uint64_t shard_size = 0;
  bool shuffle = false;
  uint64_t seed = 0;

  uint64_t total_shards() const {
    return shard_size == 0 ? 0 : (total_samples + shard_size - 1) / shard_size;
  }

  bool operator==(const DatasetSpec &other) const {
    return dataset_id == other.dataset_id && path == other.path && format == other.format &&
           total_samples == other.total_samples && shard_size == other.shard_size &&
           shuffle == other.shuffle && seed == other.seed;
  }
  bool operator!=(const DatasetSpec &other) const { return !(*this == other); }

  nlohmann::json to_json() const {
    return nlohmann::json{{"dataset_id", dataset_id}, {"path", path},
                          {"format", format},         {"total_samples", total_samples},
                          {"shard_size", shard_size}, {"shuffle", shuffle},
                          {"seed", seed}};
  }

  static DatasetSpec from_json(const nlohmann::json &j) {
    DatasetSpec spec;
    spec.dataset_id = j.at("dataset_id").get<std::string>();
    spec.path = j.value("path", std::string());
    spec.format = j.value("format", std::string());
    spec.total_samples = j.at("total_samples").get<uint64_t>();
    spec.shard_size = j.at("shard_size").get<uint64_t>();
    spec.shuffle = j.value("shuffle", false);
    spec.seed = j.value("seed", uint64_t{0});
    return spec;
  }
};

// half-open [start, end)
struct SampleRange {
  uint64_t start = 0;
  uint64_t end = 0;

  uint64_t size() const { return end - start; }
  bool operator==(const SampleRange &other) const {
    return start == other.start && end == other.end;
  }
};

struct ShardAssignment {
  std::string dataset_id;
  uint64_t epoch = 0;
  uint32_t shard_id = 0;
  uint32_t total_shards = 0;
  uint64_t num_samples = 0;
  std::vector<SampleRange> sample_ranges;
  std::vector<std::string> file_paths;
};

/**
 * @brief Worker phase reported by heartbeats. _START and _COUNT bracket the values so the
 * enum can be walked with utils::get_enum_vector.
 */
enum class WorkerState {
  _START,

  LOADING_DATA,
  TRAINING,
  CHECKPOINTING,
  IDLE,

  _COUNT
};

const char *worker_state_name(WorkerState state);

namespace status {

struct LoadingData {
  uint64_t epoch = 0;
  std::string task;
};

struct Training {
  uint64_t step = 0;
  uint64_t epoch = 0;
  std::string task;
};

struct Checkpointing {
  uint64_t step = 0;
  uint64_t epoch = 0;
};

struct Idle {};

} // namespace status

using WorkerStatus =
    std::variant<status::Idle, status::LoadingData, status::Training, status::Checkpointing>;

WorkerState state_of(const WorkerStatus &status);
uint64_t step_of(const WorkerStatus &status);
uint64_t epoch_of(const WorkerStatus &status);
std::string task_of(const WorkerStatus &status);

/**
 * @brief Builds the variant from flat heartbeat fields, keeping only the fields the state uses.
 */
WorkerStatus make_status(WorkerState state, uint64_t step, uint64_t epoch,
                         const std::string &task);

struct AcceleratorUsage {
  uint32_t accelerator_id = 0;
  float utilization_percent = 0.0f;
  uint64_t memory_used_bytes = 0;
  uint64_t memory_total_bytes = 0;
  float temperature_celsius = 0.0f;
};

struct ResourceSnapshot {
  float cpu_percent = 0.0f;
  uint64_t memory_used_bytes = 0;
  std::vector<AcceleratorUsage> accelerators;

  nlohmann::json to_json() const;
};

enum class CheckpointType {
  FULL = 0,
  // reserved for partial/incremental checkpoints
  INCREMENTAL = 1,
  PARTIAL = 2,
};

const char *checkpoint_type_name(CheckpointType type);

struct CheckpointRecord {
  std::string checkpoint_id;
  std::string worker_id;
  uint64_t step = 0;
  uint64_t epoch = 0;
  std::string storage_path;
  uint64_t size_bytes = 0;
  int64_t timestamp_ms = 0;
  CheckpointType type = CheckpointType::FULL;

  nlohmann::json to_json() const;
};

struct BarrierResult {
  uint32_t arrival_order = 0;
  uint32_t participants = 0;
};

} // namespace tfleet
