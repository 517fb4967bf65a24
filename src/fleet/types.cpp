/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/types.hpp"

namespace tfleet {

const char *worker_state_name(WorkerState state) {
  switch (state) {
  case WorkerState::LOADING_DATA:
    return "loading_data";
  case WorkerState::TRAINING:
    return "training";
  case WorkerState::CHECKPOINTING:
    return "checkpointing";
  case WorkerState::IDLE:
    return "idle";
  default:
    return "unknown";
  }
}

namespace {

struct StateVisitor {
  WorkerState operator()(const status::Idle &) const { return WorkerState::IDLE; }
  WorkerState operator()(const status::LoadingData &) const { return WorkerState::LOADING_DATA; }
  WorkerState operator()(const status::Training &) const { return WorkerState::TRAINING; }
  WorkerState operator()(const status::Checkpointing &) const {
    return WorkerState::CHECKPOINTING;
  }
};

struct StepVisitor {
  uint64_t operator()(const status::Idle &) const { return 0; }
  uint64_t operator()(const status::LoadingData &) const { return 0; }
  uint64_t operator()(const status::Training &s) const { return s.step; }
  uint64_t operator()(const status::Checkpointing &s) const { return s.step; }
};

struct EpochVisitor {
  uint64_t operator()(const status::Idle &) const { return 0; }
  uint64_t operator()(const status::LoadingData &s) const { return s.epoch; }
  uint64_t operator()(const status::Training &s) const { return s.epoch; }
  uint64_t operator()(const status::Checkpointing &s) const { return s.epoch; }
};

} // namespace

WorkerState state_of(const WorkerStatus &status) { return std::visit(StateVisitor{}, status); }

uint64_t step_of(const WorkerStatus &status) { return std::visit(StepVisitor{}, status); }

uint64_t epoch_of(const WorkerStatus &status) { return std::visit(EpochVisitor{}, status); }

std::string task_of(const WorkerStatus &status) {
  if (const auto *training = std::get_if<status::Training>(&status)) {
    return training->task;
  }
  if (const auto *loading = std::get_if<status::LoadingData>(&status)) {
    return loading->task;
  }
  return std::string();
}

WorkerStatus make_status(WorkerState state, uint64_t step, uint64_t epoch,
                         const std::string &task) {
  switch (state) {
  case WorkerState::LOADING_DATA:
    return status::LoadingData{epoch, task};
  case WorkerState::TRAINING:
    return status::Training{step, epoch, task};
  case WorkerState::CHECKPOINTING:
    return status::Checkpointing{step, epoch};
  default:
    return status::Idle{};
  }
}

nlohmann::json ResourceSnapshot::to_json() const {
  nlohmann::json accel = nlohmann::json::array();
  for (const auto &a : accelerators) {
    accel.push_back({{"id", a.accelerator_id},
                     {"utilization_percent", a.utilization_percent},
                     {"memory_used_bytes", a.memory_used_bytes},
                     {"memory_total_bytes", a.memory_total_bytes},
                     {"temperature_celsius", a.temperature_celsius}});
  }
  return nlohmann::json{{"cpu_percent", cpu_percent},
                        {"memory_used_bytes", memory_used_bytes},
                        {"accelerators", accel}};
}

const char *checkpoint_type_name(CheckpointType type) {
  switch (type) {
  case CheckpointType::FULL:
    return "full";
  case CheckpointType::INCREMENTAL:
    return "incremental";
  case CheckpointType::PARTIAL:
    return "partial";
  }
  return "unknown";
}

nlohmann::json CheckpointRecord::to_json() const {
  return nlohmann::json{{"id", checkpoint_id},
                        {"worker_id", worker_id},
                        {"step", step},
                        {"epoch", epoch},
                        {"size", size_bytes},
                        {"path", storage_path},
                        {"created_at", timestamp_ms},
                        {"type", checkpoint_type_name(type)},
                        {"status", "completed"}};
}

} // namespace tfleet
