/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/protobuf_codec.hpp"
#include "fleet/framing.hpp"

#include <cstring>

namespace tfleet {

void ProtobufCodec::to_proto(const WorkerInfo &info, proto::WorkerInfo *out) {
  out->set_worker_id(info.worker_id);
  out->set_hostname(info.hostname);
  out->set_port(info.port);
  out->set_gpu_count(info.gpu_count);
  out->set_memory_bytes(info.memory_bytes);
}

WorkerInfo ProtobufCodec::from_proto(const proto::WorkerInfo &in) {
  WorkerInfo info;
  info.worker_id = in.worker_id();
  info.hostname = in.hostname();
  info.port = in.port();
  info.gpu_count = in.gpu_count();
  info.memory_bytes = in.memory_bytes();
  return info;
}

void ProtobufCodec::to_proto(const Registration &registration, proto::WorkerConfig *out) {
  out->set_rank(registration.rank);
  out->set_world_size(registration.world_size);
  out->set_heartbeat_interval_ms(registration.heartbeat_interval_ms);
}

Registration ProtobufCodec::from_proto(const proto::WorkerConfig &in) {
  Registration registration;
  registration.rank = in.rank();
  registration.world_size = in.world_size();
  registration.heartbeat_interval_ms = in.heartbeat_interval_ms();
  return registration;
}

void ProtobufCodec::to_proto(const DatasetSpec &spec, proto::DatasetInfo *out) {
  out->set_dataset_id(spec.dataset_id);
  out->set_path(spec.path);
  out->set_format(spec.format);
  out->set_total_samples(spec.total_samples);
  out->set_shard_size(spec.shard_size);
  out->set_shuffle(spec.shuffle);
  out->set_seed(spec.seed);
}

DatasetSpec ProtobufCodec::from_proto(const proto::DatasetInfo &in) {
  DatasetSpec spec;
  spec.dataset_id = in.dataset_id();
  spec.path = in.path();
  spec.format = in.format();
  spec.total_samples = in.total_samples();
  spec.shard_size = in.shard_size();
  spec.shuffle = in.shuffle();
  spec.seed = in.seed();
  return spec;
}

void ProtobufCodec::to_proto(const DatasetAck &ack, proto::DatasetAck *out) {
  out->set_dataset_id(ack.dataset_id);
  out->set_total_shards(ack.total_shards);
  out->set_created(ack.created);
}

DatasetAck ProtobufCodec::from_proto(const proto::DatasetAck &in) {
  DatasetAck ack;
  ack.dataset_id = in.dataset_id();
  ack.total_shards = in.total_shards();
  ack.created = in.created();
  return ack;
}

void ProtobufCodec::to_proto(const ShardAssignment &shard, proto::ShardAssignment *out) {
  out->set_dataset_id(shard.dataset_id);
  out->set_shard_id(shard.shard_id);
  out->set_total_shards(shard.total_shards);
  out->set_epoch(shard.epoch);
  out->set_num_samples(shard.num_samples);
  for (const auto &range : shard.sample_ranges) {
    auto *r = out->add_sample_ranges();
    r->set_start(range.start);
    r->set_end(range.end);
  }
  for (const auto &path : shard.file_paths) {
    out->add_file_paths(path);
  }
}

ShardAssignment ProtobufCodec::from_proto(const proto::ShardAssignment &in) {
  ShardAssignment shard;
  shard.dataset_id = in.dataset_id();
  shard.shard_id = in.shard_id();
  shard.total_shards = in.total_shards();
  shard.epoch = in.epoch();
  shard.num_samples = in.num_samples();
  shard.sample_ranges.reserve(static_cast<size_t>(in.sample_ranges_size()));
  for (const auto &range : in.sample_ranges()) {
    shard.sample_ranges.push_back(SampleRange{range.start(), range.end()});
  }
  shard.file_paths.assign(in.file_paths().begin(), in.file_paths().end());
  return shard;
}

void ProtobufCodec::to_proto(const WorkerStatus &status, proto::WorkerStatus *out) {
  switch (state_of(status)) {
  case WorkerState::LOADING_DATA:
    out->set_state(proto::WorkerStatus::LOADING_DATA);
    break;
  case WorkerState::TRAINING:
    out->set_state(proto::WorkerStatus::TRAINING);
    break;
  case WorkerState::CHECKPOINTING:
    out->set_state(proto::WorkerStatus::CHECKPOINTING);
    break;
  default:
    out->set_state(proto::WorkerStatus::IDLE);
    break;
  }
  out->set_current_step(step_of(status));
  out->set_current_epoch(epoch_of(status));
  out->set_current_task(task_of(status));
}

WorkerStatus ProtobufCodec::from_proto(const proto::WorkerStatus &in) {
  WorkerState state = WorkerState::IDLE;
  switch (in.state()) {
  case proto::WorkerStatus::LOADING_DATA:
    state = WorkerState::LOADING_DATA;
    break;
  case proto::WorkerStatus::TRAINING:
    state = WorkerState::TRAINING;
    break;
  case proto::WorkerStatus::CHECKPOINTING:
    state = WorkerState::CHECKPOINTING;
    break;
  default:
    break;
  }
  return make_status(state, in.current_step(), in.current_epoch(), in.current_task());
}

void ProtobufCodec::to_proto(const ResourceSnapshot &resources, proto::ResourceUsage *out) {
  out->set_cpu_percent(resources.cpu_percent);
  out->set_memory_used_bytes(resources.memory_used_bytes);
  for (const auto &accel : resources.accelerators) {
    auto *a = out->add_accelerators();
    a->set_accelerator_id(accel.accelerator_id);
    a->set_utilization_percent(accel.utilization_percent);
    a->set_memory_used_bytes(accel.memory_used_bytes);
    a->set_memory_total_bytes(accel.memory_total_bytes);
    a->set_temperature_celsius(accel.temperature_celsius);
  }
}

ResourceSnapshot ProtobufCodec::from_proto(const proto::ResourceUsage &in) {
  ResourceSnapshot resources;
  resources.cpu_percent = in.cpu_percent();
  resources.memory_used_bytes = in.memory_used_bytes();
  for (const auto &a : in.accelerators()) {
    AcceleratorUsage accel;
    accel.accelerator_id = a.accelerator_id();
    accel.utilization_percent = a.utilization_percent();
    accel.memory_used_bytes = a.memory_used_bytes();
    accel.memory_total_bytes = a.memory_total_bytes();
    accel.temperature_celsius = a.temperature_celsius();
    resources.accelerators.push_back(accel);
  }
  return resources;
}

void ProtobufCodec::to_proto(const CheckpointRecord &record, proto::CheckpointInfo *out) {
  out->set_worker_id(record.worker_id);
  out->set_checkpoint_id(record.checkpoint_id);
  out->set_step(record.step);
  out->set_epoch(record.epoch);
  out->set_storage_path(record.storage_path);
  out->set_size_bytes(record.size_bytes);
  out->set_timestamp_ms(record.timestamp_ms);
  out->set_type(static_cast<proto::CheckpointType>(record.type));
}

CheckpointRecord ProtobufCodec::from_proto(const proto::CheckpointInfo &in) {
  CheckpointRecord record;
  record.worker_id = in.worker_id();
  record.checkpoint_id = in.checkpoint_id();
  record.step = in.step();
  record.epoch = in.epoch();
  record.storage_path = in.storage_path();
  record.size_bytes = in.size_bytes();
  record.timestamp_ms = in.timestamp_ms();
  switch (in.type()) {
  case proto::INCREMENTAL:
    record.type = CheckpointType::INCREMENTAL;
    break;
  case proto::PARTIAL:
    record.type = CheckpointType::PARTIAL;
    break;
  default:
    record.type = CheckpointType::FULL;
    break;
  }
  return record;
}

void ProtobufCodec::to_proto(const RecoveryInfo &info, proto::RecoveryResponse *out) {
  out->set_has_checkpoint(info.has_checkpoint);
  if (info.has_checkpoint) {
    to_proto(info.checkpoint, out->mutable_latest_checkpoint());
  }
  out->set_resume_step(info.resume_step);
  out->set_resume_epoch(info.resume_epoch);
  for (const auto &shard : info.shard_assignments) {
    to_proto(shard, out->add_shard_assignments());
  }
}

RecoveryInfo ProtobufCodec::from_proto(const proto::RecoveryResponse &in) {
  RecoveryInfo info;
  info.has_checkpoint = in.has_checkpoint();
  if (in.has_latest_checkpoint()) {
    info.checkpoint = from_proto(in.latest_checkpoint());
  }
  info.resume_step = in.resume_step();
  info.resume_epoch = in.resume_epoch();
  for (const auto &shard : in.shard_assignments()) {
    info.shard_assignments.push_back(from_proto(shard));
  }
  return info;
}

void ProtobufCodec::to_proto(const BarrierResult &result, proto::BarrierResponse *out) {
  out->set_arrival_order(result.arrival_order);
  out->set_participants(result.participants);
}

BarrierResult ProtobufCodec::from_proto(const proto::BarrierResponse &in) {
  return BarrierResult{in.arrival_order(), in.participants()};
}

std::optional<std::chrono::milliseconds>
ProtobufCodec::barrier_timeout(const proto::BarrierRequest &request) {
  const uint64_t timeout_ms = request.timeout_ms();
  if (timeout_ms == 0) {
    return std::nullopt;
  }
  if (timeout_ms > static_cast<uint64_t>(kMaxBarrierTimeout.count())) {
    throw errors::invalid_argument("Barrier timeout of " + std::to_string(timeout_ms) +
                                   "ms exceeds the " +
                                   std::to_string(kMaxBarrierTimeout.count()) + "ms limit");
  }
  return std::chrono::milliseconds(static_cast<int64_t>(timeout_ms));
}

void ProtobufCodec::set_error(const FleetError &error, proto::Response *out) {
  auto *status = out->mutable_status();
  status->set_code(static_cast<uint32_t>(error.code()));
  status->set_message(error.detail());
}

void ProtobufCodec::throw_if_error(const proto::Response &response) {
  if (!response.has_status() || response.status().code() == 0) {
    return;
  }
  const uint32_t code = response.status().code();
  if (code > static_cast<uint32_t>(ErrorCode::INTERNAL)) {
    throw FleetError(ErrorCode::INTERNAL,
                     "Unknown status " + std::to_string(code) + ": " + response.status().message());
  }
  throw FleetError(static_cast<ErrorCode>(code), response.status().message());
}

std::vector<uint8_t> ProtobufCodec::frame(const google::protobuf::MessageLite &message,
                                          uint32_t max_bytes) {
  const size_t body_size = message.ByteSizeLong();
  if (body_size > max_bytes) {
    throw errors::invalid_argument("Message of " + std::to_string(body_size) +
                                   " bytes exceeds the " + std::to_string(max_bytes) +
                                   " byte limit");
  }

  FrameHeader header;
  header.length = static_cast<uint32_t>(body_size);
  const auto header_bytes = header.encode();

  std::vector<uint8_t> buffer(FrameHeader::SIZE + body_size);
  std::memcpy(buffer.data(), header_bytes.data(), FrameHeader::SIZE);
  if (!message.SerializeToArray(buffer.data() + FrameHeader::SIZE, static_cast<int>(body_size))) {
    throw FleetError(ErrorCode::INTERNAL, "Failed to serialize " + message.GetTypeName());
  }
  return buffer;
}

} // namespace tfleet
