/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "coordinator_service.hpp"
#include "error.hpp"
#include "fleet.pb.h"
#include "types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace tfleet {

/**
 * @brief Conversions between the domain types and the generated wire messages, plus framing of
 * whole envelopes.
 */
class ProtobufCodec {
public:
  static void to_proto(const WorkerInfo &info, proto::WorkerInfo *out);
  static WorkerInfo from_proto(const proto::WorkerInfo &in);

  static void to_proto(const Registration &registration, proto::WorkerConfig *out);
  static Registration from_proto(const proto::WorkerConfig &in);

  static void to_proto(const DatasetSpec &spec, proto::DatasetInfo *out);
  static DatasetSpec from_proto(const proto::DatasetInfo &in);

  static void to_proto(const DatasetAck &ack, proto::DatasetAck *out);
  static DatasetAck from_proto(const proto::DatasetAck &in);

  static void to_proto(const ShardAssignment &shard, proto::ShardAssignment *out);
  static ShardAssignment from_proto(const proto::ShardAssignment &in);

  static void to_proto(const WorkerStatus &status, proto::WorkerStatus *out);
  static WorkerStatus from_proto(const proto::WorkerStatus &in);

  static void to_proto(const ResourceSnapshot &resources, proto::ResourceUsage *out);
  static ResourceSnapshot from_proto(const proto::ResourceUsage &in);

  static void to_proto(const CheckpointRecord &record, proto::CheckpointInfo *out);
  static CheckpointRecord from_proto(const proto::CheckpointInfo &in);

  static void to_proto(const RecoveryInfo &info, proto::RecoveryResponse *out);
  static RecoveryInfo from_proto(const proto::RecoveryResponse &in);

  static void to_proto(const BarrierResult &result, proto::BarrierResponse *out);
  static BarrierResult from_proto(const proto::BarrierResponse &in);

  /**
   * @brief Wait bound carried by a barrier request; zero means the coordinator default.
   * @throws FleetError INVALID_ARGUMENT above kMaxBarrierTimeout
   */
  static std::optional<std::chrono::milliseconds>
  barrier_timeout(const proto::BarrierRequest &request);

  static void set_error(const FleetError &error, proto::Response *out);

  // Rethrows a non-OK response status as FleetError with the same code.
  static void throw_if_error(const proto::Response &response);

  /**
   * @brief Serializes an envelope behind a FrameHeader.
   * @throws FleetError INVALID_ARGUMENT if the body exceeds max_bytes
   */
  static std::vector<uint8_t> frame(const google::protobuf::MessageLite &message,
                                    uint32_t max_bytes);

  /**
   * @throws FleetError TRANSPORT if the bytes do not parse
   */
  template <typename Envelope> static Envelope parse(const uint8_t *data, size_t size) {
    Envelope envelope;
    if (!envelope.ParseFromArray(data, static_cast<int>(size))) {
      throw FleetError(ErrorCode::TRANSPORT,
                       "Failed to parse " + envelope.GetTypeName() + " from protobuf");
    }
    return envelope;
  }
};

} // namespace tfleet
