/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */

#include "fleet/framing.hpp"
#include "fleet/protobuf_codec.hpp"
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace tfleet;

// ==================== Status Mapping Tests ====================

TEST(ProtobufCodecTest, TrainingStatusCarriesStepEpochAndTask) {
  proto::WorkerStatus wire;
  ProtobufCodec::to_proto(status::Training{1200, 4, "allreduce"}, &wire);
  EXPECT_EQ(wire.state(), proto::WorkerStatus::TRAINING);
  EXPECT_EQ(wire.current_step(), 1200u);
  EXPECT_EQ(wire.current_epoch(), 4u);
  EXPECT_EQ(wire.current_task(), "allreduce");

  auto back = ProtobufCodec::from_proto(wire);
  ASSERT_TRUE(std::holds_alternative<status::Training>(back));
  EXPECT_EQ(std::get<status::Training>(back).task, "allreduce");
}

TEST(ProtobufCodecTest, UnspecifiedStateDecodesAsIdle) {
  proto::WorkerStatus wire;
  wire.set_current_step(99);
  auto status = ProtobufCodec::from_proto(wire);
  EXPECT_EQ(state_of(status), WorkerState::IDLE);
  EXPECT_EQ(step_of(status), 0u);
}

TEST(ProtobufCodecTest, LoadingDataHasNoStep) {
  proto::WorkerStatus wire;
  wire.set_state(proto::WorkerStatus::LOADING_DATA);
  wire.set_current_step(10);
  wire.set_current_epoch(2);
  auto status = ProtobufCodec::from_proto(wire);
  EXPECT_EQ(state_of(status), WorkerState::LOADING_DATA);
  EXPECT_EQ(epoch_of(status), 2u);
  EXPECT_EQ(step_of(status), 0u);
}

TEST(ProtobufCodecTest, CheckpointTypeIsPreserved) {
  CheckpointRecord record;
  record.checkpoint_id = "c1";
  record.worker_id = "w0";
  record.type = CheckpointType::INCREMENTAL;
  proto::CheckpointInfo wire;
  ProtobufCodec::to_proto(record, &wire);
  EXPECT_EQ(wire.type(), proto::INCREMENTAL);
  EXPECT_EQ(ProtobufCodec::from_proto(wire).type, CheckpointType::INCREMENTAL);
}

TEST(ProtobufCodecTest, ShardRangesAndFilesSurvive) {
  ShardAssignment shard;
  shard.dataset_id = "ds";
  shard.epoch = 3;
  shard.shard_id = 1;
  shard.total_shards = 10;
  shard.num_samples = 250;
  shard.sample_ranges = {{0, 100}, {500, 650}};
  shard.file_paths = {"/data/ds"};

  proto::ShardAssignment wire;
  ProtobufCodec::to_proto(shard, &wire);
  ASSERT_EQ(wire.sample_ranges_size(), 2);
  EXPECT_EQ(wire.sample_ranges(1).start(), 500u);

  auto back = ProtobufCodec::from_proto(wire);
  EXPECT_EQ(back.sample_ranges, shard.sample_ranges);
  EXPECT_EQ(back.file_paths, shard.file_paths);
  EXPECT_EQ(back.num_samples, 250u);
}

// ==================== Barrier Timeout Tests ====================

TEST(ProtobufCodecTest, ZeroBarrierTimeoutMeansDefault) {
  proto::BarrierRequest request;
  EXPECT_FALSE(ProtobufCodec::barrier_timeout(request).has_value());
  request.set_timeout_ms(1500);
  EXPECT_EQ(ProtobufCodec::barrier_timeout(request), std::chrono::milliseconds(1500));
}

TEST(ProtobufCodecTest, BarrierTimeoutAtLimitIsAccepted) {
  proto::BarrierRequest request;
  request.set_timeout_ms(static_cast<uint64_t>(kMaxBarrierTimeout.count()));
  EXPECT_EQ(ProtobufCodec::barrier_timeout(request), kMaxBarrierTimeout);
}

TEST(ProtobufCodecTest, BarrierTimeoutAboveLimitIsRejected) {
  proto::BarrierRequest request;
  for (uint64_t timeout_ms : {static_cast<uint64_t>(kMaxBarrierTimeout.count()) + 1,
                              uint64_t{1} << 63,
                              std::numeric_limits<uint64_t>::max()}) {
    request.set_timeout_ms(timeout_ms);
    try {
      ProtobufCodec::barrier_timeout(request);
      FAIL() << "Expected INVALID_ARGUMENT for " << timeout_ms;
    } catch (const FleetError &e) {
      EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
    }
  }
}

// ==================== Error Mapping Tests ====================

TEST(ProtobufCodecTest, ErrorCodeCrossesTheWire) {
  proto::Response response;
  ProtobufCodec::set_error(errors::unknown_worker("w9"), &response);
  EXPECT_EQ(response.status().code(), static_cast<uint32_t>(ErrorCode::UNKNOWN_WORKER));
  EXPECT_EQ(response.status().message(), "Worker not registered: w9");

  try {
    ProtobufCodec::throw_if_error(response);
    FAIL() << "Expected UNKNOWN_WORKER";
  } catch (const FleetError &e) {
    EXPECT_EQ(e.code(), ErrorCode::UNKNOWN_WORKER);
    EXPECT_EQ(e.detail(), "Worker not registered: w9");
  }
}

TEST(ProtobufCodecTest, OkOrMissingStatusDoesNotThrow) {
  proto::Response response;
  EXPECT_NO_THROW(ProtobufCodec::throw_if_error(response));
  response.mutable_status()->set_code(0);
  EXPECT_NO_THROW(ProtobufCodec::throw_if_error(response));
}

TEST(ProtobufCodecTest, UnknownStatusCodeBecomesInternal) {
  proto::Response response;
  response.mutable_status()->set_code(999);
  response.mutable_status()->set_message("from the future");
  try {
    ProtobufCodec::throw_if_error(response);
    FAIL() << "Expected INTERNAL";
  } catch (const FleetError &e) {
    EXPECT_EQ(e.code(), ErrorCode::INTERNAL);
  }
}

// ==================== Framing Tests ====================

TEST(ProtobufCodecTest, FrameStartsWithBigEndianHeader) {
  proto::Request request;
  request.set_request_id(7);
  request.mutable_register_worker()->set_worker_id("w0");

  auto bytes = ProtobufCodec::frame(request, 1024);
  ASSERT_GE(bytes.size(), FrameHeader::SIZE);
  EXPECT_EQ(bytes[0], 0x54);
  EXPECT_EQ(bytes[1], 0x46);
  EXPECT_EQ(bytes[2], 0x4C);
  EXPECT_EQ(bytes[3], 0x54);

  auto header = FrameHeader::decode(bytes.data());
  EXPECT_EQ(header.length, bytes.size() - FrameHeader::SIZE);

  auto parsed =
      ProtobufCodec::parse<proto::Request>(bytes.data() + FrameHeader::SIZE, header.length);
  EXPECT_EQ(parsed.request_id(), 7u);
  EXPECT_EQ(parsed.body_case(), proto::Request::kRegisterWorker);
}

TEST(ProtobufCodecTest, OversizedMessageIsRejected) {
  proto::Request request;
  request.mutable_register_worker()->set_worker_id(std::string(256, 'x'));
  try {
    ProtobufCodec::frame(request, 64);
    FAIL() << "Expected INVALID_ARGUMENT";
  } catch (const FleetError &e) {
    EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
  }
}

TEST(ProtobufCodecTest, BadMagicIsRejected) {
  const uint8_t bytes[FrameHeader::SIZE] = {'G', 'E', 'T', ' ', 0, 0, 0, 4};
  EXPECT_THROW(FrameHeader::decode(bytes), std::runtime_error);
}

TEST(ProtobufCodecTest, GarbageBodyIsTransportError) {
  const uint8_t garbage[] = {0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
  try {
    ProtobufCodec::parse<proto::Response>(garbage, sizeof(garbage));
    FAIL() << "Expected TRANSPORT";
  } catch (const FleetError &e) {
    EXPECT_EQ(e.code(), ErrorCode::TRANSPORT);
  }
}
