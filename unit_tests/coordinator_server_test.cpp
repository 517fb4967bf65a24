/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */

#include "asio.hpp"
#include "fleet/coordinator_client.hpp"
#include "fleet/coordinator_server.hpp"
#include "fleet/coordinator_service.hpp"
#include "fleet/error.hpp"
#include "fleet/heartbeat_loop.hpp"
#include "fleet/protobuf_codec.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <future>
#include <memory>
#include <thread>

using namespace tfleet;
using namespace std::chrono_literals;

class CoordinatorServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.bind_address = "127.0.0.1";
    config_.port = 0;
    config_.io_threads = 2;
    config_.rank_grace_ms = 0;
    config_.barrier_timeout_ms = 5000;

    service_ = std::make_unique<CoordinatorService>(config_);
    server_ = std::make_unique<CoordinatorServer>(*service_, config_);
    server_->start();
    ASSERT_TRUE(server_->is_running());
    ASSERT_NE(server_->port(), 0);
  }

  void TearDown() override {
    server_->stop();
    service_->stop();
  }

  std::unique_ptr<CoordinatorClient> make_client() {
    return std::make_unique<CoordinatorClient>("127.0.0.1", server_->port());
  }

  static WorkerInfo worker(const std::string &id) {
    WorkerInfo info;
    info.worker_id = id;
    info.hostname = "127.0.0.1";
    info.port = 29500;
    info.gpu_count = 2;
    return info;
  }

  template <typename Predicate> static bool eventually(Predicate predicate) {
    for (int i = 0; i < 500; ++i) {
      if (predicate()) {
        return true;
      }
      std::this_thread::sleep_for(5ms);
    }
    return predicate();
  }

  CoordinatorConfig config_;
  std::unique_ptr<CoordinatorService> service_;
  std::unique_ptr<CoordinatorServer> server_;
};

// ==================== Call Flow Tests ====================

TEST_F(CoordinatorServerTest, WorkerLifecycleOverTcp) {
  auto client = make_client();

  auto reg = client->register_worker(worker("w0"));
  EXPECT_EQ(reg.rank, 0u);
  EXPECT_EQ(reg.world_size, 1u);
  EXPECT_EQ(reg.heartbeat_interval_ms, config_.heartbeat_interval_ms);
  EXPECT_TRUE(client->is_connected());

  DatasetSpec spec;
  spec.dataset_id = "ds";
  spec.path = "/data/ds";
  spec.total_samples = 1000;
  spec.shard_size = 100;
  auto ack = client->register_dataset(spec);
  EXPECT_TRUE(ack.created);
  EXPECT_EQ(ack.total_shards, 10u);

  auto shard = client->get_data_shard("w0", "ds", 0);
  EXPECT_EQ(shard.num_samples, 1000u);
  ASSERT_EQ(shard.sample_ranges.size(), 1u);
  EXPECT_EQ(shard.sample_ranges[0], (SampleRange{0, 1000}));

  EXPECT_GT(client->heartbeat("w0", status::Training{5, 0, "forward"}, ResourceSnapshot{}), 0);
  EXPECT_EQ(state_of(service_->liveness().get("w0")->status), WorkerState::TRAINING);

  CheckpointRecord record;
  record.checkpoint_id = "checkpoint-5";
  record.worker_id = "w0";
  record.step = 5;
  record.storage_path = "/ckpt/checkpoint-5.ckpt";
  record.size_bytes = 2048;
  client->notify_checkpoint(record);

  auto recovery = client->get_latest_checkpoint("w0");
  ASSERT_TRUE(recovery.has_checkpoint);
  EXPECT_EQ(recovery.checkpoint.checkpoint_id, "checkpoint-5");
  EXPECT_EQ(recovery.resume_step, 5u);
  ASSERT_EQ(recovery.shard_assignments.size(), 1u);

  auto result = client->wait_barrier("w0", "solo", 1);
  EXPECT_EQ(result.arrival_order, 1u);

  auto snap = client->get_snapshot();
  EXPECT_EQ(snap["metrics"]["active_workers"], 1);
  EXPECT_EQ(snap["coordinator"]["address"],
            "127.0.0.1:" + std::to_string(server_->port()));

  client->deregister_worker("w0");
  EXPECT_EQ(service_->registry().world_size(), 0u);
}

TEST_F(CoordinatorServerTest, BarrierReleasesClientsOnSeparateConnections) {
  auto a = make_client();
  auto b = make_client();
  a->register_worker(worker("a"));
  b->register_worker(worker("b"));

  auto first = std::async(std::launch::async, [&]() { return a->wait_barrier("a", "sync", 3); });
  ASSERT_TRUE(eventually([&]() { return server_->pending_barrier_waits() == 1; }));

  auto second = b->wait_barrier("b", "sync", 3);
  auto released = first.get();
  EXPECT_EQ(released.participants, 2u);
  EXPECT_EQ(released.arrival_order + second.arrival_order, 3u);
}

TEST_F(CoordinatorServerTest, HeartbeatsFlowWhileBarrierIsParked) {
  auto waiter = make_client();
  auto beats = make_client();
  waiter->register_worker(worker("a"));
  waiter->register_worker(worker("b"));

  auto parked = std::async(std::launch::async, [&]() {
    return waiter->wait_barrier("a", "slow", 1, 2000ms);
  });
  ASSERT_TRUE(eventually([&]() { return server_->pending_barrier_waits() == 1; }));

  HeartbeatLoop loop(*beats, "a", 1000ms, []() { return WorkerStatus{status::Idle{}}; });
  EXPECT_TRUE(loop.beat_once());
  EXPECT_EQ(loop.sent_count(), 1u);

  beats->wait_barrier("b", "slow", 1);
  EXPECT_EQ(parked.get().participants, 2u);
}

// ==================== Error Propagation Tests ====================

TEST_F(CoordinatorServerTest, CoordinatorErrorsKeepTheirCodes) {
  auto client = make_client();
  client->register_worker(worker("w0"));

  auto expect_code = [](auto &&call, ErrorCode expected) {
    try {
      call();
      ADD_FAILURE() << "Expected " << error_code_name(expected);
    } catch (const FleetError &e) {
      EXPECT_EQ(e.code(), expected) << e.what();
    }
  };

  expect_code([&]() { client->register_worker(worker("w0")); }, ErrorCode::DUPLICATE_WORKER);
  expect_code([&]() { client->get_data_shard("w0", "missing", 0); }, ErrorCode::NOT_FOUND);
  expect_code([&]() { client->heartbeat("ghost", status::Idle{}, ResourceSnapshot{}); },
              ErrorCode::UNKNOWN_WORKER);
  expect_code([&]() { client->wait_barrier("ghost", "b", 1); }, ErrorCode::UNKNOWN_WORKER);

  // the connection survives error responses
  EXPECT_TRUE(client->is_connected());
  EXPECT_EQ(client->get_snapshot()["metrics"]["active_workers"], 1);
}

TEST_F(CoordinatorServerTest, BarrierTimeoutTravelsAsRetryableError) {
  auto client = make_client();
  client->register_worker(worker("w0"));
  client->register_worker(worker("w1"));

  try {
    client->wait_barrier("w0", "never", 1, 50ms);
    FAIL() << "Expected BARRIER_TIMEOUT";
  } catch (const FleetError &e) {
    EXPECT_EQ(e.code(), ErrorCode::BARRIER_TIMEOUT);
    EXPECT_TRUE(e.is_retryable());
  }
  EXPECT_EQ(service_->barriers().timeout_count(), 1u);
}

TEST_F(CoordinatorServerTest, OversizedBarrierTimeoutIsRejectedBeforeParking) {
  auto client = make_client();
  client->register_worker(worker("w0"));
  client->register_worker(worker("w1"));

  try {
    client->wait_barrier("w0", "long", 1, kMaxBarrierTimeout + 1ms);
    FAIL() << "Expected INVALID_ARGUMENT";
  } catch (const FleetError &e) {
    EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
  }
  EXPECT_TRUE(service_->barriers().snapshot().empty());
  EXPECT_TRUE(client->is_connected());
}

TEST_F(CoordinatorServerTest, UnreachableCoordinatorIsTransportError) {
  const uint16_t port = server_->port();
  server_->stop();

  CoordinatorClient client("127.0.0.1", port);
  try {
    client.register_worker(worker("w0"));
    FAIL() << "Expected TRANSPORT";
  } catch (const FleetError &e) {
    EXPECT_EQ(e.code(), ErrorCode::TRANSPORT);
    EXPECT_TRUE(e.is_retryable());
  }
  EXPECT_FALSE(client.is_connected());
}

TEST_F(CoordinatorServerTest, HeartbeatLoopCountsFailures) {
  CoordinatorClient client("127.0.0.1", server_->port());
  HeartbeatLoop loop(client, "unregistered", 10ms, []() { return WorkerStatus{status::Idle{}}; });

  EXPECT_FALSE(loop.beat_once());
  EXPECT_EQ(loop.failure_count(), 1u);
  EXPECT_THAT(loop.last_error(), ::testing::HasSubstr("UNKNOWN_WORKER"));
}

TEST_F(CoordinatorServerTest, HeartbeatLoopRunsInBackground) {
  auto client = make_client();
  client->register_worker(worker("w0"));

  HeartbeatLoop loop(*client, "w0", 10ms, []() {
    return WorkerStatus{status::Training{7, 1, "forward"}};
  });
  loop.start();
  EXPECT_TRUE(eventually([&]() { return loop.sent_count() >= 3; }));
  loop.stop();

  EXPECT_FALSE(loop.is_running());
  EXPECT_EQ(loop.failure_count(), 0u);
  auto health = service_->liveness().get("w0");
  ASSERT_TRUE(health.has_value());
  EXPECT_EQ(step_of(health->status), 7u);
  EXPECT_GT(health->resources.memory_used_bytes, 0u);
}

// ==================== Connection Handling Tests ====================

TEST_F(CoordinatorServerTest, DisconnectCancelsParkedBarrierWait) {
  auto client = make_client();
  client->register_worker(worker("w0"));
  client->register_worker(worker("w1"));

  asio::io_context io;
  asio::ip::tcp::socket raw(io);
  raw.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_->port()));

  proto::Request request;
  request.set_request_id(1);
  auto *barrier = request.mutable_wait_barrier();
  barrier->set_worker_id("w0");
  barrier->set_barrier_id("abandoned");
  barrier->set_step(1);
  auto frame = ProtobufCodec::frame(request, 1024);
  asio::write(raw, asio::buffer(frame));

  ASSERT_TRUE(eventually([&]() { return server_->pending_barrier_waits() == 1; }));
  raw.close();

  EXPECT_TRUE(eventually([&]() { return server_->pending_barrier_waits() == 0; }));
  auto barriers = service_->barriers().snapshot();
  ASSERT_EQ(barriers.size(), 1u);
  EXPECT_EQ(barriers[0].arrived, 0u);
}

TEST_F(CoordinatorServerTest, BadMagicClosesConnection) {
  asio::io_context io;
  asio::ip::tcp::socket raw(io);
  raw.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_->port()));
  ASSERT_TRUE(eventually([&]() { return server_->session_count() == 1; }));

  const std::string junk = "GET / HTTP/1.1\r\n\r\n";
  asio::write(raw, asio::buffer(junk));

  std::array<uint8_t, 16> buffer{};
  std::error_code ec;
  raw.read_some(asio::buffer(buffer), ec);
  EXPECT_TRUE(ec == asio::error::eof || ec == asio::error::connection_reset) << ec.message();
  EXPECT_TRUE(eventually([&]() { return server_->session_count() == 0; }));
}

TEST_F(CoordinatorServerTest, StopIsIdempotent) {
  server_->stop();
  EXPECT_FALSE(server_->is_running());
  EXPECT_NO_THROW(server_->stop());
}
