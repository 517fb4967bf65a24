/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/coordinator_client.hpp"
#include "fleet/error.hpp"
#include "fleet/framing.hpp"
#include "fleet/protobuf_codec.hpp"

#include <array>
#include <iostream>
#include <system_error>
#include <vector>

namespace tfleet {

CoordinatorClient::CoordinatorClient(const ClientConfig &config)
    : host_(config.coordinator_host), port_(config.coordinator_port),
      max_message_bytes_(config.max_message_bytes), socket_(io_context_) {}

CoordinatorClient::CoordinatorClient(const std::string &host, int port)
    : host_(host), port_(port), max_message_bytes_(ClientConfig().max_message_bytes),
      socket_(io_context_) {}

CoordinatorClient::~CoordinatorClient() {
  std::lock_guard<std::mutex> lock(call_mutex_);
  close_locked();
}

void CoordinatorClient::connect() {
  std::lock_guard<std::mutex> lock(call_mutex_);
  connect_locked();
}

void CoordinatorClient::disconnect() {
  std::lock_guard<std::mutex> lock(call_mutex_);
  close_locked();
}

bool CoordinatorClient::is_connected() const {
  std::lock_guard<std::mutex> lock(call_mutex_);
  return connected_;
}

void CoordinatorClient::connect_locked() {
  if (connected_) {
    return;
  }
  try {
    asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host_, std::to_string(port_));
    asio::connect(socket_, endpoints);
  } catch (const std::system_error &e) {
    std::error_code ec;
    socket_.close(ec);
    throw FleetError(ErrorCode::TRANSPORT, "Cannot connect to coordinator at " + host_ + ":" +
                                               std::to_string(port_) + ": " + e.what());
  }

  std::error_code ec;
  socket_.set_option(asio::ip::tcp::no_delay(true), ec);
  connected_ = true;
}

void CoordinatorClient::close_locked() {
  if (!connected_) {
    return;
  }
  std::error_code ec;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
  connected_ = false;
}

proto::Response CoordinatorClient::call(proto::Request &request) {
  std::lock_guard<std::mutex> lock(call_mutex_);
  connect_locked();

  request.set_request_id(next_request_id_++);
  auto frame = ProtobufCodec::frame(request, max_message_bytes_);

  proto::Response response;
  try {
    asio::write(socket_, asio::buffer(frame));

    std::array<uint8_t, FrameHeader::SIZE> header_bytes{};
    asio::read(socket_, asio::buffer(header_bytes));

    FrameHeader header;
    try {
      header = FrameHeader::decode(header_bytes.data());
    } catch (const std::runtime_error &e) {
      close_locked();
      throw FleetError(ErrorCode::TRANSPORT, e.what());
    }
    if (header.length > max_message_bytes_) {
      close_locked();
      throw FleetError(ErrorCode::TRANSPORT,
                       "Response of " + std::to_string(header.length) + " bytes exceeds limit");
    }

    std::vector<uint8_t> body(header.length);
    asio::read(socket_, asio::buffer(body));
    response = ProtobufCodec::parse<proto::Response>(body.data(), body.size());
  } catch (const std::system_error &e) {
    close_locked();
    throw FleetError(ErrorCode::TRANSPORT, std::string("Coordinator connection lost: ") + e.what());
  }

  if (response.request_id() != request.request_id()) {
    close_locked();
    throw FleetError(ErrorCode::TRANSPORT,
                     "Response " + std::to_string(response.request_id()) +
                         " does not match request " + std::to_string(request.request_id()));
  }

  ProtobufCodec::throw_if_error(response);
  return response;
}

Registration CoordinatorClient::register_worker(const WorkerInfo &info) {
  proto::Request request;
  ProtobufCodec::to_proto(info, request.mutable_register_worker());
  auto response = call(request);
  if (!response.has_worker_config()) {
    throw FleetError(ErrorCode::INTERNAL, "RegisterWorker response carries no worker config");
  }
  return ProtobufCodec::from_proto(response.worker_config());
}

void CoordinatorClient::deregister_worker(const std::string &worker_id) {
  proto::Request request;
  request.mutable_deregister_worker()->set_worker_id(worker_id);
  call(request);
}

DatasetAck CoordinatorClient::register_dataset(const DatasetSpec &spec) {
  proto::Request request;
  ProtobufCodec::to_proto(spec, request.mutable_register_dataset());
  auto response = call(request);
  return ProtobufCodec::from_proto(response.dataset_ack());
}

ShardAssignment CoordinatorClient::get_data_shard(const std::string &worker_id,
                                                  const std::string &dataset_id, uint64_t epoch) {
  proto::Request request;
  auto *shard_request = request.mutable_get_data_shard();
  shard_request->set_worker_id(worker_id);
  shard_request->set_dataset_id(dataset_id);
  shard_request->set_epoch(epoch);
  auto response = call(request);
  return ProtobufCodec::from_proto(response.shard_assignment());
}

int64_t CoordinatorClient::heartbeat(const std::string &worker_id, const WorkerStatus &status,
                                     const ResourceSnapshot &resources) {
  proto::Request request;
  auto *hb = request.mutable_heartbeat();
  hb->set_worker_id(worker_id);
  hb->set_timestamp_ms(wall_clock_ms());
  ProtobufCodec::to_proto(status, hb->mutable_status());
  ProtobufCodec::to_proto(resources, hb->mutable_resources());
  auto response = call(request);
  return response.heartbeat().server_timestamp_ms();
}

void CoordinatorClient::notify_checkpoint(const CheckpointRecord &record) {
  proto::Request request;
  ProtobufCodec::to_proto(record, request.mutable_notify_checkpoint());
  call(request);
}

RecoveryInfo CoordinatorClient::get_latest_checkpoint(const std::string &worker_id) {
  proto::Request request;
  request.mutable_get_latest_checkpoint()->set_worker_id(worker_id);
  auto response = call(request);
  return ProtobufCodec::from_proto(response.recovery());
}

BarrierResult CoordinatorClient::wait_barrier(const std::string &worker_id,
                                              const std::string &barrier_id, uint64_t step,
                                              std::optional<std::chrono::milliseconds> timeout) {
  proto::Request request;
  auto *barrier = request.mutable_wait_barrier();
  barrier->set_worker_id(worker_id);
  barrier->set_barrier_id(barrier_id);
  barrier->set_step(step);
  if (timeout) {
    barrier->set_timeout_ms(static_cast<uint64_t>(timeout->count()));
  }
  auto response = call(request);
  return ProtobufCodec::from_proto(response.barrier());
}

nlohmann::json CoordinatorClient::get_snapshot() {
  proto::Request request;
  request.mutable_get_snapshot();
  auto response = call(request);
  try {
    return nlohmann::json::parse(response.snapshot().json());
  } catch (const nlohmann::json::exception &e) {
    throw FleetError(ErrorCode::INTERNAL, std::string("Malformed snapshot: ") + e.what());
  }
}

} // namespace tfleet
