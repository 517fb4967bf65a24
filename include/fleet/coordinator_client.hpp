/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "asio.hpp"
#include "config.hpp"
#include "coordinator_service.hpp"
#include "fleet.pb.h"
#include "types.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace tfleet {

/**
 * @brief Blocking client for the coordinator's remote calls. One call is in flight per client at
 * a time, so a worker that blocks in wait_barrier heartbeats through a second client.
 *
 * Coordinator errors are rethrown as FleetError with the code the server reported; socket
 * failures surface as FleetError(TRANSPORT) and drop the connection, which is re-established on
 * the next call.
 */
class CoordinatorClient {
public:
  explicit CoordinatorClient(const ClientConfig &config);
  CoordinatorClient(const std::string &host, int port);
  ~CoordinatorClient();

  CoordinatorClient(const CoordinatorClient &) = delete;
  CoordinatorClient &operator=(const CoordinatorClient &) = delete;

  void connect();
  void disconnect();
  bool is_connected() const;

  Registration register_worker(const WorkerInfo &info);
  void deregister_worker(const std::string &worker_id);

  DatasetAck register_dataset(const DatasetSpec &spec);
  ShardAssignment get_data_shard(const std::string &worker_id, const std::string &dataset_id,
                                 uint64_t epoch);

  /**
   * @return the coordinator's wall clock in milliseconds
   */
  int64_t heartbeat(const std::string &worker_id, const WorkerStatus &status,
                    const ResourceSnapshot &resources);

  void notify_checkpoint(const CheckpointRecord &record);
  RecoveryInfo get_latest_checkpoint(const std::string &worker_id);

  /**
   * @brief Blocks until every participant arrived, the timeout expires or the barrier is
   * cancelled. Without a timeout the coordinator's default applies.
   */
  BarrierResult wait_barrier(const std::string &worker_id, const std::string &barrier_id,
                             uint64_t step,
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  nlohmann::json get_snapshot();

  const std::string &host() const { return host_; }
  int port() const { return port_; }

private:
  proto::Response call(proto::Request &request);
  void connect_locked();
  void close_locked();

  std::string host_;
  int port_;
  uint32_t max_message_bytes_;

  asio::io_context io_context_;
  asio::ip::tcp::socket socket_;
  bool connected_ = false;
  uint64_t next_request_id_ = 1;
  mutable std::mutex call_mutex_;
};

} // namespace tfleet
