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
#include "framing.hpp"

#include <array>
#include <atomic>
#include <deque>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tfleet {

/**
 * @brief TCP front end of the CoordinatorService. Requests are framed protobuf envelopes; every
 * call except WaitBarrier is answered on the I/O thread that read it. Barrier waits run on their
 * own task and are cancelled when their connection drops.
 */
class CoordinatorServer {
public:
  CoordinatorServer(CoordinatorService &service, const CoordinatorConfig &config);
  ~CoordinatorServer();

  CoordinatorServer(const CoordinatorServer &) = delete;
  CoordinatorServer &operator=(const CoordinatorServer &) = delete;

  // Binds, listens and starts the I/O threads. Port 0 picks an ephemeral port.
  void start();
  void stop();

  bool is_running() const { return is_running_.load(std::memory_order_acquire); }
  uint16_t port() const { return bound_port_; }
  size_t session_count() const;
  size_t pending_barrier_waits();

private:
  struct Session {
    uint64_t id;
    asio::ip::tcp::socket socket;
    asio::strand<asio::io_context::executor_type> strand;
    std::string peer;

    std::array<uint8_t, FrameHeader::SIZE> header_buffer{};
    std::vector<uint8_t> body_buffer;

    std::deque<std::shared_ptr<std::vector<uint8_t>>> write_queue;
    std::mutex write_mutex;
    std::atomic<bool> writing{false};

    // (worker_id, barrier_id) of waits still parked in the coordinator
    std::multiset<std::pair<std::string, std::string>> barrier_waits;
    std::mutex barrier_mutex;

    std::atomic<bool> closed{false};

    Session(uint64_t session_id, asio::io_context &io_context)
        : id(session_id), socket(io_context), strand(asio::make_strand(io_context)) {}
  };

  void accept_connections();
  void start_read(std::shared_ptr<Session> session);
  void read_body(std::shared_ptr<Session> session, uint32_t length);
  void handle_request(const std::shared_ptr<Session> &session);

  proto::Response dispatch(const proto::Request &request);
  void spawn_barrier_wait(const std::shared_ptr<Session> &session, const proto::Request &request);

  void send_response(const std::shared_ptr<Session> &session, const proto::Response &response);
  void start_async_write(std::shared_ptr<Session> session);
  void close_session(const std::shared_ptr<Session> &session, const std::string &reason);

  void prune_barrier_tasks_locked();

  CoordinatorService &service_;
  CoordinatorConfig config_;

  asio::io_context io_context_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  asio::ip::tcp::acceptor acceptor_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> is_running_{false};
  uint16_t bound_port_ = 0;

  std::unordered_map<uint64_t, std::shared_ptr<Session>> sessions_;
  mutable std::shared_mutex sessions_mutex_;
  std::atomic<uint64_t> next_session_id_{1};

  std::list<std::future<void>> barrier_tasks_;
  std::mutex barrier_tasks_mutex_;
};

} // namespace tfleet
