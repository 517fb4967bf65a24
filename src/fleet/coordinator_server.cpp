/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/coordinator_server.hpp"
#include "fleet/error.hpp"
#include "fleet/protobuf_codec.hpp"

#include <chrono>
#include <iostream>

namespace tfleet {

CoordinatorServer::CoordinatorServer(CoordinatorService &service, const CoordinatorConfig &config)
    : service_(service), config_(config), acceptor_(io_context_) {
  if (config_.io_threads < 1) {
    throw std::invalid_argument("CoordinatorServer needs at least one I/O thread");
  }
}

CoordinatorServer::~CoordinatorServer() { stop(); }

void CoordinatorServer::start() {
  if (is_running_.load(std::memory_order_acquire)) {
    std::cerr << "[CoordinatorServer] Already running" << std::endl;
    return;
  }

  asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config_.bind_address),
                                   static_cast<asio::ip::port_type>(config_.port));
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen();
  bound_port_ = acceptor_.local_endpoint().port();

  is_running_.store(true, std::memory_order_release);
  work_guard_.emplace(asio::make_work_guard(io_context_));
  accept_connections();

  for (int i = 0; i < config_.io_threads; ++i) {
    io_threads_.emplace_back([this]() {
      try {
        io_context_.run();
      } catch (const std::exception &e) {
        std::cerr << "[CoordinatorServer] I/O thread terminated: " << e.what() << std::endl;
      }
    });
  }

  service_.set_address(config_.bind_address + ":" + std::to_string(bound_port_));
  std::cout << "[CoordinatorServer] Listening on " << config_.bind_address << ":" << bound_port_
            << " with " << config_.io_threads << " I/O threads" << std::endl;
}

void CoordinatorServer::stop() {
  if (!is_running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  std::error_code ec;
  acceptor_.close(ec);

  std::vector<std::shared_ptr<Session>> sessions;
  {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    for (auto &entry : sessions_) {
      sessions.push_back(entry.second);
    }
  }
  for (auto &session : sessions) {
    close_session(session, "server shutdown");
  }

  std::list<std::future<void>> tasks;
  {
    std::lock_guard<std::mutex> lock(barrier_tasks_mutex_);
    tasks.swap(barrier_tasks_);
  }
  for (auto &task : tasks) {
    try {
      task.get();
    } catch (const std::exception &e) {
      std::cerr << "[CoordinatorServer] Barrier task failed: " << e.what() << std::endl;
    }
  }

  work_guard_.reset();
  io_context_.stop();
  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  std::cout << "[CoordinatorServer] Stopped" << std::endl;
}

size_t CoordinatorServer::session_count() const {
  std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
  return sessions_.size();
}

size_t CoordinatorServer::pending_barrier_waits() {
  std::lock_guard<std::mutex> lock(barrier_tasks_mutex_);
  prune_barrier_tasks_locked();
  return barrier_tasks_.size();
}

void CoordinatorServer::accept_connections() {
  if (!is_running_.load(std::memory_order_acquire))
    return;

  const uint64_t session_id = next_session_id_.fetch_add(1, std::memory_order_relaxed);
  auto session = std::make_shared<Session>(session_id, io_context_);

  acceptor_.async_accept(session->socket, [this, session](std::error_code ec) {
    if (!ec && is_running_.load(std::memory_order_acquire)) {
      std::error_code option_ec;
      session->socket.set_option(asio::ip::tcp::no_delay(true), option_ec);

      auto remote = session->socket.remote_endpoint(option_ec);
      session->peer = option_ec
                          ? std::string("unknown")
                          : remote.address().to_string() + ":" + std::to_string(remote.port());

      {
        std::lock_guard<std::shared_mutex> lock(sessions_mutex_);
        sessions_[session->id] = session;
      }

      asio::post(session->strand, [this, session]() { start_read(session); });
    } else if (ec && ec != asio::error::operation_aborted) {
      std::cerr << "[CoordinatorServer] Accept error: " << ec.message() << std::endl;
    }

    accept_connections();
  });
}

void CoordinatorServer::start_read(std::shared_ptr<Session> session) {
  if (!is_running_.load(std::memory_order_acquire) || session->closed.load())
    return;

  asio::async_read(
      session->socket, asio::buffer(session->header_buffer),
      asio::bind_executor(session->strand, [this, session](std::error_code ec, std::size_t) {
        if (ec) {
          close_session(session, ec == asio::error::eof ? "closed by peer" : ec.message());
          return;
        }

        FrameHeader header;
        try {
          header = FrameHeader::decode(session->header_buffer.data());
        } catch (const std::exception &e) {
          close_session(session, e.what());
          return;
        }

        if (header.length > config_.max_message_bytes) {
          close_session(session, "frame of " + std::to_string(header.length) +
                                     " bytes exceeds max_message_bytes");
          return;
        }
        read_body(session, header.length);
      }));
}

void CoordinatorServer::read_body(std::shared_ptr<Session> session, uint32_t length) {
  session->body_buffer.resize(length);

  asio::async_read(
      session->socket, asio::buffer(session->body_buffer),
      asio::bind_executor(session->strand, [this, session](std::error_code ec, std::size_t) {
        if (ec) {
          close_session(session, ec.message());
          return;
        }
        handle_request(session);
        start_read(session);
      }));
}

void CoordinatorServer::handle_request(const std::shared_ptr<Session> &session) {
  proto::Request request;
  try {
    request = ProtobufCodec::parse<proto::Request>(session->body_buffer.data(),
                                                   session->body_buffer.size());
  } catch (const FleetError &e) {
    std::cerr << "[CoordinatorServer] Dropping malformed request from " << session->peer << ": "
              << e.what() << std::endl;
    proto::Response response;
    ProtobufCodec::set_error(FleetError(ErrorCode::INVALID_ARGUMENT, e.detail()), &response);
    send_response(session, response);
    return;
  }

  if (request.body_case() == proto::Request::kWaitBarrier) {
    spawn_barrier_wait(session, request);
    return;
  }
  send_response(session, dispatch(request));
}

proto::Response CoordinatorServer::dispatch(const proto::Request &request) {
  proto::Response response;
  response.set_request_id(request.request_id());

  try {
    switch (request.body_case()) {
    case proto::Request::kRegisterWorker: {
      auto registration =
          service_.register_worker(ProtobufCodec::from_proto(request.register_worker()));
      ProtobufCodec::to_proto(registration, response.mutable_worker_config());
    } break;
    case proto::Request::kDeregisterWorker: {
      service_.deregister_worker(request.deregister_worker().worker_id());
      response.mutable_ack()->set_acknowledged(true);
    } break;
    case proto::Request::kRegisterDataset: {
      auto ack = service_.register_dataset(ProtobufCodec::from_proto(request.register_dataset()));
      ProtobufCodec::to_proto(ack, response.mutable_dataset_ack());
    } break;
    case proto::Request::kGetDataShard: {
      const auto &shard_request = request.get_data_shard();
      auto shard = service_.get_data_shard(shard_request.worker_id(), shard_request.dataset_id(),
                                           shard_request.epoch());
      ProtobufCodec::to_proto(shard, response.mutable_shard_assignment());
    } break;
    case proto::Request::kHeartbeat: {
      const auto &hb = request.heartbeat();
      int64_t server_time =
          service_.heartbeat(hb.worker_id(), ProtobufCodec::from_proto(hb.status()),
                             ProtobufCodec::from_proto(hb.resources()), hb.timestamp_ms());
      response.mutable_heartbeat()->set_acknowledged(true);
      response.mutable_heartbeat()->set_server_timestamp_ms(server_time);
    } break;
    case proto::Request::kNotifyCheckpoint: {
      auto record = ProtobufCodec::from_proto(request.notify_checkpoint());
      service_.notify_checkpoint(record);
      response.mutable_checkpoint_ack()->set_acknowledged(true);
      response.mutable_checkpoint_ack()->set_checkpoint_id(record.checkpoint_id);
    } break;
    case proto::Request::kGetLatestCheckpoint: {
      auto recovery = service_.get_latest_checkpoint(request.get_latest_checkpoint().worker_id());
      ProtobufCodec::to_proto(recovery, response.mutable_recovery());
    } break;
    case proto::Request::kGetSnapshot: {
      response.mutable_snapshot()->set_json(service_.snapshot().dump());
    } break;
    case proto::Request::kWaitBarrier:
    case proto::Request::BODY_NOT_SET:
    default:
      throw errors::invalid_argument("Unsupported request body " +
                                     std::to_string(static_cast<int>(request.body_case())));
    }
  } catch (const FleetError &e) {
    ProtobufCodec::set_error(e, &response);
  } catch (const std::exception &e) {
    std::cerr << "[CoordinatorServer] Request " << request.request_id() << " failed: " << e.what()
              << std::endl;
    ProtobufCodec::set_error(FleetError(ErrorCode::INTERNAL, e.what()), &response);
  }
  return response;
}

void CoordinatorServer::spawn_barrier_wait(const std::shared_ptr<Session> &session,
                                           const proto::Request &request) {
  const auto &barrier_request = request.wait_barrier();
  const auto wait_key = std::make_pair(barrier_request.worker_id(), barrier_request.barrier_id());
  {
    std::lock_guard<std::mutex> lock(session->barrier_mutex);
    session->barrier_waits.insert(wait_key);
  }

  auto task = std::async(std::launch::async, [this, session, request, wait_key]() {
    const auto &barrier_request = request.wait_barrier();
    // shares ownership of the session; close_session sets the flag before cancelling waits
    CancelToken closed(session, &session->closed);

    proto::Response response;
    response.set_request_id(request.request_id());
    try {
      auto timeout = ProtobufCodec::barrier_timeout(barrier_request);
      auto result = service_.wait_barrier(barrier_request.worker_id(), barrier_request.barrier_id(),
                                          barrier_request.step(), timeout, closed);
      ProtobufCodec::to_proto(result, response.mutable_barrier());
    } catch (const FleetError &e) {
      ProtobufCodec::set_error(e, &response);
    } catch (const std::exception &e) {
      ProtobufCodec::set_error(FleetError(ErrorCode::INTERNAL, e.what()), &response);
    }

    {
      std::lock_guard<std::mutex> lock(session->barrier_mutex);
      auto it = session->barrier_waits.find(wait_key);
      if (it != session->barrier_waits.end()) {
        session->barrier_waits.erase(it);
      }
    }
    send_response(session, response);
  });

  std::lock_guard<std::mutex> lock(barrier_tasks_mutex_);
  prune_barrier_tasks_locked();
  barrier_tasks_.push_back(std::move(task));
}

void CoordinatorServer::prune_barrier_tasks_locked() {
  for (auto it = barrier_tasks_.begin(); it != barrier_tasks_.end();) {
    if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      try {
        it->get();
      } catch (const std::exception &e) {
        std::cerr << "[CoordinatorServer] Barrier task failed: " << e.what() << std::endl;
      }
      it = barrier_tasks_.erase(it);
    } else {
      ++it;
    }
  }
}

void CoordinatorServer::send_response(const std::shared_ptr<Session> &session,
                                      const proto::Response &response) {
  if (session->closed.load(std::memory_order_acquire)) {
    return;
  }

  std::shared_ptr<std::vector<uint8_t>> buffer;
  try {
    buffer = std::make_shared<std::vector<uint8_t>>(
        ProtobufCodec::frame(response, config_.max_message_bytes));
  } catch (const FleetError &e) {
    std::cerr << "[CoordinatorServer] Cannot frame response " << response.request_id() << ": "
              << e.what() << std::endl;
    proto::Response error_response;
    error_response.set_request_id(response.request_id());
    ProtobufCodec::set_error(FleetError(ErrorCode::RESOURCE_EXHAUSTED, e.detail()),
                             &error_response);
    buffer = std::make_shared<std::vector<uint8_t>>(
        ProtobufCodec::frame(error_response, config_.max_message_bytes));
  }

  {
    std::lock_guard<std::mutex> write_lock(session->write_mutex);
    session->write_queue.push_back(std::move(buffer));
  }

  if (!session->writing.exchange(true, std::memory_order_acquire)) {
    asio::post(session->strand, [this, session]() { start_async_write(session); });
  }
}

void CoordinatorServer::start_async_write(std::shared_ptr<Session> session) {
  std::shared_ptr<std::vector<uint8_t>> write_buffer;

  {
    std::lock_guard<std::mutex> write_lock(session->write_mutex);
    if (session->write_queue.empty() || session->closed.load(std::memory_order_acquire)) {
      session->writing.store(false, std::memory_order_release);
      return;
    }
    write_buffer = std::move(session->write_queue.front());
    session->write_queue.pop_front();
  }

  asio::async_write(session->socket, asio::buffer(*write_buffer),
                    asio::bind_executor(session->strand, [this, session, write_buffer](
                                                             std::error_code ec, std::size_t) {
                      if (ec) {
                        session->writing.store(false, std::memory_order_release);
                        close_session(session, ec.message());
                        return;
                      }
                      start_async_write(session);
                    }));
}

void CoordinatorServer::close_session(const std::shared_ptr<Session> &session,
                                      const std::string &reason) {
  if (session->closed.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  std::cout << "[CoordinatorServer] Session " << session->id << " (" << session->peer
            << ") closed: " << reason << std::endl;

  std::multiset<std::pair<std::string, std::string>> waits;
  {
    std::lock_guard<std::mutex> lock(session->barrier_mutex);
    waits.swap(session->barrier_waits);
  }
  for (const auto &wait : waits) {
    service_.cancel_barrier(wait.first, wait.second);
  }

  asio::post(session->strand, [session]() {
    std::error_code ec;
    session->socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    session->socket.close(ec);
    std::lock_guard<std::mutex> write_lock(session->write_mutex);
    session->write_queue.clear();
  });

  std::lock_guard<std::shared_mutex> lock(sessions_mutex_);
  sessions_.erase(session->id);
}

} // namespace tfleet
