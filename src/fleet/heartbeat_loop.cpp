/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/heartbeat_loop.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace tfleet {

HeartbeatLoop::HeartbeatLoop(CoordinatorClient &client, std::string worker_id,
                             std::chrono::milliseconds interval, StatusProvider status_provider)
    : client_(client), worker_id_(std::move(worker_id)), interval_(interval),
      status_provider_(std::move(status_provider)) {
  if (interval_.count() <= 0) {
    throw std::invalid_argument("Heartbeat interval must be positive");
  }
  if (!status_provider_) {
    throw std::invalid_argument("HeartbeatLoop needs a status provider");
  }
}

HeartbeatLoop::~HeartbeatLoop() { stop(); }

void HeartbeatLoop::start() {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    std::cerr << "[HeartbeatLoop] Already running for " << worker_id_ << std::endl;
    return;
  }
  thread_ = std::thread(&HeartbeatLoop::run, this);
}

void HeartbeatLoop::stop() {
  {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    running_.store(false, std::memory_order_release);
  }
  loop_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool HeartbeatLoop::beat_once() {
  try {
    client_.heartbeat(worker_id_, status_provider_(), sampler_.sample());
    sent_count_.fetch_add(1, std::memory_order_relaxed);
    return true;
  } catch (const std::exception &e) {
    failure_count_.fetch_add(1, std::memory_order_relaxed);
    {
      std::lock_guard<std::mutex> lock(error_mutex_);
      last_error_ = e.what();
    }
    std::cerr << "[HeartbeatLoop] Heartbeat for " << worker_id_ << " failed: " << e.what()
              << std::endl;
    return false;
  }
}

std::string HeartbeatLoop::last_error() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_error_;
}

void HeartbeatLoop::run() {
  while (running_.load(std::memory_order_acquire)) {
    beat_once();

    std::unique_lock<std::mutex> lock(loop_mutex_);
    loop_cv_.wait_for(lock, interval_,
                      [this]() { return !running_.load(std::memory_order_acquire); });
  }
}

} // namespace tfleet
