/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "coordinator_client.hpp"
#include "resource_sampler.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace tfleet {

/**
 * @brief Worker-side background heartbeat. Each beat reports the status returned by the provider
 * together with a fresh resource sample. Failed beats are logged and counted; the loop keeps
 * going since heartbeats are telemetry.
 */
class HeartbeatLoop {
public:
  using StatusProvider = std::function<WorkerStatus()>;

  HeartbeatLoop(CoordinatorClient &client, std::string worker_id,
                std::chrono::milliseconds interval, StatusProvider status_provider);
  ~HeartbeatLoop();

  HeartbeatLoop(const HeartbeatLoop &) = delete;
  HeartbeatLoop &operator=(const HeartbeatLoop &) = delete;

  void start();
  void stop();
  bool is_running() const { return running_.load(std::memory_order_acquire); }

  // One heartbeat on the calling thread. Returns false if it failed.
  bool beat_once();

  uint64_t sent_count() const { return sent_count_.load(std::memory_order_relaxed); }
  uint64_t failure_count() const { return failure_count_.load(std::memory_order_relaxed); }
  std::string last_error() const;

private:
  void run();

  CoordinatorClient &client_;
  std::string worker_id_;
  std::chrono::milliseconds interval_;
  StatusProvider status_provider_;
  ResourceSampler sampler_;

  std::atomic<bool> running_{false};
  std::thread thread_;
  std::mutex loop_mutex_;
  std::condition_variable loop_cv_;

  std::atomic<uint64_t> sent_count_{0};
  std::atomic<uint64_t> failure_count_{0};
  mutable std::mutex error_mutex_;
  std::string last_error_;
};

} // namespace tfleet
