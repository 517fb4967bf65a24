/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/checkpoint_manager.hpp"
#include "fleet/config.hpp"
#include "fleet/coordinator_client.hpp"
#include "fleet/error.hpp"
#include "fleet/heartbeat_loop.hpp"
#include "utils/env.hpp"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

std::atomic<bool> g_shutdown_requested{false};

std::string default_worker_id() {
  char hostname[256] = {0};
  if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
    return "worker-" + std::to_string(getpid());
  }
  return std::string(hostname) + "-" + std::to_string(getpid());
}

// Stand-in for model weights: deterministic bytes derived from the step.
std::vector<uint8_t> fake_model_state(uint64_t step, size_t size) {
  std::vector<uint8_t> state(size);
  for (size_t i = 0; i < size; ++i) {
    state[i] = static_cast<uint8_t>((step * 131 + i * 7) & 0xFF);
  }
  return state;
}

tfleet::DatasetSpec synthetic_dataset() {
  tfleet::DatasetSpec dataset;
  dataset.dataset_id = "synthetic";
  dataset.path = "/data/synthetic";
  dataset.format = "raw";
  dataset.total_samples = 10000;
  dataset.shard_size = 1000;
  dataset.shuffle = true;
  dataset.seed = 42;
  return dataset;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc > 4) {
    std::cerr << "Usage: " << argv[0] << " [config.json] [epochs] [steps_per_epoch]" << std::endl;
    std::cerr << "Example: " << argv[0] << " fleet.json 3 20" << std::endl;
    return 1;
  }

  tfleet::FleetConfig config;
  try {
    if (argc >= 2) {
      config = tfleet::load_config(argv[1]);
    }
    tfleet::apply_env_overrides(config);
    tfleet::validate_config(config);
  } catch (const tfleet::FleetError &e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  const uint64_t epochs = argc >= 3 ? std::strtoull(argv[2], nullptr, 10) : 2;
  const uint64_t steps_per_epoch = argc >= 4 ? std::strtoull(argv[3], nullptr, 10) : 10;
  const uint64_t checkpoint_every = 5;

  if (config.client.worker_id.empty()) {
    config.client.worker_id = default_worker_id();
  }
  const std::string worker_id = config.client.worker_id;

  std::signal(SIGINT, [](int) { g_shutdown_requested.store(true); });

  try {
    tfleet::CoordinatorClient client(config.client);
    // heartbeats travel on their own connection so a parked barrier call does not starve them
    tfleet::CoordinatorClient heartbeat_client(config.client);
    tfleet::CheckpointManager checkpoints(config.checkpoint);

    tfleet::WorkerInfo info;
    info.worker_id = worker_id;
    char hostname[256] = {0};
    gethostname(hostname, sizeof(hostname) - 1);
    info.hostname = hostname;
    info.memory_bytes = static_cast<uint64_t>(sysconf(_SC_PHYS_PAGES)) *
                        static_cast<uint64_t>(sysconf(_SC_PAGE_SIZE));

    tfleet::Registration registration;
    try {
      registration = client.register_worker(info);
    } catch (const tfleet::FleetError &e) {
      std::cerr << "Registration failed: " << e.what() << std::endl;
      return 1;
    }
    std::cout << "Worker " << worker_id << " registered with rank " << registration.rank
              << " of " << registration.world_size << std::endl;

    std::mutex status_mutex;
    tfleet::WorkerStatus current_status = tfleet::status::Idle{};
    auto set_status = [&](tfleet::WorkerStatus status) {
      std::lock_guard<std::mutex> lock(status_mutex);
      current_status = std::move(status);
    };

    const auto interval = std::chrono::milliseconds(registration.heartbeat_interval_ms > 0
                                                        ? registration.heartbeat_interval_ms
                                                        : config.client.heartbeat_interval_ms);
    tfleet::HeartbeatLoop heartbeats(heartbeat_client, worker_id, interval, [&]() {
      std::lock_guard<std::mutex> lock(status_mutex);
      return current_status;
    });
    heartbeats.start();

    // FLEET_DATASET holds a dataset spec as JSON, e.g. {"dataset_id":"ds","total_samples":100,...}
    const std::string dataset_json = utils::get_env("FLEET_DATASET", "");
    const tfleet::DatasetSpec dataset =
        dataset_json.empty() ? synthetic_dataset()
                             : tfleet::DatasetSpec::from_json(nlohmann::json::parse(dataset_json));
    auto ack = client.register_dataset(dataset);
    std::cout << "Dataset " << ack.dataset_id << " has " << ack.total_shards << " shards"
              << (ack.created ? " (created)" : "") << std::endl;

    uint64_t start_epoch = 0;
    uint64_t step = 0;
    auto recovery = client.get_latest_checkpoint(worker_id);
    if (recovery.has_checkpoint) {
      start_epoch = recovery.resume_epoch;
      step = recovery.resume_step;
      std::cout << "Resuming from " << recovery.checkpoint.checkpoint_id << " at step " << step
                << ", epoch " << start_epoch << std::endl;
    }

    for (uint64_t epoch = start_epoch; epoch < epochs && !g_shutdown_requested.load(); ++epoch) {
      set_status(tfleet::status::LoadingData{epoch, dataset.dataset_id});
      auto shard = client.get_data_shard(worker_id, dataset.dataset_id, epoch);
      std::cout << "Epoch " << epoch << ": shard " << shard.shard_id << "/" << shard.total_shards
                << " with " << shard.num_samples << " samples in " << shard.sample_ranges.size()
                << " ranges" << std::endl;

      for (uint64_t i = 0; i < steps_per_epoch && !g_shutdown_requested.load(); ++i) {
        ++step;
        set_status(tfleet::status::Training{step, epoch, "train"});
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        if (step % checkpoint_every == 0) {
          set_status(tfleet::status::Checkpointing{step, epoch});
          auto id = checkpoints.save_async(fake_model_state(step, 64 * 1024), step, epoch);
          checkpoints.wait_pending();

          auto local = checkpoints.get_by_step(step);
          tfleet::CheckpointRecord record;
          record.checkpoint_id = id;
          record.worker_id = worker_id;
          record.step = step;
          record.epoch = epoch;
          record.storage_path = local ? local->path : "";
          record.size_bytes = local ? local->size_bytes : 0;
          record.timestamp_ms = tfleet::wall_clock_ms();
          try {
            client.notify_checkpoint(record);
          } catch (const tfleet::FleetError &e) {
            std::cerr << "Checkpoint notification failed: " << e.what() << std::endl;
          }
        }
      }

      set_status(tfleet::status::Idle{});
      try {
        auto result = client.wait_barrier(worker_id, "epoch-" + std::to_string(epoch), epoch);
        std::cout << "Barrier epoch-" << epoch << ": arrived " << result.arrival_order << " of "
                  << result.participants << std::endl;
      } catch (const tfleet::FleetError &e) {
        std::cerr << "Barrier for epoch " << epoch << " failed: " << e.what() << std::endl;
        if (!e.is_retryable()) {
          break;
        }
      }
    }

    heartbeats.stop();
    client.deregister_worker(worker_id);
    std::cout << "Worker " << worker_id << " finished at step " << step << " after "
              << heartbeats.sent_count() << " heartbeats" << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Worker failed: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
