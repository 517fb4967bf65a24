/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "config.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tfleet {

struct LocalCheckpoint {
  std::string checkpoint_id;
  uint64_t step = 0;
  uint64_t epoch = 0;
  uint64_t size_bytes = 0;
  std::string path;
  int64_t created_at_ms = 0;
};

/**
 * @brief Worker-local durable checkpoint store.
 *
 * Each checkpoint is the raw payload in `<base_path>/checkpoint-<step>.ckpt`, published by an
 * atomic rename of a fully written temporary file. At most keep_count checkpoints are retained;
 * the lowest steps are evicted first, and a checkpoint being loaded is only unlinked once the
 * read finishes.
 */
class CheckpointManager {
public:
  explicit CheckpointManager(const CheckpointManagerConfig &config);
  ~CheckpointManager();

  CheckpointManager(const CheckpointManager &) = delete;
  CheckpointManager &operator=(const CheckpointManager &) = delete;

  /**
   * @brief Writes synchronously. Saving an existing step replaces it.
   * @return the checkpoint id
   * @throws FleetError IO_FAILURE
   */
  std::string save(const std::vector<uint8_t> &data, uint64_t step, uint64_t epoch = 0);

  /**
   * @brief Queues the write on the writer pool. Blocks while max_pending_writes are in flight.
   * Failures surface from the next wait_pending().
   */
  std::string save_async(std::vector<uint8_t> data, uint64_t step, uint64_t epoch = 0);

  /**
   * @brief Returns once every write queued so far is durable and indexed.
   * @throws FleetError IO_FAILURE listing the async writes that failed since the last call.
   */
  void wait_pending();

  /**
   * @throws FleetError NOT_FOUND if no such checkpoint exists, IO_FAILURE if it cannot be read.
   */
  std::vector<uint8_t> load(uint64_t step);
  std::vector<uint8_t> load(const std::string &checkpoint_id);

  std::optional<LocalCheckpoint> get_by_step(uint64_t step) const;
  std::optional<LocalCheckpoint> latest() const;

  // Ascending by step.
  std::vector<LocalCheckpoint> all_checkpoints() const;

  size_t pending_count() const { return writers_->pending(); }
  size_t keep_count() const { return config_.keep_count; }
  const std::filesystem::path &base_path() const { return base_path_; }

  static std::string checkpoint_id_for(uint64_t step);

  // Accepts "checkpoint-<step>" and "checkpoint-<step>.ckpt".
  static std::optional<uint64_t> parse_step(const std::string &name);

  std::filesystem::path path_for(uint64_t step) const;

private:
  struct Entry {
    LocalCheckpoint meta;
    size_t readers = 0;
    bool evicted = false;
  };

  LocalCheckpoint write_file(const std::vector<uint8_t> &data, uint64_t step, uint64_t epoch);
  void publish(const std::filesystem::path &tmp, const LocalCheckpoint &meta);
  void enforce_retention_locked(std::vector<std::filesystem::path> &unlink_list);

  std::shared_ptr<Entry> pin(uint64_t step);
  void unpin(const std::shared_ptr<Entry> &entry);

  void recover_directory();
  void sync_directory() const;
  static void remove_file(const std::filesystem::path &path);

  CheckpointManagerConfig config_;
  std::filesystem::path base_path_;

  mutable std::mutex index_mutex_;
  std::map<uint64_t, std::shared_ptr<Entry>> index_;

  std::mutex failure_mutex_;
  std::vector<std::string> async_failures_;

  std::atomic<uint64_t> tmp_counter_{0};

  std::unique_ptr<ThreadPool> writers_;
};

} // namespace tfleet
