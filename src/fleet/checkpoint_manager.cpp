/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/checkpoint_manager.hpp"
#include "fleet/error.hpp"
#include "fleet/types.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <sys/stat.h>
#include <unistd.h>

namespace tfleet {

namespace fs = std::filesystem;

namespace {

constexpr const char *kPrefix = "checkpoint-";
constexpr const char *kExtension = ".ckpt";
constexpr const char *kTmpMarker = ".ckpt.tmp.";

std::string errno_message(const std::string &what, const fs::path &path) {
  return what + " " + path.string() + ": " + std::strerror(errno);
}

int64_t file_time_ms(const fs::path &path) {
  std::error_code ec;
  auto ftime = fs::last_write_time(path, ec);
  if (ec) {
    return wall_clock_ms();
  }
  auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
      fs::file_time_type::clock::now() - ftime);
  return wall_clock_ms() - age.count();
}

} // namespace

CheckpointManager::CheckpointManager(const CheckpointManagerConfig &config)
    : config_(config), base_path_(config.base_path) {
  if (config_.keep_count == 0) {
    throw std::invalid_argument("CheckpointManager requires keep_count > 0");
  }
  if (config_.writer_threads == 0) {
    throw std::invalid_argument("CheckpointManager requires at least one writer thread");
  }

  std::error_code ec;
  fs::create_directories(base_path_, ec);
  if (ec) {
    throw errors::io_failure("Failed to create checkpoint directory " + base_path_.string() +
                             ": " + ec.message());
  }

  recover_directory();

  writers_ = std::make_unique<ThreadPool>(config_.writer_threads, config_.max_pending_writes);

  std::cout << "[CheckpointManager] Using " << base_path_.string() << " (keep "
            << config_.keep_count << ", " << index_.size() << " existing checkpoints)" << std::endl;
}

CheckpointManager::~CheckpointManager() {
  try {
    wait_pending();
  } catch (const std::exception &e) {
    std::cerr << "[CheckpointManager] Pending writes failed during shutdown: " << e.what()
              << std::endl;
  }
}

std::string CheckpointManager::checkpoint_id_for(uint64_t step) {
  return kPrefix + std::to_string(step);
}

std::optional<uint64_t> CheckpointManager::parse_step(const std::string &name) {
  const std::string prefix(kPrefix);
  if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }

  std::string digits = name.substr(prefix.size());
  const std::string ext(kExtension);
  if (digits.size() > ext.size() &&
      digits.compare(digits.size() - ext.size(), ext.size(), ext) == 0) {
    digits.resize(digits.size() - ext.size());
  }
  if (digits.empty() || digits.size() > 20) {
    return std::nullopt;
  }
  for (char c : digits) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }
  try {
    return std::stoull(digits);
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

fs::path CheckpointManager::path_for(uint64_t step) const {
  return base_path_ / (checkpoint_id_for(step) + kExtension);
}

void CheckpointManager::recover_directory() {
  std::vector<LocalCheckpoint> found;

  std::error_code ec;
  for (fs::directory_iterator it(base_path_, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();

    if (name.find(kTmpMarker) != std::string::npos) {
      std::cout << "[CheckpointManager] Removing stale temporary file " << name << std::endl;
      remove_file(it->path());
      continue;
    }

    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) {
      continue;
    }

    auto step = parse_step(name);
    if (!step || name != checkpoint_id_for(*step) + kExtension) {
      continue;
    }

    LocalCheckpoint meta;
    meta.checkpoint_id = checkpoint_id_for(*step);
    meta.step = *step;
    meta.path = it->path().string();
    meta.size_bytes = static_cast<uint64_t>(it->file_size(type_ec));
    meta.created_at_ms = file_time_ms(it->path());
    found.push_back(std::move(meta));
  }
  if (ec) {
    throw errors::io_failure("Failed to scan checkpoint directory " + base_path_.string() + ": " +
                             ec.message());
  }

  std::vector<fs::path> unlink_list;
  {
    std::lock_guard<std::mutex> lock(index_mutex_);
    for (auto &meta : found) {
      auto entry = std::make_shared<Entry>();
      entry->meta = std::move(meta);
      index_[entry->meta.step] = entry;
    }
    enforce_retention_locked(unlink_list);
  }
  for (const auto &path : unlink_list) {
    remove_file(path);
  }
}

LocalCheckpoint CheckpointManager::write_file(const std::vector<uint8_t> &data, uint64_t step,
                                              uint64_t epoch) {
  const fs::path target = path_for(step);
  fs::path tmp = target;
  tmp += std::string(".tmp.") + std::to_string(::getpid()) + "." +
         std::to_string(tmp_counter_.fetch_add(1, std::memory_order_relaxed));

  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw errors::io_failure(errno_message("Failed to create", tmp));
  }

  const uint8_t *cursor = data.data();
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd, cursor, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::string message = errno_message("Failed to write", tmp);
      ::close(fd);
      remove_file(tmp);
      throw errors::io_failure(message);
    }
    cursor += written;
    remaining -= static_cast<size_t>(written);
  }

  if (config_.sync_writes && ::fsync(fd) != 0) {
    std::string message = errno_message("Failed to fsync", tmp);
    ::close(fd);
    remove_file(tmp);
    throw errors::io_failure(message);
  }
  if (::close(fd) != 0) {
    std::string message = errno_message("Failed to close", tmp);
    remove_file(tmp);
    throw errors::io_failure(message);
  }

  LocalCheckpoint meta;
  meta.checkpoint_id = checkpoint_id_for(step);
  meta.step = step;
  meta.epoch = epoch;
  meta.size_bytes = data.size();
  meta.path = target.string();
  meta.created_at_ms = wall_clock_ms();

  publish(tmp, meta);
  if (config_.sync_writes) {
    sync_directory();
  }
  return meta;
}

void CheckpointManager::sync_directory() const {
  int dir_fd = ::open(base_path_.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd < 0) {
    std::cerr << "[CheckpointManager] " << errno_message("Cannot open directory", base_path_)
              << std::endl;
    return;
  }
  if (::fsync(dir_fd) != 0) {
    std::cerr << "[CheckpointManager] " << errno_message("Cannot fsync directory", base_path_)
              << std::endl;
  }
  ::close(dir_fd);
}

void CheckpointManager::publish(const fs::path &tmp, const LocalCheckpoint &meta) {
  // rename, index update and evictions under one lock
  std::lock_guard<std::mutex> lock(index_mutex_);

  std::error_code ec;
  fs::rename(tmp, meta.path, ec);
  if (ec) {
    remove_file(tmp);
    throw errors::io_failure("Failed to publish " + meta.path + ": " + ec.message());
  }

  auto entry = std::make_shared<Entry>();
  entry->meta = meta;
  index_[meta.step] = entry;

  std::vector<fs::path> unlink_list;
  enforce_retention_locked(unlink_list);
  for (const auto &path : unlink_list) {
    remove_file(path);
  }
}

void CheckpointManager::enforce_retention_locked(std::vector<fs::path> &unlink_list) {
  while (index_.size() > config_.keep_count) {
    auto oldest = index_.begin();
    auto entry = oldest->second;
    index_.erase(oldest);

    if (entry->readers > 0) {
      entry->evicted = true;
    } else {
      unlink_list.emplace_back(entry->meta.path);
    }
    std::cout << "[CheckpointManager] Evicting " << entry->meta.checkpoint_id << std::endl;
  }
}

std::string CheckpointManager::save(const std::vector<uint8_t> &data, uint64_t step,
                                    uint64_t epoch) {
  return write_file(data, step, epoch).checkpoint_id;
}

std::string CheckpointManager::save_async(std::vector<uint8_t> data, uint64_t step,
                                          uint64_t epoch) {
  writers_->enqueue([this, payload = std::move(data), step, epoch]() {
    try {
      write_file(payload, step, epoch);
    } catch (const std::exception &e) {
      std::cerr << "[CheckpointManager] Async write of step " << step << " failed: " << e.what()
                << std::endl;
      std::lock_guard<std::mutex> lock(failure_mutex_);
      async_failures_.push_back("step " + std::to_string(step) + ": " + e.what());
    }
  });
  return checkpoint_id_for(step);
}

void CheckpointManager::wait_pending() {
  writers_->wait_idle();

  std::vector<std::string> failures;
  {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    failures.swap(async_failures_);
  }
  if (failures.empty()) {
    return;
  }

  std::string message = std::to_string(failures.size()) + " checkpoint write(s) failed";
  for (const auto &failure : failures) {
    message += "; " + failure;
  }
  throw errors::io_failure(message);
}

std::shared_ptr<CheckpointManager::Entry> CheckpointManager::pin(uint64_t step) {
  std::lock_guard<std::mutex> lock(index_mutex_);
  auto it = index_.find(step);
  if (it != index_.end()) {
    ++it->second->readers;
    return it->second;
  }

  // written into the directory by another process
  const fs::path path = path_for(step);
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return nullptr;
  }

  auto entry = std::make_shared<Entry>();
  entry->meta.checkpoint_id = checkpoint_id_for(step);
  entry->meta.step = step;
  entry->meta.path = path.string();
  entry->meta.size_bytes = static_cast<uint64_t>(fs::file_size(path, ec));
  entry->meta.created_at_ms = file_time_ms(path);
  entry->readers = 1;
  index_.emplace(step, entry);

  std::vector<fs::path> unlink_list;
  enforce_retention_locked(unlink_list);
  for (const auto &stale : unlink_list) {
    remove_file(stale);
  }
  return entry;
}

void CheckpointManager::unpin(const std::shared_ptr<Entry> &entry) {
  std::lock_guard<std::mutex> lock(index_mutex_);
  if (--entry->readers > 0 || !entry->evicted) {
    return;
  }
  // re-saved since eviction: the path now holds the newer payload
  if (index_.count(entry->meta.step) > 0) {
    return;
  }
  remove_file(entry->meta.path);
}

std::vector<uint8_t> CheckpointManager::load(uint64_t step) {
  auto entry = pin(step);
  if (!entry) {
    throw errors::not_found("Checkpoint " + checkpoint_id_for(step));
  }

  struct ReadPin {
    CheckpointManager &manager;
    std::shared_ptr<Entry> entry;
    ~ReadPin() { manager.unpin(entry); }
  } read_pin{*this, entry};

  std::ifstream file(entry->meta.path, std::ios::binary | std::ios::ate);
  if (!file) {
    throw errors::io_failure("Failed to open " + entry->meta.path);
  }
  const std::streamsize size = file.tellg();
  if (size < 0) {
    throw errors::io_failure("Failed to size " + entry->meta.path);
  }
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> data(static_cast<size_t>(size));
  if (size > 0 && !file.read(reinterpret_cast<char *>(data.data()), size)) {
    throw errors::io_failure("Failed to read " + entry->meta.path);
  }
  return data;
}

std::vector<uint8_t> CheckpointManager::load(const std::string &checkpoint_id) {
  auto step = parse_step(checkpoint_id);
  if (!step) {
    throw errors::not_found("Checkpoint " + checkpoint_id);
  }
  return load(*step);
}

std::optional<LocalCheckpoint> CheckpointManager::get_by_step(uint64_t step) const {
  std::lock_guard<std::mutex> lock(index_mutex_);
  auto it = index_.find(step);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second->meta;
}

std::optional<LocalCheckpoint> CheckpointManager::latest() const {
  std::lock_guard<std::mutex> lock(index_mutex_);
  if (index_.empty()) {
    return std::nullopt;
  }
  return index_.rbegin()->second->meta;
}

std::vector<LocalCheckpoint> CheckpointManager::all_checkpoints() const {
  std::lock_guard<std::mutex> lock(index_mutex_);
  std::vector<LocalCheckpoint> result;
  result.reserve(index_.size());
  for (const auto &entry : index_) {
    result.push_back(entry.second->meta);
  }
  return result;
}

void CheckpointManager::remove_file(const fs::path &path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    std::cerr << "[CheckpointManager] Failed to remove " << path.string() << ": " << ec.message()
              << std::endl;
  }
}

} // namespace tfleet
