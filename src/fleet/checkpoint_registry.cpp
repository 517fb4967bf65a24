/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "fleet/checkpoint_registry.hpp"
#include "fleet/error.hpp"

#include <algorithm>
#include <iostream>

namespace tfleet {

namespace {

bool newer(const CheckpointRecord &a, const CheckpointRecord &b) {
  if (a.step != b.step) {
    return a.step > b.step;
  }
  return a.timestamp_ms > b.timestamp_ms;
}

} // namespace

CheckpointRegistry::CheckpointRegistry(size_t max_records) : max_records_(max_records) {
  if (max_records_ == 0) {
    throw std::invalid_argument("CheckpointRegistry requires max_records > 0");
  }
}

void CheckpointRegistry::notify_checkpoint(const CheckpointRecord &record) {
  if (record.checkpoint_id.empty()) {
    throw errors::invalid_argument("checkpoint_id must not be empty");
  }
  if (record.worker_id.empty()) {
    throw errors::invalid_argument("worker_id must not be empty");
  }

  std::lock_guard<std::mutex> lock(structure_mutex_);
  {
    RecordMap::accessor acc;
    records_.insert(acc, record.checkpoint_id);
    acc->second = record;
  }
  notifications_.fetch_add(1, std::memory_order_relaxed);

  std::cout << "[CheckpointRegistry] " << record.worker_id << " saved " << record.checkpoint_id
            << " (step " << record.step << ", epoch " << record.epoch << ", "
            << record.size_bytes << " bytes)" << std::endl;

  if (records_.size() > max_records_) {
    prune_locked();
  }
}

void CheckpointRegistry::prune_locked() {
  std::vector<CheckpointRecord> ordered;
  ordered.reserve(records_.size());
  for (const auto &entry : records_) {
    ordered.push_back(entry.second);
  }
  std::sort(ordered.begin(), ordered.end(), newer);
  for (size_t i = max_records_; i < ordered.size(); ++i) {
    records_.erase(ordered[i].checkpoint_id);
  }
}

std::optional<CheckpointRecord> CheckpointRegistry::get(const std::string &checkpoint_id) const {
  RecordMap::const_accessor acc;
  if (!records_.find(acc, checkpoint_id)) {
    return std::nullopt;
  }
  return acc->second;
}

std::optional<CheckpointRecord> CheckpointRegistry::latest() const {
  std::lock_guard<std::mutex> lock(structure_mutex_);
  std::optional<CheckpointRecord> best;
  for (const auto &entry : records_) {
    if (!best || newer(entry.second, *best)) {
      best = entry.second;
    }
  }
  return best;
}

std::optional<CheckpointRecord>
CheckpointRegistry::latest_for_worker(const std::string &worker_id) const {
  std::lock_guard<std::mutex> lock(structure_mutex_);
  std::optional<CheckpointRecord> best;
  for (const auto &entry : records_) {
    if (entry.second.worker_id != worker_id) {
      continue;
    }
    if (!best || newer(entry.second, *best)) {
      best = entry.second;
    }
  }
  return best;
}

std::vector<CheckpointRecord> CheckpointRegistry::all(size_t limit) const {
  std::vector<CheckpointRecord> result;
  {
    std::lock_guard<std::mutex> lock(structure_mutex_);
    result.reserve(records_.size());
    for (const auto &entry : records_) {
      result.push_back(entry.second);
    }
  }
  std::sort(result.begin(), result.end(), newer);
  if (limit > 0 && result.size() > limit) {
    result.resize(limit);
  }
  return result;
}

} // namespace tfleet
